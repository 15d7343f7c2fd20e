#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

using json = nlohmann::json;

namespace nlohmann
{
    template <class T>
    void to_json(nlohmann::json& j, const std::optional<T>& v)
    {
        if (v.has_value())
            j = *v;
        else
            j = nullptr;
    }

    template <class T>
    void from_json(const nlohmann::json& j, std::optional<T>& v)
    {
        if (j.is_null())
            v = std::nullopt;
        else
            v = j.get<T>();
    }
} // namespace nlohmann

namespace JsonDemux
{
    /**
     * Parses text without throwing. Returns std::nullopt for anything that is not a complete json document.
     */
    inline std::optional<json> tryParseJson(std::string_view text)
    {
        auto parsed = json::parse(text.begin(), text.end(), nullptr, false);
        if (parsed.is_discarded())
            return std::nullopt;
        return parsed;
    }

    /**
     * Reads an optional member, falls back to the given default if absent or null.
     */
    template <typename T>
    T valueOr(json const& j, char const* key, T fallback)
    {
        const auto iter = j.find(key);
        if (iter == j.end() || iter->is_null())
            return fallback;
        return iter->template get<T>();
    }
}
