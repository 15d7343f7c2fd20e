#include <sharedpp/printable_string.hpp>

#include <algorithm>
#include <cctype>

namespace JsonDemux
{
    std::string makePrintableString(std::string_view input, std::size_t maxLength)
    {
        const auto shown = input.substr(0, std::min(input.size(), maxLength));

        std::string result;
        result.reserve(shown.size() + 3);
        std::for_each(shown.begin(), shown.end(), [&result](char c) {
            const auto byte = static_cast<unsigned char>(c);
            if (byte < 0x80 && (std::isprint(byte) || byte == ' '))
                result.push_back(c);
            else
            {
                constexpr auto hexDigits = "0123456789ABCDEF";

                result.push_back('\\');
                result.push_back('x');
                result.push_back(hexDigits[byte >> 4]);
                result.push_back(hexDigits[byte & 0xF]);
            }
        });
        if (shown.size() < input.size())
            result += "...";
        return result;
    }
}
