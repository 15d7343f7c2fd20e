#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace JsonDemux
{
    /**
     * Byte counter that prints itself in human readable units, e.g. "12.00 KB".
     */
    class MemoryUnit
    {
      public:
        constexpr MemoryUnit()
            : bytes_(0)
        {}
        template <typename IntegralType>
        constexpr MemoryUnit(IntegralType bytes)
            : bytes_(bytes)
        {}

        friend std::ostream& operator<<(std::ostream& os, const MemoryUnit& mu)
        {
            static const char* suffixes[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
            if (mu.bytes_ < 1024)
            {
                os << static_cast<std::uint64_t>(mu.bytes_) << " " << suffixes[0];
                return os;
            }

            // scaled in hundredths to keep two decimals without floating point
            boost::multiprecision::uint128_t scaled = mu.bytes_ * 100;
            int suffixIndex = 0;
            while (scaled >= 1024 * 100 && suffixIndex < 6)
            {
                scaled /= 1024;
                ++suffixIndex;
            }

            const auto whole = static_cast<std::uint64_t>(scaled / 100);
            const auto hundredths = static_cast<unsigned>(scaled % 100);
            const auto fill = os.fill('0');
            os << whole << "." << std::setw(2) << hundredths << " " << suffixes[suffixIndex];
            os.fill(fill);
            return os;
        }

        std::string toString() const
        {
            std::stringstream ss;
            ss << *this;
            return ss.str();
        }

        std::uint64_t bytes() const
        {
            return static_cast<std::uint64_t>(bytes_);
        }

        template <typename IntegralType>
        MemoryUnit& operator+=(IntegralType bytes)
        {
            bytes_ += bytes;
            return *this;
        }

        friend bool operator==(MemoryUnit const& lhs, MemoryUnit const& rhs)
        {
            return lhs.bytes_ == rhs.bytes_;
        }

      private:
        boost::multiprecision::uint128_t bytes_;
    };

    constexpr MemoryUnit operator"" _B(unsigned long long bytes)
    {
        return MemoryUnit(bytes);
    }

    constexpr MemoryUnit operator"" _KB(unsigned long long kilobytes)
    {
        return MemoryUnit(kilobytes * 1024);
    }

    constexpr MemoryUnit operator"" _MB(unsigned long long megabytes)
    {
        return MemoryUnit(megabytes * 1024 * 1024);
    }
}
