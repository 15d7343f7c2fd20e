#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace JsonDemux
{
    /**
     * Escapes control characters and bytes outside of printable ASCII as \xHH so that arbitrary
     * stream content can be written to a log line. Input longer than maxLength is cut and marked with "...".
     */
    std::string makePrintableString(std::string_view input, std::size_t maxLength = 200);
}
