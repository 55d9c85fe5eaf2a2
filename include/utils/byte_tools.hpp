#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace utils {
    std::string CalculateSHA256(std::string_view msg);
    std::string HexEncode(std::string_view input);
    std::string ToLower(std::string_view text);
    std::string_view Trim(std::string_view text);
    bool IsValidUtf8(std::string_view bytes);
    std::optional<uint64_t> ParseUnsigned(std::string_view text);
    std::string FormatBytes(uint64_t bytes);
}
