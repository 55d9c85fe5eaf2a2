#include "utils/byte_tools.hpp"

#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

#include <openssl/sha.h>

std::string utils::CalculateSHA256(std::string_view msg) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(msg.data()), msg.size(), hash);

    return std::string(reinterpret_cast<char*>(hash), SHA256_DIGEST_LENGTH);
}

std::string utils::HexEncode(std::string_view input) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    for (unsigned char c : input) {
        ss << std::setw(2) << static_cast<int>(c);
    }
    return ss.str();
}

std::string utils::ToLower(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string_view utils::Trim(std::string_view text) {
    const char* kWhitespace = " \t\r\n";
    size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

bool utils::IsValidUtf8(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);

        size_t continuation;
        uint32_t code_point;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + continuation >= bytes.size()) {
            return false;
        }

        for (size_t k = 1; k <= continuation; ++k) {
            unsigned char next = static_cast<unsigned char>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // overlong encodings, surrogates, out of range
        static constexpr uint32_t kMinForLength[] = { 0, 0x80, 0x800, 0x10000 };
        if (code_point < kMinForLength[continuation] ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += continuation + 1;
    }
    return true;
}

std::optional<uint64_t> utils::ParseUnsigned(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string utils::FormatBytes(uint64_t bytes) {
    const std::vector<std::string> units = { "B", "KB", "MB", "GB", "TB" };
    size_t unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}
