#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace codeact::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline std::string EncodeBase64(const std::string& data) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i < data.size()) {
        const std::size_t start = i;
        const unsigned int octet_a = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_b = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_c = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;

        const unsigned int triple = (octet_a << 16) + (octet_b << 8) + octet_c;
        encoded.push_back(table[(triple >> 18) & 0x3F]);
        encoded.push_back(table[(triple >> 12) & 0x3F]);
        encoded.push_back(start + 1 < data.size() ? table[(triple >> 6) & 0x3F] : '=');
        encoded.push_back(start + 2 < data.size() ? table[triple & 0x3F] : '=');
    }
    return encoded;
}

inline void AppendUtf8(std::string& out, std::uint32_t code) {
    if (code < 0x80) {
        out.push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

// Byte length of the UTF-8 sequence introduced by `lead`. Stray
// continuation bytes count as one character.
inline std::size_t Utf8SequenceLength(unsigned char lead) {
    if (lead >= 0xF0) {
        return 4;
    }
    if (lead >= 0xE0) {
        return 3;
    }
    if (lead >= 0xC0) {
        return 2;
    }
    return 1;
}

// Splits UTF-8 text into one string per code point.
inline std::vector<std::string> SplitCodePoints(const std::string& text) {
    std::vector<std::string> points;
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t length = Utf8SequenceLength(static_cast<unsigned char>(text[i]));
        points.push_back(text.substr(i, length));
        i += length;
    }
    return points;
}

inline std::size_t CodePointCount(const std::string& text) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        i += Utf8SequenceLength(static_cast<unsigned char>(text[i]));
        ++count;
    }
    return count;
}

}  // namespace codeact::utils
