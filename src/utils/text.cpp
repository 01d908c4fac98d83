#include "utils/text.hpp"

#include <cstdint>

namespace kalibox::utils {
namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at `pos`, or the number of bytes
// that form the maximal invalid prefix (negated) when it is ill-formed.
int SequenceLength(std::string_view bytes, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80) {
        return 1;
    }
    int expected = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        expected = 2;
    } else if (lead == 0xE0) {
        expected = 3;
        lower = 0xA0;
    } else if (lead >= 0xE1 && lead <= 0xEC) {
        expected = 3;
    } else if (lead == 0xED) {
        expected = 3;
        upper = 0x9F;
    } else if (lead >= 0xEE && lead <= 0xEF) {
        expected = 3;
    } else if (lead == 0xF0) {
        expected = 4;
        lower = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        expected = 4;
    } else if (lead == 0xF4) {
        expected = 4;
        upper = 0x8F;
    } else {
        return -1;
    }

    for (int i = 1; i < expected; ++i) {
        if (pos + i >= bytes.size()) {
            return -i;
        }
        const auto byte = static_cast<unsigned char>(bytes[pos + i]);
        if (i == 1) {
            if (byte < lower || byte > upper) {
                return -1;
            }
        } else if (!IsContinuation(byte)) {
            return -i;
        }
    }
    return expected;
}

}  // namespace

std::string SanitizeUtf8(std::string_view bytes) {
    std::string result;
    result.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const int length = SequenceLength(bytes, pos);
        if (length > 0) {
            result.append(bytes.data() + pos, static_cast<std::size_t>(length));
            pos += static_cast<std::size_t>(length);
        } else {
            result.append(kReplacement);
            pos += static_cast<std::size_t>(-length);
        }
    }
    return result;
}

std::string UrlEncode(std::string_view value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
            || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~'
            || c == '/';
        if (unreserved) {
            encoded.push_back(ch);
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string ShellQuote(std::string_view value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string RedirectOutput(const std::string& command, const std::string& path) {
    return "(" + command + ") > " + ShellQuote(path) + " 2>&1";
}

}  // namespace kalibox::utils
