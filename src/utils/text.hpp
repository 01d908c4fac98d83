#pragma once

#include <string>
#include <string_view>

namespace kalibox::utils {

// Returns valid UTF-8. Every maximal invalid subsequence becomes U+FFFD.
std::string SanitizeUtf8(std::string_view bytes);

std::string UrlEncode(std::string_view value);

// POSIX sh single-quoting: 'it'\''s' for it's.
std::string ShellQuote(std::string_view value);

// "(command) > 'path' 2>&1": stdout and stderr of a compound command into one file.
std::string RedirectOutput(const std::string& command, const std::string& path);

}  // namespace kalibox::utils
