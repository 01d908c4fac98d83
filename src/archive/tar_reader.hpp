#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace kalibox::archive {

class TarError : public std::runtime_error {
public:
    explicit TarError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class EntryType {
    kFile,
    kDirectory,
    kSymlink,
    kOther
};

struct TarEntry {
    std::string name;
    EntryType type = EntryType::kFile;
    std::string data;
};

// Decodes a ustar/pax/GNU tar stream. Metadata records (pax headers, GNU long
// names) are folded into the entry they describe and not returned.
std::vector<TarEntry> ReadTar(std::string_view bytes);

}  // namespace kalibox::archive
