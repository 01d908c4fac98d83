#include "archive/tar_reader.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>

namespace kalibox::archive {
namespace {

constexpr std::size_t kBlockSize = 512;

constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kNameLength = 100;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kSizeLength = 12;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kChecksumLength = 8;
constexpr std::size_t kTypeOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kPrefixOffset = 345;
constexpr std::size_t kPrefixLength = 155;

std::string_view Field(std::string_view block, std::size_t offset, std::size_t length) {
    auto field = block.substr(offset, length);
    const auto nul = field.find('\0');
    if (nul != std::string_view::npos) {
        field = field.substr(0, nul);
    }
    return field;
}

bool IsZeroBlock(std::string_view block) {
    return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
}

std::uint64_t ParseNumber(std::string_view field) {
    if (!field.empty() && (static_cast<unsigned char>(field[0]) & 0x80) != 0) {
        // GNU base-256: big-endian, high bit of the first byte is the marker.
        std::uint64_t value = static_cast<unsigned char>(field[0]) & 0x7F;
        for (std::size_t i = 1; i < field.size(); ++i) {
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        return value;
    }
    std::uint64_t value = 0;
    bool seen_digit = false;
    for (const char c : field) {
        if (c == '\0' || (c == ' ' && seen_digit)) {
            break;
        }
        if (c == ' ') {
            continue;
        }
        if (c < '0' || c > '7') {
            throw TarError("invalid octal field in tar header");
        }
        value = (value << 3) | static_cast<std::uint64_t>(c - '0');
        seen_digit = true;
    }
    return value;
}

void VerifyChecksum(std::string_view block) {
    const auto expected = ParseNumber(block.substr(kChecksumOffset, kChecksumLength));
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        if (i >= kChecksumOffset && i < kChecksumOffset + kChecksumLength) {
            sum += static_cast<unsigned char>(' ');
        } else {
            sum += static_cast<unsigned char>(block[i]);
        }
    }
    if (sum != expected) {
        throw TarError("tar header checksum mismatch");
    }
}

std::string TrimTrailingNul(std::string_view value) {
    const auto end = value.find('\0');
    return std::string(end == std::string_view::npos ? value : value.substr(0, end));
}

// Pax records are "<length> <key>=<value>\n"; only path matters here.
void ApplyPaxRecords(std::string_view records, std::optional<std::string>& path) {
    std::size_t pos = 0;
    while (pos < records.size()) {
        const auto space = records.find(' ', pos);
        if (space == std::string_view::npos) {
            throw TarError("malformed pax record");
        }
        std::size_t length = 0;
        for (std::size_t i = pos; i < space; ++i) {
            const char c = records[i];
            if (c < '0' || c > '9') {
                throw TarError("malformed pax record length");
            }
            length = length * 10 + static_cast<std::size_t>(c - '0');
        }
        if (length == 0 || pos + length > records.size()) {
            throw TarError("pax record overruns header");
        }
        const auto record = records.substr(space + 1, pos + length - space - 1);
        const auto equals = record.find('=');
        if (equals != std::string_view::npos) {
            const auto key = record.substr(0, equals);
            auto value = record.substr(equals + 1);
            if (!value.empty() && value.back() == '\n') {
                value.remove_suffix(1);
            }
            if (key == "path") {
                path = std::string(value);
            }
        }
        pos += length;
    }
}

EntryType ToEntryType(char flag) {
    switch (flag) {
        case '0':
        case '\0':
        case '7':
            return EntryType::kFile;
        case '2':
            return EntryType::kSymlink;
        case '5':
            return EntryType::kDirectory;
        default:
            return EntryType::kOther;
    }
}

}  // namespace

std::vector<TarEntry> ReadTar(std::string_view bytes) {
    std::vector<TarEntry> entries;
    std::optional<std::string> pending_path;
    std::size_t offset = 0;

    while (offset + kBlockSize <= bytes.size()) {
        const auto header = bytes.substr(offset, kBlockSize);
        if (IsZeroBlock(header)) {
            break;
        }
        VerifyChecksum(header);

        const auto size = ParseNumber(header.substr(kSizeOffset, kSizeLength));
        const char type_flag = header[kTypeOffset];
        const auto data_offset = offset + kBlockSize;
        if (size > bytes.size() - data_offset) {
            throw TarError("tar entry data is truncated");
        }
        const auto data = bytes.substr(data_offset, static_cast<std::size_t>(size));
        const auto padded = (size + kBlockSize - 1) / kBlockSize * kBlockSize;
        offset = data_offset + static_cast<std::size_t>(padded);

        if (type_flag == 'x') {
            ApplyPaxRecords(data, pending_path);
            continue;
        }
        if (type_flag == 'g') {
            continue;
        }
        if (type_flag == 'L') {
            pending_path = TrimTrailingNul(data);
            continue;
        }

        TarEntry entry;
        entry.type = ToEntryType(type_flag);
        if (pending_path) {
            entry.name = std::move(*pending_path);
        } else {
            const auto name = Field(header, kNameOffset, kNameLength);
            const bool ustar = header.substr(kMagicOffset, 5) == "ustar";
            const auto prefix = ustar ? Field(header, kPrefixOffset, kPrefixLength) : std::string_view{};
            entry.name = prefix.empty()
                ? std::string(name)
                : std::string(prefix) + "/" + std::string(name);
        }
        if (entry.type == EntryType::kFile) {
            entry.data = std::string(data);
        }
        pending_path.reset();
        entries.push_back(std::move(entry));
    }

    if (offset < bytes.size() && offset + kBlockSize > bytes.size()
        && !IsZeroBlock(bytes.substr(offset))) {
        throw TarError("tar header is truncated");
    }
    return entries;
}

}  // namespace kalibox::archive
