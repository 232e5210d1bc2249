#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lfsget {

// ============================================================================
// Pointer Descriptor (git-lfs style)
// ============================================================================
//
//   version https://git-lfs.github.com/spec/v1
//   oid sha256:4d7a2146...
//   size 10000
//
// Only the first line starting with "oid sha256:" is authoritative.

constexpr const char* POINTER_OID_PREFIX = "oid sha256:";
constexpr std::size_t SHA256_HEX_LENGTH = 64;

struct PointerDescriptor {
    std::optional<std::string> sha256;      // lowercase hex, absent if no oid line
    std::optional<std::uint64_t> size;      // from "size <n>", diagnostic only
    std::string version;                    // from "version <url>"
    std::string error;                      // why sha256 is absent, if it is
};

PointerDescriptor parse_pointer(const std::string& text);
PointerDescriptor parse_pointer(const std::vector<std::uint8_t>& bytes);

// Derive the pointer URL from a content URL: the first "resolve" path segment
// becomes "raw" and any query string or fragment is dropped.
//   https://host/org/repo/resolve/main/a.tar.gz?download=true
//   -> https://host/org/repo/raw/main/a.tar.gz
std::string derive_pointer_url(const std::string& content_url);

// True if s is non-empty and made only of hex digits
bool is_hex_string(const std::string& s);

} // namespace lfsget
