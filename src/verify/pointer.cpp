#include "lfsget/pointer.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace lfsget {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::optional<std::uint64_t> parse_u64(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : s) {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

bool is_hex_string(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

PointerDescriptor parse_pointer(const std::string& text) {
    PointerDescriptor desc;

    std::istringstream stream(text);
    std::string raw_line;
    bool oid_seen = false;

    while (std::getline(stream, raw_line)) {
        // Keys must start the line; only a CRLF ending is forgiven
        std::string line = raw_line;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (starts_with(line, POINTER_OID_PREFIX)) {
            // Later oid lines are ignored
            if (oid_seen) continue;
            oid_seen = true;

            std::string token = trim(line.substr(std::strlen(POINTER_OID_PREFIX)));
            if (token.size() == SHA256_HEX_LENGTH && is_hex_string(token)) {
                desc.sha256 = to_lower(token);
            } else {
                desc.error = "oid line does not carry a 64-digit hex digest";
            }
        } else if (starts_with(line, "size ")) {
            if (!desc.size) {
                desc.size = parse_u64(trim(line.substr(5)));
            }
        } else if (starts_with(line, "version ")) {
            if (desc.version.empty()) {
                desc.version = trim(line.substr(8));
            }
        }
    }

    if (!oid_seen) {
        desc.error = std::string("no '") + POINTER_OID_PREFIX + "' line in pointer";
    }
    return desc;
}

PointerDescriptor parse_pointer(const std::vector<std::uint8_t>& bytes) {
    return parse_pointer(std::string(bytes.begin(), bytes.end()));
}

std::string derive_pointer_url(const std::string& content_url) {
    std::string url = content_url;

    size_t cut = url.find_first_of("?#");
    if (cut != std::string::npos) {
        url.erase(cut);
    }

    // Only path segments count; skip past "scheme://host"
    size_t path_start = 0;
    size_t scheme = url.find("://");
    if (scheme != std::string::npos) {
        path_start = url.find('/', scheme + 3);
        if (path_start == std::string::npos) return url;
    }

    size_t pos = path_start;
    while ((pos = url.find("/resolve", pos)) != std::string::npos) {
        size_t after = pos + 8;
        if (after == url.size() || url[after] == '/') {
            url.replace(pos + 1, 7, "raw");
            break;
        }
        pos = after;
    }
    return url;
}

} // namespace lfsget
