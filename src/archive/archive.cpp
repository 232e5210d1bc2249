#include "lfsget/archive.hpp"
#include "lfsget/cancellation.hpp"
#include "lfsget/platform.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

#include <zlib.h>

namespace fs = std::filesystem;

namespace lfsget {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

namespace {

constexpr size_t TAR_BLOCK_SIZE = 512;
constexpr size_t TAR_NAME_SIZE = 100;
constexpr size_t TAR_MODE_SIZE = 8;
constexpr size_t TAR_SIZE_SIZE = 12;
constexpr size_t TAR_CHKSUM_OFFSET = 148;
constexpr size_t TAR_CHKSUM_SIZE = 8;
constexpr size_t TAR_PREFIX_SIZE = 155;

// Tar type flags
constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_LNKTYPE = '1';
constexpr char TAR_SYMTYPE = '2';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_CONTTYPE = '7';
constexpr char TAR_PAX_HEADER = 'x';
constexpr char TAR_PAX_GLOBAL = 'g';
constexpr char TAR_GNU_LONGNAME = 'L';
constexpr char TAR_GNU_LONGLINK = 'K';

// Metadata records larger than this are treated as corruption
constexpr uint64_t MAX_METADATA_SIZE = 1024 * 1024;

constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// Parse an octal field, or a GNU base-256 field when the high bit is set
uint64_t parse_numeric(const char* data, size_t size) {
    if (static_cast<unsigned char>(data[0]) & 0x80) {
        uint64_t result = static_cast<unsigned char>(data[0]) & 0x7F;
        for (size_t i = 1; i < size; ++i) {
            result = (result << 8) | static_cast<unsigned char>(data[i]);
        }
        return result;
    }

    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

bool is_zero_block(const char* block) {
    return std::all_of(block, block + TAR_BLOCK_SIZE, [](char c) { return c == '\0'; });
}

// Some writers sum signed chars; accept either
bool checksum_valid(const char* block) {
    const auto& header = *reinterpret_cast<const TarHeader*>(block);
    uint64_t stored = parse_numeric(header.chksum, TAR_CHKSUM_SIZE);

    uint32_t unsigned_sum = 0;
    int32_t signed_sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (i >= TAR_CHKSUM_OFFSET && i < TAR_CHKSUM_OFFSET + TAR_CHKSUM_SIZE) {
            unsigned_sum += ' ';
            signed_sum += ' ';
        } else {
            unsigned_sum += static_cast<unsigned char>(block[i]);
            signed_sum += static_cast<signed char>(block[i]);
        }
    }
    return stored == unsigned_sum || static_cast<int64_t>(stored) == signed_sum;
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

EntryType classify(char typeflag) {
    switch (typeflag) {
        case TAR_REGTYPE:
        case TAR_AREGTYPE:
        case TAR_CONTTYPE:
            return EntryType::RegularFile;
        case TAR_DIRTYPE: return EntryType::Directory;
        case TAR_SYMTYPE: return EntryType::Symlink;
        case TAR_LNKTYPE: return EntryType::Hardlink;
        default: return EntryType::Other;
    }
}

// "27 path=some/long/name\n" records; returns false on malformed input
bool parse_pax_records(const std::string& data, std::string& path, std::optional<uint64_t>& size) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) return false;

        uint64_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') return false;
            len = len * 10 + static_cast<uint64_t>(data[i] - '0');
        }
        if (len == 0 || pos + len > data.size() || data[pos + len - 1] != '\n') return false;

        std::string record = data.substr(space + 1, pos + len - space - 2);
        size_t eq = record.find('=');
        if (eq != std::string::npos) {
            std::string key = record.substr(0, eq);
            std::string value = record.substr(eq + 1);
            if (key == "path") {
                path = value;
            } else if (key == "size") {
                uint64_t v = 0;
                for (char c : value) {
                    if (c < '0' || c > '9') return false;
                    v = v * 10 + static_cast<uint64_t>(c - '0');
                }
                size = v;
            }
        }
        pos += len;
    }
    return true;
}

// ============================================================================
// gzip Stream
// ============================================================================

// gzopen passes non-gzip input through unchanged, so the magic is checked
// separately before any tar parsing.
bool has_gzip_magic(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    unsigned char magic[2] = {0, 0};
    if (!file.read(reinterpret_cast<char*>(magic), 2)) return false;
    return magic[0] == 0x1f && magic[1] == 0x8b;
}

// RAII wrapper for gzFile
class GzFile {
public:
    explicit GzFile(const std::string& path) : file_(gzopen(path.c_str(), "rb")) {
        if (file_) gzbuffer(file_, 128 * 1024);
    }
    ~GzFile() { if (file_) gzclose(file_); }

    GzFile(const GzFile&) = delete;
    GzFile& operator=(const GzFile&) = delete;

    explicit operator bool() const { return file_ != nullptr; }

    // Bytes read, short only at end of stream; -1 on a stream error
    long long read(char* buf, size_t len) {
        size_t total = 0;
        while (total < len) {
            unsigned want = static_cast<unsigned>(std::min<size_t>(len - total, 1u << 30));
            int n = gzread(file_, buf + total, want);
            if (n < 0) return -1;
            if (n == 0) break;
            total += static_cast<size_t>(n);
        }
        return static_cast<long long>(total);
    }

    // Input ended inside the compressed stream
    bool truncated() {
        int errnum = Z_OK;
        gzerror(file_, &errnum);
        return errnum == Z_BUF_ERROR;
    }

    std::string error_message() {
        int errnum = Z_OK;
        const char* msg = gzerror(file_, &errnum);
        if (errnum == Z_OK || !msg || !*msg) return "unexpected end of archive";
        return msg;
    }

private:
    gzFile file_;
};

// ============================================================================
// Tar Stream
// ============================================================================

class TarStream {
public:
    enum class Next { Entry, End, Error };

    explicit TarStream(GzFile& gz) : gz_(gz) {}

    // Advance to the next real entry, folding GNU long-name and pax records
    // into it. Unread data of the previous entry is skipped.
    Next next(ContainerEntry& entry) {
        if (!skip_remaining()) return Next::Error;

        std::string override_path;
        std::optional<uint64_t> override_size;

        while (true) {
            char block[TAR_BLOCK_SIZE];
            long long n = gz_.read(block, TAR_BLOCK_SIZE);
            if (n < 0) return fail(gz_.error_message());
            if (n == 0) {
                if (gz_.truncated()) return fail("unexpected end of archive");
                return Next::End;
            }
            if (static_cast<size_t>(n) < TAR_BLOCK_SIZE) return fail("truncated tar header");

            if (is_zero_block(block)) return Next::End;
            if (!checksum_valid(block)) return fail("tar header checksum mismatch");

            const auto& header = *reinterpret_cast<const TarHeader*>(block);
            uint64_t size = parse_numeric(header.size, TAR_SIZE_SIZE);

            if (header.typeflag == TAR_GNU_LONGNAME || header.typeflag == TAR_GNU_LONGLINK ||
                header.typeflag == TAR_PAX_HEADER || header.typeflag == TAR_PAX_GLOBAL) {
                std::string data;
                if (!read_metadata(size, data)) return Next::Error;

                if (header.typeflag == TAR_GNU_LONGNAME) {
                    override_path = field_string(data.data(), data.size());
                } else if (header.typeflag == TAR_PAX_HEADER) {
                    if (!parse_pax_records(data, override_path, override_size)) {
                        return fail("malformed pax header");
                    }
                }
                continue;
            }

            std::string path;
            if (!override_path.empty()) {
                path = override_path;
            } else {
                if (header.prefix[0] != '\0') {
                    path = field_string(header.prefix, TAR_PREFIX_SIZE);
                    path += '/';
                }
                path += field_string(header.name, TAR_NAME_SIZE);
            }
            if (override_size) size = *override_size;

            entry = ContainerEntry{};
            entry.path = path;
            entry.type = classify(header.typeflag);
            entry.mode = static_cast<uint32_t>(parse_numeric(header.mode, TAR_MODE_SIZE));
            entry.size = (entry.type == EntryType::RegularFile) ? size : 0;
            entry.is_nested_container =
                entry.type == EntryType::RegularFile && has_container_extension(path);

            // Directories and links may still carry a size on odd writers
            remaining_ = size;
            padding_ = (TAR_BLOCK_SIZE - size % TAR_BLOCK_SIZE) % TAR_BLOCK_SIZE;
            return Next::Entry;
        }
    }

    // Write the current entry's data to out. Returns false on a read error
    // (see error()) or a write error (write_failed() is set).
    bool copy_data(std::ostream& out) {
        std::vector<char> buffer(COPY_BUFFER_SIZE);
        while (remaining_ > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, buffer.size()));
            long long n = gz_.read(buffer.data(), want);
            if (n < 0) {
                fail(gz_.error_message());
                return false;
            }
            if (static_cast<size_t>(n) < want) {
                fail("truncated entry data");
                return false;
            }
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                write_failed_ = true;
                return false;
            }
            remaining_ -= static_cast<uint64_t>(n);
        }
        return skip_padding();
    }

    const std::string& error() const { return error_; }
    bool write_failed() const { return write_failed_; }

private:
    Next fail(const std::string& message) {
        error_ = message;
        return Next::Error;
    }

    bool discard(uint64_t count) {
        char buffer[TAR_BLOCK_SIZE * 16];
        while (count > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(count, sizeof(buffer)));
            long long n = gz_.read(buffer, want);
            if (n < 0) {
                fail(gz_.error_message());
                return false;
            }
            if (static_cast<size_t>(n) < want) {
                fail("truncated entry data");
                return false;
            }
            count -= static_cast<uint64_t>(n);
        }
        return true;
    }

    bool skip_padding() {
        uint64_t pad = padding_;
        padding_ = 0;
        return discard(pad);
    }

    bool skip_remaining() {
        uint64_t rest = remaining_;
        remaining_ = 0;
        return discard(rest) && skip_padding();
    }

    bool read_metadata(uint64_t size, std::string& data) {
        if (size > MAX_METADATA_SIZE) {
            fail("oversized tar metadata record");
            return false;
        }
        data.resize(static_cast<size_t>(size));
        long long n = gz_.read(data.empty() ? nullptr : &data[0], data.size());
        if (n < 0) {
            fail(gz_.error_message());
            return false;
        }
        if (static_cast<size_t>(n) < data.size()) {
            fail("truncated tar metadata record");
            return false;
        }
        padding_ = (TAR_BLOCK_SIZE - size % TAR_BLOCK_SIZE) % TAR_BLOCK_SIZE;
        return skip_padding();
    }

    GzFile& gz_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
    std::string error_;
    bool write_failed_ = false;
};

// Strip trailing slashes and a leading "./"
std::string clean_entry_path(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    while (path.rfind("./", 0) == 0) {
        path = path.substr(2);
    }
    if (path == ".") path.clear();
    return path;
}

void apply_mode(const std::string& full_path, uint32_t mode) {
    std::error_code ec;
    if ((mode & 0111) != 0) {
        fs::permissions(full_path, fs::perms::owner_all | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec, ec);
    } else {
        fs::permissions(full_path, fs::perms::owner_read | fs::perms::owner_write |
                        fs::perms::group_read | fs::perms::others_read, ec);
    }
}

} // namespace

const char* to_string(EntryType type) {
    switch (type) {
        case EntryType::RegularFile: return "file";
        case EntryType::Directory: return "directory";
        case EntryType::Symlink: return "symlink";
        case EntryType::Hardlink: return "hardlink";
        case EntryType::Other: return "other";
        default: return "unknown";
    }
}

bool has_container_extension(const std::string& name) {
    std::string base = get_filename(clean_entry_path(name));
    std::string ext = CONTAINER_EXTENSION;
    return base.size() > ext.size() &&
           base.compare(base.size() - ext.size(), ext.size(), ext) == 0;
}

std::string strip_container_extension(const std::string& name) {
    if (!has_container_extension(name)) return name;
    return name.substr(0, name.size() - std::strlen(CONTAINER_EXTENSION));
}

bool is_container(const std::string& path) {
    if (!is_regular_file(path) || !has_gzip_magic(path)) return false;

    GzFile gz(path);
    if (!gz) return false;

    char block[TAR_BLOCK_SIZE];
    long long n = gz.read(block, TAR_BLOCK_SIZE);
    if (n != static_cast<long long>(TAR_BLOCK_SIZE)) return false;

    return is_zero_block(block) || checksum_valid(block);
}

PathValidation validate_entry_path(const std::string& entry_path,
                                   const std::string& extraction_root) {
    PathValidation result;

    std::string portable = to_portable_path(entry_path);

    // Reject absolute paths, including drive-qualified ones
    if (!portable.empty() && portable[0] == '/') {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }
    if (portable.size() >= 2 && portable[1] == ':') {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    fs::path normalized;
    for (const auto& component : fs::path(portable)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    if (normalized.empty()) {
        result.error = "empty entry path";
        return result;
    }

    // Existing symlinks under the root could still redirect the write
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(extraction_root, ec);
    if (ec) {
        result.error = "cannot resolve extraction root: " + ec.message();
        return result;
    }
    fs::path canonical_full = fs::weakly_canonical(fs::path(extraction_root) / normalized, ec);
    if (ec) {
        result.error = "cannot resolve entry path: " + ec.message();
        return result;
    }

    auto rel = canonical_full.lexically_relative(canonical_root);
    if (rel.empty() || *rel.begin() == "..") {
        result.error = "path escapes extraction root: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = to_portable_path(normalized.string());
    return result;
}

ListResult list_container(const std::string& container_path) {
    ListResult result;

    if (!path_exists(container_path)) {
        result.error_kind = ErrorKind::NotFound;
        result.error = "container not found: " + container_path;
        return result;
    }
    if (!has_gzip_magic(container_path)) {
        result.error_kind = ErrorKind::ArchiveCorrupt;
        result.error = "not a gzip stream: " + container_path;
        return result;
    }

    GzFile gz(container_path);
    if (!gz) {
        result.error_kind = ErrorKind::FilesystemError;
        result.error = "failed to open container: " + container_path;
        return result;
    }

    TarStream tar(gz);
    ContainerEntry entry;
    while (true) {
        TarStream::Next next = tar.next(entry);
        if (next == TarStream::Next::End) break;
        if (next == TarStream::Next::Error) {
            result.error_kind = ErrorKind::ArchiveCorrupt;
            result.error = tar.error() + ": " + container_path;
            return result;
        }
        entry.path = clean_entry_path(entry.path);
        if (entry.path.empty()) continue;
        result.entries.push_back(entry);
    }

    result.ok = true;
    return result;
}

UnpackResult unpack_container(const std::string& container_path,
                              const std::string& target_dir,
                              const CancellationToken& cancel,
                              const EntryCallback& on_entry) {
    UnpackResult result;

    auto fail = [&result](ErrorKind kind, const std::string& message) {
        result.error_kind = kind;
        result.error = message;
        return result;
    };

    if (!path_exists(container_path)) {
        return fail(ErrorKind::NotFound, "container not found: " + container_path);
    }
    if (!has_gzip_magic(container_path)) {
        return fail(ErrorKind::ArchiveCorrupt, "not a gzip stream: " + container_path);
    }

    GzFile gz(container_path);
    if (!gz) {
        return fail(ErrorKind::FilesystemError, "failed to open container: " + container_path);
    }

    TarStream tar(gz);
    ContainerEntry entry;
    while (true) {
        if (cancel.is_cancelled()) {
            return fail(ErrorKind::Cancelled, "extraction cancelled");
        }

        TarStream::Next next = tar.next(entry);
        if (next == TarStream::Next::End) break;
        if (next == TarStream::Next::Error) {
            return fail(ErrorKind::ArchiveCorrupt, tar.error() + ": " + container_path);
        }

        std::string path = clean_entry_path(entry.path);
        if (path.empty()) continue;

        if (entry.type == EntryType::Symlink || entry.type == EntryType::Hardlink) {
            return fail(ErrorKind::UnsafeEntry, "symlinks and hardlinks not permitted: " + path);
        }
        if (entry.type == EntryType::Other) {
            return fail(ErrorKind::UnsafeEntry, "unsupported entry type: " + path);
        }

        auto validation = validate_entry_path(path, target_dir);
        if (!validation.safe) {
            return fail(ErrorKind::UnsafeEntry, validation.error);
        }
        entry.path = validation.normalized_path;

        std::string full_path = absolute_path(join_path(target_dir, validation.normalized_path));
        std::error_code ec;

        if (entry.type == EntryType::Directory) {
            fs::create_directories(full_path, ec);
            if (ec && !is_directory(full_path)) {
                return fail(ErrorKind::FilesystemError,
                            "failed to create directory: " + full_path + ": " + ec.message());
            }
        } else {
            std::string parent = get_parent_directory(full_path);
            if (!parent.empty()) {
                fs::create_directories(parent, ec);
                if (ec && !is_directory(parent)) {
                    return fail(ErrorKind::FilesystemError,
                                "failed to create parent directory for: " + path);
                }
            }

            std::ofstream file(full_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                return fail(ErrorKind::FilesystemError, "failed to create file: " + full_path);
            }
            if (!tar.copy_data(file)) {
                if (tar.write_failed()) {
                    return fail(ErrorKind::FilesystemError, "failed to write file: " + full_path);
                }
                return fail(ErrorKind::ArchiveCorrupt, tar.error() + ": " + container_path);
            }
            file.close();
            if (file.fail()) {
                return fail(ErrorKind::FilesystemError, "failed to write file: " + full_path);
            }
            apply_mode(full_path, entry.mode);
        }

        result.entries.push_back(entry.path);
        if (on_entry) {
            on_entry(entry, full_path);
        }
    }

    result.ok = true;
    return result;
}

} // namespace lfsget
