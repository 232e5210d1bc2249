#pragma once

#include "lfsget/types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace lfsget {

class CancellationToken;

// ============================================================================
// Container Format: gzip-compressed POSIX tar
// ============================================================================

constexpr const char* CONTAINER_EXTENSION = ".tar.gz";

enum class EntryType {
    RegularFile,
    Directory,
    Symlink,    // NOT permitted - detection only
    Hardlink,   // NOT permitted - detection only
    Other       // NOT permitted - detection only
};

const char* to_string(EntryType type);

struct ContainerEntry {
    std::string path;                   // relative path within the container
    EntryType type = EntryType::RegularFile;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;
    // Named like a container. Listing cannot probe contents, so extraction
    // confirms with is_container() on the extracted file.
    bool is_nested_container = false;
};

// True if name ends with CONTAINER_EXTENSION and has a non-empty stem
bool has_container_extension(const std::string& name);

// "data/inner.tar.gz" -> "data/inner"; names without the extension unchanged
std::string strip_container_extension(const std::string& name);

// Validity probe: gzip magic, a decompressible first block and a tar header
// with a correct checksum (or an empty archive's zero block).
bool is_container(const std::string& path);

// ============================================================================
// Entry Path Safety
// ============================================================================
//
//   - Reject absolute paths
//   - Reject paths with .. or escaping extraction root
//   - Strip "." segments and leading "./"

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;  // Normalized relative path
};

PathValidation validate_entry_path(const std::string& entry_path,
                                   const std::string& extraction_root);

// ============================================================================
// Listing and Single-Level Unpacking
// ============================================================================

struct ListResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ContainerEntry> entries;
};

// Enumerate entries without writing anything
ListResult list_container(const std::string& container_path);

// Called after each entry is materialized on disk. full_path is the absolute
// location of the entry under the target directory.
using EntryCallback = std::function<void(const ContainerEntry& entry, const std::string& full_path)>;

struct UnpackResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<std::string> entries;  // Paths of extracted entries
};

// Stream one container into target_dir (which must exist). Nested containers
// are written as plain files; recursion is the extractor's job. Entries
// written before a failure stay on disk.
UnpackResult unpack_container(const std::string& container_path,
                              const std::string& target_dir,
                              const CancellationToken& cancel,
                              const EntryCallback& on_entry = nullptr);

} // namespace lfsget
