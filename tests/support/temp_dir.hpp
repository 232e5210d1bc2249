#pragma once

#include <lfsget/platform.hpp>

#include <filesystem>
#include <string>

namespace lfsget::testing {

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("lfsget_test_" + generate_uuid());
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

private:
    std::filesystem::path path_;
};

} // namespace lfsget::testing
