#include <doctest/doctest.h>
#include <lfsget/cancellation.hpp>
#include <lfsget/platform.hpp>

#include "../support/recording_logger.hpp"
#include "../support/temp_dir.hpp"

#include <chrono>
#include <fstream>
#include <thread>

using namespace lfsget;
using lfsget::testing::RecordingLogger;
using lfsget::testing::TempDir;

TEST_CASE("ensure_directory creates then reports existing") {
    TempDir tmp;
    RecordingLogger logger;
    std::string dir = tmp.file("a/b/c");

    auto first = ensure_directory(dir, true, logger);
    REQUIRE(first.ok);
    CHECK(first.created);
    CHECK(is_directory(dir));

    auto second = ensure_directory(dir, true, logger);
    REQUIRE(second.ok);
    CHECK_FALSE(second.created);
    CHECK(logger.contains(LogLevel::Debug, "already exists"));
}

TEST_CASE("ensure_directory with a file path creates its parent") {
    TempDir tmp;
    std::string file = tmp.file("downloads/model.tar.gz");

    auto result = ensure_directory(file, false, null_logger());
    REQUIRE(result.ok);
    CHECK(result.created);
    CHECK(is_directory(tmp.file("downloads")));
    CHECK_FALSE(path_exists(file));
}

TEST_CASE("ensure_directory fails when a file blocks the path") {
    TempDir tmp;
    std::string blocker = tmp.file("blocker");
    { std::ofstream(blocker) << "x"; }

    RecordingLogger logger;
    auto result = ensure_directory(blocker + "/sub", true, logger);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
    CHECK(logger.contains(LogLevel::Error, "Error while creating directory"));
}

TEST_CASE("file_size reports regular files only") {
    TempDir tmp;
    std::string file = tmp.file("data.bin");
    { std::ofstream(file, std::ios::binary) << "12345"; }

    REQUIRE(file_size(file).has_value());
    CHECK(*file_size(file) == 5);
    CHECK_FALSE(file_size(tmp.path()).has_value());
    CHECK_FALSE(file_size(tmp.file("missing")).has_value());
}

TEST_CASE("get_file_timestamp is safe for file names") {
    std::string ts = get_file_timestamp();
    CHECK(ts.size() == 19);
    CHECK(ts[10] == 'T');
    CHECK(ts.find(':') == std::string::npos);
}

TEST_CASE("join_path produces portable separators") {
    CHECK(join_path("/tmp/x", "a/b") == "/tmp/x/a/b");
    CHECK(to_portable_path("a\\b\\c") == "a/b/c");
}

TEST_CASE("CancellationToken sleep_for completes when not cancelled") {
    CancellationToken token;
    CHECK(token.sleep_for(std::chrono::milliseconds(20)));
    CHECK_FALSE(token.is_cancelled());
}

TEST_CASE("CancellationToken cuts a long sleep short") {
    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    bool completed = token.sleep_for(std::chrono::seconds(30));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    CHECK_FALSE(completed);
    CHECK(elapsed < std::chrono::seconds(5));

    token.reset();
    CHECK_FALSE(token.is_cancelled());
}

TEST_CASE("never_cancelled stays clear") {
    CHECK_FALSE(never_cancelled().is_cancelled());
}
