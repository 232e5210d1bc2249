#include <doctest/doctest.h>
#include <lfsget/cancellation.hpp>
#include <lfsget/verifier.hpp>

#include "../support/fake_http_client.hpp"
#include "../support/recording_logger.hpp"
#include "../support/tar_builder.hpp"
#include "../support/temp_dir.hpp"

#include <cctype>

using namespace lfsget;
using namespace lfsget::testing;

namespace {

const std::string HELLO_SHA256 = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";
const std::string EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string POINTER_URL = "https://host/org/repo/raw/main/hello.txt";

std::string pointer_for(const std::string& digest, std::uint64_t size) {
    return "version https://git-lfs.github.com/spec/v1\n"
           "oid sha256:" + digest + "\n"
           "size " + std::to_string(size) + "\n";
}

} // namespace

TEST_CASE("compute_sha256 computes correct hash for known data") {
    std::string text = "hello world";
    auto result = compute_sha256(std::vector<std::uint8_t>(text.begin(), text.end()));
    REQUIRE(result.ok);
    CHECK(result.hex_digest == HELLO_SHA256);
    CHECK(result.bytes_hashed == 11);
}

TEST_CASE("compute_sha256 computes correct hash for empty data") {
    auto result = compute_sha256(std::vector<std::uint8_t>{});
    REQUIRE(result.ok);
    CHECK(result.hex_digest == EMPTY_SHA256);
}

TEST_CASE("compute_sha256_file streams files larger than one block") {
    TempDir tmp;
    std::string path = tmp.file("big.bin");
    std::vector<std::uint8_t> data(100000);
    for (std::size_t i = 0; i < data.size(); ++i) data[i] = static_cast<std::uint8_t>(i * 31);
    write_bytes(path, data);

    auto from_file = compute_sha256_file(path, never_cancelled());
    auto from_memory = compute_sha256(data);
    REQUIRE(from_file.ok);
    CHECK(from_file.hex_digest == from_memory.hex_digest);
    CHECK(from_file.bytes_hashed == data.size());
}

TEST_CASE("compute_sha256_file from nonexistent file fails") {
    auto result = compute_sha256_file("/nonexistent/lfsget/file", never_cancelled());
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("failed to open") != std::string::npos);
}

TEST_CASE("digests_match requires an expected hash") {
    CHECK(digests_match(HELLO_SHA256, HELLO_SHA256));
    CHECK_FALSE(digests_match(HELLO_SHA256, std::nullopt));
    CHECK_FALSE(digests_match(HELLO_SHA256, EMPTY_SHA256));
    CHECK_FALSE(digests_match("", std::optional<std::string>("")));
}

TEST_CASE("verify matches a file against its pointer") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world");

    FakeHttpClient client;
    client.set_pointer(POINTER_URL, pointer_for(HELLO_SHA256, 11));
    RecordingLogger logger;

    auto result = verify(path, POINTER_URL, client, logger, never_cancelled());
    CHECK(result.matches());
    CHECK(result.status == VerifyStatus::Match);
    CHECK(result.computed_sha256 == HELLO_SHA256);
    REQUIRE(result.expected_size.has_value());
    CHECK(*result.expected_size == 11);
    CHECK(logger.contains(LogLevel::Info, "SHA-256 checksum verified successfully."));
}

TEST_CASE("verify accepts an uppercase digest in the pointer") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world");

    std::string upper = HELLO_SHA256;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    FakeHttpClient client;
    client.set_pointer(POINTER_URL, pointer_for(upper, 11));

    auto result = verify(path, POINTER_URL, client, null_logger(), never_cancelled());
    CHECK(result.matches());
}

TEST_CASE("verify reports a mismatch") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world!");

    FakeHttpClient client;
    client.set_pointer(POINTER_URL, pointer_for(HELLO_SHA256, 11));
    RecordingLogger logger;

    auto result = verify(path, POINTER_URL, client, logger, never_cancelled());
    CHECK_FALSE(result.matches());
    CHECK(result.status == VerifyStatus::Mismatch);
    CHECK(result.error_kind == ErrorKind::IntegrityMismatch);
    CHECK(logger.contains(LogLevel::Error, "SHA-256 checksum verification failed."));
    CHECK(logger.contains(LogLevel::Warn, "declares 11 bytes"));
}

TEST_CASE("verify without an oid line never matches") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world");

    FakeHttpClient client;
    client.set_pointer(POINTER_URL, "version https://git-lfs.github.com/spec/v1\nsize 11\n");

    auto result = verify(path, POINTER_URL, client, null_logger(), never_cancelled());
    CHECK_FALSE(result.matches());
    CHECK(result.status == VerifyStatus::MissingExpectedHash);
    CHECK(result.error_kind == ErrorKind::IntegrityMismatch);
    CHECK_FALSE(result.expected_sha256.has_value());
}

TEST_CASE("verify propagates pointer fetch failures without retrying") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world");

    SUBCASE("not found") {
        FakeHttpClient client;
        auto result = verify(path, POINTER_URL, client, null_logger(), never_cancelled());
        CHECK(result.status == VerifyStatus::PointerFetchError);
        CHECK(result.error_kind == ErrorKind::PointerFetchError);
        CHECK(result.error.find("HTTP 404") != std::string::npos);
        CHECK(client.fetch_calls() == 1);
    }

    SUBCASE("timeout") {
        FakeHttpClient client;
        client.fail_pointer_fetch(true);
        auto result = verify(path, POINTER_URL, client, null_logger(), never_cancelled());
        CHECK(result.status == VerifyStatus::PointerFetchError);
        CHECK(result.error.find("timed out") != std::string::npos);
        CHECK(client.fetch_calls() == 1);
    }
}

TEST_CASE("verify reports an unreadable file before fetching the pointer") {
    FakeHttpClient client;
    client.set_pointer(POINTER_URL, pointer_for(HELLO_SHA256, 11));

    auto result = verify("/nonexistent/lfsget/file", POINTER_URL, client, null_logger(),
                         never_cancelled());
    CHECK(result.status == VerifyStatus::FileError);
    CHECK(result.error_kind == ErrorKind::FilesystemError);
    CHECK(client.fetch_calls() == 0);
}

TEST_CASE("verify refuses a pointer fetch without a time limit") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world");

    FakeHttpClient client;
    client.set_pointer(POINTER_URL, pointer_for(HELLO_SHA256, 11));

    auto result = verify(path, POINTER_URL, client, null_logger(), never_cancelled(),
                         std::chrono::seconds(0));
    CHECK(result.status == VerifyStatus::PointerFetchError);
    CHECK(result.error == "pointer timeout must be greater than 0");
    CHECK(client.fetch_calls() == 0);
}

TEST_CASE("verify honors cancellation") {
    TempDir tmp;
    std::string path = tmp.file("hello.txt");
    write_text(path, "hello world");

    FakeHttpClient client;
    client.set_pointer(POINTER_URL, pointer_for(HELLO_SHA256, 11));
    CancellationToken token;
    token.cancel();

    auto result = verify(path, POINTER_URL, client, null_logger(), token);
    CHECK(result.status == VerifyStatus::Cancelled);
    CHECK(result.error_kind == ErrorKind::Cancelled);
}
