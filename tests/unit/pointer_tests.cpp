#include <doctest/doctest.h>
#include <lfsget/pointer.hpp>

using namespace lfsget;

namespace {

const std::string DIGEST = "4d7a214614ab2935c943f9e0ff69d22eadbb8f32b1258daaa5e2ca24d17e2393";

} // namespace

TEST_CASE("parse_pointer reads a git-lfs pointer") {
    std::string text =
        "version https://git-lfs.github.com/spec/v1\n"
        "oid sha256:" + DIGEST + "\n"
        "size 10000\n";

    auto desc = parse_pointer(text);
    REQUIRE(desc.sha256.has_value());
    CHECK(*desc.sha256 == DIGEST);
    REQUIRE(desc.size.has_value());
    CHECK(*desc.size == 10000);
    CHECK(desc.version == "https://git-lfs.github.com/spec/v1");
    CHECK(desc.error.empty());
}

TEST_CASE("parse_pointer takes only the first oid line") {
    std::string text =
        "oid sha256:" + DIGEST + "\n"
        "oid sha256:0000000000000000000000000000000000000000000000000000000000000000\n";

    auto desc = parse_pointer(text);
    REQUIRE(desc.sha256.has_value());
    CHECK(*desc.sha256 == DIGEST);
}

TEST_CASE("parse_pointer lowercases the digest and tolerates CRLF") {
    std::string upper = "4D7A214614AB2935C943F9E0FF69D22EADBB8F32B1258DAAA5E2CA24D17E2393";
    auto desc = parse_pointer("version x\r\noid sha256:" + upper + "\r\n");
    REQUIRE(desc.sha256.has_value());
    CHECK(*desc.sha256 == DIGEST);
}

TEST_CASE("parse_pointer without an oid line has no hash") {
    auto desc = parse_pointer(std::string("version https://git-lfs.github.com/spec/v1\nsize 12\n"));
    CHECK_FALSE(desc.sha256.has_value());
    CHECK(desc.error.find("oid sha256:") != std::string::npos);
}

TEST_CASE("parse_pointer rejects a non-hex oid token") {
    auto desc = parse_pointer(std::string("oid sha256:not-a-digest\n"));
    CHECK_FALSE(desc.sha256.has_value());
    CHECK_FALSE(desc.error.empty());
}

TEST_CASE("parse_pointer requires a full-length digest") {
    auto short_token = parse_pointer(std::string("oid sha256:abcdef0123\n"));
    CHECK_FALSE(short_token.sha256.has_value());
    CHECK(short_token.error.find("64-digit") != std::string::npos);

    auto long_token = parse_pointer("oid sha256:" + DIGEST + "00\n");
    CHECK_FALSE(long_token.sha256.has_value());
}

TEST_CASE("parse_pointer only accepts an oid line at the start of a line") {
    auto indented = parse_pointer("  oid sha256:" + DIGEST + "\n");
    CHECK_FALSE(indented.sha256.has_value());
    CHECK(indented.error.find("no 'oid sha256:' line") != std::string::npos);

    // An indented decoy does not shadow the real line that follows
    auto text = "\toid sha256:0000000000000000000000000000000000000000000000000000000000000000\n"
                "oid sha256:" + DIGEST + "\n";
    auto desc = parse_pointer(text);
    REQUIRE(desc.sha256.has_value());
    CHECK(*desc.sha256 == DIGEST);
}

TEST_CASE("parse_pointer ignores other hash algorithms") {
    auto desc = parse_pointer(std::string("oid sha1:da39a3ee5e6b4b0d3255bfef95601890afd80709\n"));
    CHECK_FALSE(desc.sha256.has_value());
}

TEST_CASE("parse_pointer accepts raw bytes") {
    std::string text = "oid sha256:" + DIGEST + "\n";
    std::vector<std::uint8_t> bytes(text.begin(), text.end());
    auto desc = parse_pointer(bytes);
    REQUIRE(desc.sha256.has_value());
    CHECK(*desc.sha256 == DIGEST);
}

TEST_CASE("parse_pointer of empty input has no hash") {
    auto desc = parse_pointer(std::string());
    CHECK_FALSE(desc.sha256.has_value());
    CHECK_FALSE(desc.size.has_value());
}

TEST_CASE("derive_pointer_url swaps resolve for raw and drops the query") {
    CHECK(derive_pointer_url("https://huggingface.co/org/repo/resolve/main/model.tar.gz?download=true") ==
          "https://huggingface.co/org/repo/raw/main/model.tar.gz");
}

TEST_CASE("derive_pointer_url replaces only the first resolve segment") {
    CHECK(derive_pointer_url("https://host/a/resolve/main/resolve/file") ==
          "https://host/a/raw/main/resolve/file");
}

TEST_CASE("derive_pointer_url leaves host names and partial segments alone") {
    CHECK(derive_pointer_url("https://resolve.example.com/x/resolver/file") ==
          "https://resolve.example.com/x/resolver/file");
    CHECK(derive_pointer_url("https://host/x/file#frag") == "https://host/x/file");
}

TEST_CASE("is_hex_string") {
    CHECK(is_hex_string("0123456789abcdefABCDEF"));
    CHECK_FALSE(is_hex_string(""));
    CHECK_FALSE(is_hex_string("xyz"));
}
