#include <doctest/doctest.h>
#include <lfsget/cancellation.hpp>
#include <lfsget/logger.hpp>
#include <lfsget/pipeline.hpp>
#include <lfsget/platform.hpp>

#include "../support/fake_http_client.hpp"
#include "../support/recording_logger.hpp"
#include "../support/tar_builder.hpp"
#include "../support/temp_dir.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace lfsget;
using namespace lfsget::testing;

namespace {

const std::string CONTENT_URL = "https://huggingface.co/org/models/resolve/main/bundle.tar.gz";
const std::string POINTER_URL = "https://huggingface.co/org/models/raw/main/bundle.tar.gz";

std::vector<std::uint8_t> noise(std::size_t size, std::uint32_t seed) {
    std::vector<std::uint8_t> data(size);
    std::uint32_t x = seed;
    for (auto& b : data) {
        x = x * 1103515245u + 12345u;
        b = static_cast<std::uint8_t>(x >> 16);
    }
    return data;
}

// Outer container holding one nested container, exactly 10,000 bytes on the wire
std::vector<std::uint8_t> make_bundle() {
    auto inner = make_tar_gz({
        tar_dir("weights"),
        tar_file("weights/layer0.bin", noise(700, 1)),
        tar_file("weights/config.json", "{\"layers\": 1}"),
    });
    auto tar = make_tar({
        tar_file("README.md", "# bundle\n"),
        tar_file("blob.bin", noise(3000, 2)),
        tar_file("models/inner.tar.gz", inner),
    });
    return gzip_to_size(tar, 10000);
}

std::string pointer_for(const std::vector<std::uint8_t>& body) {
    return "version https://git-lfs.github.com/spec/v1\n"
           "oid sha256:" + compute_sha256(body).hex_digest + "\n"
           "size " + std::to_string(body.size()) + "\n";
}

} // namespace

TEST_CASE("Interrupted download is resumed, verified and fully extracted") {
    TempDir tmp;
    auto bundle = make_bundle();
    REQUIRE(bundle.size() == 10000);

    FakeHttpClient client;
    client.serve(CONTENT_URL, bundle);
    client.set_chunk_size(1024);
    client.drop_after(4096);
    client.set_pointer(POINTER_URL, pointer_for(bundle));

    RecordingLogger logger;
    Pipeline pipeline(client, logger, never_cancelled());

    PipelineOptions options;
    options.download.url = CONTENT_URL;
    options.download.destination = tmp.file("downloads/bundle.tar.gz");
    options.download.chunk_size = 1024;
    options.download.max_retries = 3;
    options.download.retry_delay = std::chrono::milliseconds(0);
    options.max_depth = 1;
    options.extract_options.parallelism = 2;

    auto result = pipeline.run(options);

    REQUIRE(result.ok);
    CHECK(result.exit_code() == ExitCode::Success);

    // One retry after the drop, resumed from the byte already on disk
    CHECK(result.download.attempts == 2);
    CHECK(client.stream_calls() == 2);
    REQUIRE(client.ranges_requested()[1].has_value());
    CHECK(*client.ranges_requested()[1] == 4096);
    CHECK(result.download.bytes_on_disk == 10000);
    CHECK(file_size(options.download.destination).value_or(0) == 10000);

    CHECK(result.verification.matches());
    CHECK(logger.contains(LogLevel::Info, "SHA-256 checksum verified successfully."));

    // Outer and inner entries on disk, nested container gone, outer kept
    std::string root = tmp.file("downloads");
    CHECK(read_text(root + "/README.md") == "# bundle\n");
    CHECK(read_bytes(root + "/blob.bin") == noise(3000, 2));
    CHECK(read_bytes(root + "/models/inner/weights/layer0.bin") == noise(700, 1));
    CHECK(read_text(root + "/models/inner/weights/config.json") == "{\"layers\": 1}");
    CHECK_FALSE(path_exists(root + "/models/inner.tar.gz"));
    CHECK(path_exists(options.download.destination));
    CHECK(result.extraction.nested_extracted == 1);
}

TEST_CASE("A second run resumes a cancelled download") {
    TempDir tmp;
    auto bundle = make_bundle();
    REQUIRE(bundle.size() == 10000);

    FakeHttpClient client;
    client.serve(CONTENT_URL, bundle);
    client.set_pointer(POINTER_URL, pointer_for(bundle));

    PipelineOptions options;
    options.download.url = CONTENT_URL;
    options.download.destination = tmp.file("bundle.tar.gz");
    options.download.retry_delay = std::chrono::milliseconds(0);
    options.extract = false;

    CancellationToken token;
    {
        Pipeline first(client, null_logger(), token);
        first.set_download_progress([&token](const TransferState& s) {
            if (s.bytes_on_disk() >= 5120) token.cancel();
        });
        auto interrupted = first.run(options);
        CHECK_FALSE(interrupted.ok);
        CHECK(interrupted.exit_code() == ExitCode::Cancelled);
        CHECK(file_size(options.download.destination).value_or(0) == 5120);
    }

    token.reset();
    Pipeline second(client, null_logger(), token);
    auto resumed = second.run(options);
    REQUIRE(resumed.ok);
    REQUIRE(client.ranges_requested().back().has_value());
    CHECK(*client.ranges_requested().back() == 5120);
    CHECK(read_bytes(options.download.destination) == bundle);
}

TEST_CASE("A completed download is not fetched again") {
    TempDir tmp;
    auto bundle = make_bundle();

    FakeHttpClient client;
    client.serve(CONTENT_URL, bundle);
    client.set_pointer(POINTER_URL, pointer_for(bundle));

    std::string dest = tmp.file("bundle.tar.gz");
    write_bytes(dest, bundle);

    PipelineOptions options;
    options.download.url = CONTENT_URL;
    options.download.destination = dest;
    options.extract_to = tmp.file("out");

    Pipeline pipeline(client, null_logger(), never_cancelled());
    auto result = pipeline.run(options);
    REQUIRE(result.ok);
    CHECK(result.download.status == DownloadStatus::AlreadyComplete);
    CHECK(read_text(tmp.file("out/README.md")) == "# bundle\n");
}

TEST_CASE("Pipeline writes its progress to a log file") {
    TempDir tmp;
    auto bundle = make_bundle();

    FakeHttpClient client;
    client.serve(CONTENT_URL, bundle);
    client.set_pointer(POINTER_URL, pointer_for(bundle));

    std::string dest = tmp.file("bundle.tar.gz");

    LoggerOptions log_options;
    log_options.name = dest;
    log_options.log_to_stream = false;
    log_options.log_dir = tmp.file("logs");
    auto made = make_logger(log_options);
    REQUIRE(made.ok);

    PipelineOptions options;
    options.download.url = CONTENT_URL;
    options.download.destination = dest;
    options.extract = false;

    Pipeline pipeline(client, *made.logger, never_cancelled());
    REQUIRE(pipeline.run(options).ok);
    made.logger->flush();

    std::string log = read_text(made.log_file);
    CHECK(log.find("Download complete!") != std::string::npos);
    CHECK(log.find("SHA-256 checksum verified successfully.") != std::string::npos);
    CHECK(fs::path(made.log_file).filename().string().rfind("bundle.tar.gz-", 0) == 0);
}
