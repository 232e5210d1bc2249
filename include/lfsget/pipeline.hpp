#pragma once

#include "lfsget/downloader.hpp"
#include "lfsget/extractor.hpp"
#include "lfsget/types.hpp"
#include "lfsget/verifier.hpp"

#include <functional>
#include <string>
#include <utility>

namespace lfsget {

class CancellationToken;
class HttpClient;
class Logger;

// ============================================================================
// Fetch Pipeline: download -> verify -> extract
// ============================================================================
//
//   Idle -> Downloading -> Verifying -> Extracting -> Done
//                |             |            |
//                +-------------+------------+--> Failed
//
// Extraction never starts unless the digest matched.

struct PipelineOptions {
    DownloadTask download;
    std::string pointer_url;            // empty: derived from download.url
    std::chrono::seconds pointer_timeout = DEFAULT_POINTER_TIMEOUT;
    bool extract = true;
    std::string extract_to;             // empty: destination's directory
    int max_depth = DEFAULT_MAX_DEPTH;
    ExtractOptions extract_options;
};

using StageCallback = std::function<void(PipelineStage from, PipelineStage to)>;

struct PipelineResult {
    bool ok = false;
    PipelineStage final_stage = PipelineStage::Idle;
    PipelineStage failed_stage = PipelineStage::Idle;   // set when final_stage == Failed
    ErrorKind error_kind = ErrorKind::None;
    std::string error;                                  // "<stage> failed for <subject>: <cause>"

    DownloadResult download;
    VerifyResult verification;
    ExtractResult extraction;
    bool extraction_ran = false;

    ExitCode exit_code() const;
};

class Pipeline {
public:
    Pipeline(HttpClient& client, Logger& logger, const CancellationToken& cancel);

    void set_stage_callback(StageCallback callback) { on_stage_ = std::move(callback); }
    void set_download_progress(DownloadProgress progress) { download_progress_ = std::move(progress); }

    PipelineResult run(const PipelineOptions& options);

    PipelineStage stage() const { return stage_; }

private:
    void transition(PipelineStage to);
    PipelineResult fail(PipelineResult result, ErrorKind kind, const std::string& error);

    HttpClient& client_;
    Logger& logger_;
    const CancellationToken& cancel_;
    PipelineStage stage_ = PipelineStage::Idle;
    StageCallback on_stage_;
    DownloadProgress download_progress_;
};

} // namespace lfsget
