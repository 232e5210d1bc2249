#include "lfsget/pipeline.hpp"
#include "lfsget/archive.hpp"
#include "lfsget/logger.hpp"
#include "lfsget/platform.hpp"
#include "lfsget/pointer.hpp"

#include <utility>

namespace lfsget {

ExitCode PipelineResult::exit_code() const {
    if (ok) return ExitCode::Success;
    if (error_kind == ErrorKind::Cancelled) return ExitCode::Cancelled;

    switch (failed_stage) {
        case PipelineStage::Downloading: return ExitCode::DownloadFailed;
        case PipelineStage::Verifying: return ExitCode::IntegrityFailed;
        case PipelineStage::Extracting: return ExitCode::ExtractionFailed;
        default: return ExitCode::UsageError;
    }
}

Pipeline::Pipeline(HttpClient& client, Logger& logger, const CancellationToken& cancel)
    : client_(client), logger_(logger), cancel_(cancel) {}

void Pipeline::transition(PipelineStage to) {
    PipelineStage from = stage_;
    stage_ = to;
    logger_.debug("Stage: {} -> {}", to_string(from), to_string(to));
    if (on_stage_) {
        on_stage_(from, to);
    }
}

PipelineResult Pipeline::fail(PipelineResult result, ErrorKind kind, const std::string& error) {
    result.ok = false;
    result.failed_stage = stage_;
    result.error_kind = kind;
    result.error = error;
    transition(PipelineStage::Failed);
    result.final_stage = PipelineStage::Failed;
    logger_.error("{}", error);
    return result;
}

PipelineResult Pipeline::run(const PipelineOptions& options) {
    PipelineResult result;
    stage_ = PipelineStage::Idle;

    const std::string& url = options.download.url;
    const std::string& destination = options.download.destination;

    // Download
    transition(PipelineStage::Downloading);
    result.download = download(options.download, client_, logger_, cancel_, download_progress_);
    if (!result.download.ok) {
        ErrorKind kind = result.download.error_kind;
        std::string error = "download failed for " + url + ": " + result.download.error;
        return fail(std::move(result), kind, error);
    }

    // Verify
    transition(PipelineStage::Verifying);
    std::string pointer_url = options.pointer_url.empty() ? derive_pointer_url(url)
                                                          : options.pointer_url;
    result.verification = verify(destination, pointer_url, client_, logger_, cancel_,
                                 options.pointer_timeout);
    if (!result.verification.matches()) {
        ErrorKind kind = result.verification.error_kind;
        std::string error = "verify failed for " + destination + ": " + result.verification.error;
        return fail(std::move(result), kind, error);
    }

    if (!options.extract) {
        logger_.info("Extraction not requested; leaving '{}' as downloaded", destination);
        transition(PipelineStage::Done);
        result.final_stage = PipelineStage::Done;
        result.ok = true;
        return result;
    }

    if (!is_container(destination)) {
        logger_.info("'{}' is not an archive; nothing to extract", destination);
        transition(PipelineStage::Done);
        result.final_stage = PipelineStage::Done;
        result.ok = true;
        return result;
    }

    // Extract
    transition(PipelineStage::Extracting);
    ExtractionJob job;
    job.container_path = destination;
    job.target_dir = options.extract_to.empty() ? get_parent_directory(absolute_path(destination))
                                                : options.extract_to;
    job.current_depth = BEFORE_FIRST_EXTRACTION;
    job.max_depth = options.max_depth;

    result.extraction_ran = true;
    result.extraction = extract(job, options.extract_options, logger_, cancel_);
    if (!result.extraction.ok) {
        ErrorKind kind = result.extraction.error_kind;
        std::string error = "extract failed for " + destination + ": " + result.extraction.error;
        return fail(std::move(result), kind, error);
    }

    transition(PipelineStage::Done);
    result.final_stage = PipelineStage::Done;
    result.ok = true;
    return result;
}

} // namespace lfsget
