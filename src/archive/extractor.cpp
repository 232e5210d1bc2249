#include "lfsget/extractor.hpp"
#include "lfsget/archive.hpp"
#include "lfsget/cancellation.hpp"
#include "lfsget/logger.hpp"
#include "lfsget/platform.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace lfsget {

namespace {

using Failures = std::vector<ExtractFailure>;

// One container in the extraction tree. Children are kept in discovery order.
struct Node {
    ExtractionJob job;
    Node* parent = nullptr;
    Node* next_in_chain = nullptr;      // overlapping sibling that runs after this subtree
    bool enclosed = false;              // lies inside an earlier sibling's target
    bool skipped = false;
    bool subtree_ok = false;
    Failures failures;                  // this level only
    std::vector<std::unique_ptr<Node>> children;
    std::atomic<std::size_t> pending{0};

    int depth() const { return job.current_depth + 1; }
};

struct ExtractContext {
    ExtractContext(const ExtractOptions& opts, Logger& log, const CancellationToken& token)
        : options(opts), logger(log), cancel(token) {}

    const ExtractOptions& options;
    Logger& logger;
    const CancellationToken& cancel;

    std::atomic<std::uint64_t> processed{0};
    std::atomic<std::uint64_t> total{0};
    std::atomic<std::uint64_t> entries{0};
    std::atomic<std::uint32_t> nested{0};
    std::mutex progress_mutex;

    // Work queue shared by every worker of one extraction
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Node*> queue;
    bool finished = false;

    bool tracking() const { return options.track_progress && options.progress; }

    void report_progress() {
        if (!tracking()) return;
        std::lock_guard<std::mutex> lock(progress_mutex);
        ExtractProgress progress;
        progress.processed = processed.load();
        progress.total = total.load();
        options.progress(progress);
    }

    void schedule(Node* node) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            queue.push_back(node);
        }
        queue_cv.notify_one();
    }

    void finish_all() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            finished = true;
        }
        queue_cv.notify_all();
    }

    Node* next_node() {
        std::unique_lock<std::mutex> lock(queue_mutex);
        queue_cv.wait(lock, [this] { return finished || !queue.empty(); });
        if (queue.empty()) return nullptr;
        Node* node = queue.front();
        queue.pop_front();
        return node;
    }
};

std::size_t worker_count(std::size_t requested) {
    if (requested == 0) {
        return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
    }
    return requested;
}

ExtractFailure failure(const ExtractionJob& job, int depth, ErrorKind kind, const std::string& error) {
    ExtractFailure f;
    f.container_path = job.container_path;
    f.depth = depth;
    f.error_kind = kind;
    f.error = error;
    return f;
}

std::vector<std::string> path_components(const std::string& path) {
    std::vector<std::string> parts;
    for (const auto& part : fs::path(path).lexically_normal()) {
        if (!part.empty()) parts.push_back(part.string());
    }
    return parts;
}

// True when path equals base or lies below it
bool is_within(const std::string& base, const std::string& path) {
    auto b = path_components(base);
    auto p = path_components(path);
    return b.size() <= p.size() && std::equal(b.begin(), b.end(), p.begin());
}

bool overlaps(const ExtractionJob& a, const ExtractionJob& b) {
    return is_within(a.target_dir, b.container_path) || is_within(a.target_dir, b.target_dir) ||
           is_within(b.target_dir, a.container_path) || is_within(b.target_dir, a.target_dir);
}

std::size_t component_depth(const std::string& path) {
    return path_components(path).size();
}

// Siblings whose containers or targets nest inside each other are linked into
// one chain, outermost target first, and only the chain heads are returned.
// A chain runs one subtree at a time; separate chains never share a path.
std::vector<Node*> link_overlapping(std::vector<std::unique_ptr<Node>>& children) {
    const std::size_t n = children.size();
    std::vector<std::size_t> group(n);
    for (std::size_t i = 0; i < n; ++i) group[i] = i;

    auto find = [&group](std::size_t i) {
        while (group[i] != i) i = group[i] = group[group[i]];
        return i;
    };

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            if (overlaps(children[i]->job, children[j]->job)) {
                group[find(j)] = find(i);
            }
        }
    }

    std::vector<Node*> heads;
    std::vector<bool> done(n, false);
    for (std::size_t i = 0; i < n; ++i) {
        if (done[i]) continue;
        std::vector<Node*> chain;
        std::size_t root = find(i);
        for (std::size_t j = i; j < n; ++j) {
            if (!done[j] && find(j) == root) {
                chain.push_back(children[j].get());
                done[j] = true;
            }
        }
        std::stable_sort(chain.begin(), chain.end(), [](const Node* a, const Node* b) {
            return component_depth(a->job.target_dir) < component_depth(b->job.target_dir);
        });
        for (std::size_t k = 1; k < chain.size(); ++k) {
            chain[k - 1]->next_in_chain = chain[k];
            chain[k]->enclosed = true;
        }
        heads.push_back(chain.front());
    }
    return heads;
}

// Unpack one container. Returns the nested containers it held, in order.
std::vector<ExtractionJob> expand(ExtractContext& ctx, Node& node) {
    const ExtractionJob& job = node.job;
    const int depth = node.depth();
    std::vector<ExtractionJob> children;

    if (ctx.cancel.is_cancelled()) {
        node.failures.push_back(failure(job, depth, ErrorKind::Cancelled, "extraction cancelled"));
        return children;
    }
    if (depth > job.max_depth) {
        node.failures.push_back(failure(job, depth, ErrorKind::RecursionLimitExceeded,
                                        "depth " + std::to_string(depth) +
                                            " exceeds max depth " + std::to_string(job.max_depth)));
        return children;
    }
    if (node.enclosed && !is_container(job.container_path)) {
        // An enclosing sibling already expanded or replaced it
        ctx.logger.debug("'{}' was consumed by an enclosing container; skipped", job.container_path);
        node.skipped = true;
        return children;
    }
    if (!is_regular_file(job.container_path)) {
        node.failures.push_back(failure(job, depth, ErrorKind::NotFound,
                                        "container not found: " + job.container_path));
        return children;
    }

    auto dir = ensure_directory(job.target_dir, true, ctx.logger);
    if (!dir.ok) {
        node.failures.push_back(failure(job, depth, ErrorKind::FilesystemError, dir.error));
        return children;
    }

    ctx.logger.info("Extracting '{}' to '{}' (depth {})", job.container_path, job.target_dir, depth);

    if (ctx.tracking()) {
        ListResult listing = list_container(job.container_path);
        if (listing.ok) {
            ctx.total += listing.entries.size();
        }
    }

    auto on_entry = [&](const ContainerEntry& entry, const std::string& full_path) {
        ++ctx.processed;
        ctx.report_progress();
        ctx.logger.debug("  {} {}", to_string(entry.type), entry.path);

        if (!entry.is_nested_container) return;
        if (!is_container(full_path)) {
            ctx.logger.debug("'{}' is named like a container but is not one; kept as a file",
                             entry.path);
            return;
        }

        ExtractionJob child;
        child.container_path = full_path;
        child.target_dir = strip_container_extension(full_path);
        child.current_depth = depth;
        child.max_depth = job.max_depth;
        children.push_back(child);
    };

    UnpackResult unpacked = unpack_container(job.container_path, job.target_dir, ctx.cancel, on_entry);
    if (!unpacked.ok) {
        node.failures.push_back(failure(job, depth, unpacked.error_kind, unpacked.error));
        children.clear();
        return children;
    }
    ctx.entries += unpacked.entries.size();
    ctx.logger.debug("Extracted {} entries from '{}'", unpacked.entries.size(), job.container_path);

    if (!children.empty() && depth + 1 > job.max_depth) {
        for (const auto& child : children) {
            ctx.logger.error("Nested container '{}' would exceed max depth {}",
                             child.container_path, job.max_depth);
            node.failures.push_back(failure(child, depth + 1, ErrorKind::RecursionLimitExceeded,
                                            "nested container at depth " +
                                                std::to_string(depth + 1) + " exceeds max depth " +
                                                std::to_string(job.max_depth)));
        }
        children.clear();
    }
    return children;
}

// Called once a node and everything below it is done. Walks up while this was
// the last outstanding child of its parent.
void complete(ExtractContext& ctx, Node* node) {
    while (node) {
        bool ok = node->failures.empty();
        for (const auto& child : node->children) {
            ok = ok && child->subtree_ok;
        }
        node->subtree_ok = ok;

        if (ok && !node->skipped && node->depth() >= 1) {
            if (remove_file(node->job.container_path)) {
                ctx.logger.debug("Removed nested container '{}'", node->job.container_path);
            } else {
                ctx.logger.warn("Could not remove nested container '{}'", node->job.container_path);
            }
            ++ctx.nested;
        }

        if (node->next_in_chain) {
            ctx.schedule(node->next_in_chain);
        }

        Node* parent = node->parent;
        if (!parent) {
            ctx.finish_all();
            return;
        }
        if (parent->pending.fetch_sub(1, std::memory_order_acq_rel) != 1) {
            return;
        }
        node = parent;
    }
}

void process(ExtractContext& ctx, Node& node) {
    std::vector<ExtractionJob> jobs = expand(ctx, node);
    if (jobs.empty()) {
        complete(ctx, &node);
        return;
    }

    for (auto& job : jobs) {
        auto child = std::make_unique<Node>();
        child->job = std::move(job);
        child->parent = &node;
        node.children.push_back(std::move(child));
    }
    std::vector<Node*> heads = link_overlapping(node.children);
    node.pending.store(node.children.size(), std::memory_order_release);
    if (heads.size() > 1) {
        ctx.logger.debug("Queued {} nested containers from '{}'", heads.size(), node.job.container_path);
    }
    for (Node* head : heads) {
        ctx.schedule(head);
    }
}

void run_worker(ExtractContext& ctx) {
    while (Node* node = ctx.next_node()) {
        process(ctx, *node);
    }
}

void collect_failures(const Node& node, Failures& out) {
    out.insert(out.end(), node.failures.begin(), node.failures.end());
    for (const auto& child : node.children) {
        collect_failures(*child, out);
    }
}

} // namespace

ExtractResult extract(const ExtractionJob& job,
                      const ExtractOptions& options,
                      Logger& logger,
                      const CancellationToken& cancel) {
    ExtractContext ctx(options, logger, cancel);

    Node root;
    root.job = job;
    ctx.schedule(&root);

    // The calling thread is one of the workers
    Failures spawn_failures;
    std::vector<std::thread> pool;
    const std::size_t workers = worker_count(options.parallelism);
    for (std::size_t w = 1; w < workers; ++w) {
        try {
            pool.emplace_back(run_worker, std::ref(ctx));
        } catch (const std::system_error& e) {
            logger.warn("Could not start extraction worker {}: {}", w, e.what());
            spawn_failures.push_back(failure(job, 0, ErrorKind::FilesystemError,
                                             std::string("could not start extraction worker: ") +
                                                 e.what()));
            break;
        }
    }
    run_worker(ctx);
    for (auto& t : pool) {
        t.join();
    }

    Failures failures;
    collect_failures(root, failures);
    failures.insert(failures.end(), spawn_failures.begin(), spawn_failures.end());

    ExtractResult result;
    result.entries_extracted = ctx.entries.load();
    result.nested_extracted = ctx.nested.load();

    if (failures.empty()) {
        logger.info("Extraction of '{}' complete: {} entries, {} nested containers",
                    job.container_path, result.entries_extracted, result.nested_extracted);
        result.ok = true;
        return result;
    }

    for (const auto& f : failures) {
        logger.error("Extraction failed for '{}' (depth {}): {}", f.container_path, f.depth, f.error);
    }

    result.error_kind = failures.front().error_kind;
    result.error = failures.front().error;
    if (failures.size() > 1) {
        result.error += " (and " + std::to_string(failures.size() - 1) + " more)";
    }
    result.failures = std::move(failures);
    return result;
}

} // namespace lfsget
