#include "downloader.h"
#include "download_error.h"
#include "file_writer.h"
#include "logger.h"
#include "server_probe.h"
#include "thread_pool.h"

#include <algorithm>
#include <filesystem>
#include <future>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

const char* downloadStateName(DownloadState state)
{
    switch (state) {
        case DownloadState::Idle:       return "Idle";
        case DownloadState::Probing:    return "Probing";
        case DownloadState::Aborted:    return "Aborted";
        case DownloadState::Planning:   return "Planning";
        case DownloadState::Fetching:   return "Fetching";
        case DownloadState::Assembling: return "Assembling";
        case DownloadState::Done:       return "Done";
        case DownloadState::Failed:     return "Failed";
    }
    return "Unknown";
}

void sortChunkResults(std::vector<ChunkResult>& results)
{
    std::sort(results.begin(), results.end(),
              [](const ChunkResult& a, const ChunkResult& b) { return a.key < b.key; });
}

// ── Constructor ────────────────────────────────────────────────

Downloader::Downloader(Target target, DownloadConfig config)
    : target_(std::move(target))
    , config_(std::move(config))
{
}

void Downloader::setStateCallback(DownloadStateCallback cb)
{
    on_state_change_ = std::move(cb);
}

void Downloader::setChunkDoneCallback(ChunkDoneCallback cb)
{
    on_chunk_done_ = std::move(cb);
}

// ── resolveDestination ─────────────────────────────────────────

std::string Downloader::resolveDestination() const
{
    if (!config_.destination.empty()) {
        return config_.destination;
    }

    std::string name = fileNameFromPath(target_.path);
    if (name.empty() || name == "." || name == "..") {
        throw DownloadError(ErrorKind::ParameterError,
                            "Cannot derive a file name from " + target_.url
                            + "; pass an explicit destination");
    }
    // Decoded escapes must not turn the name into a path.
    if (name.find('/') != std::string::npos || name.find('\0') != std::string::npos) {
        throw DownloadError(ErrorKind::ParameterError,
                            "File name derived from " + target_.url
                            + " contains '/' or NUL; pass an explicit destination (-o)");
    }
    return name;
}

// ── download ───────────────────────────────────────────────────

DownloadResult Downloader::download()
{
    if (state_ != DownloadState::Idle) {
        throw DownloadError(ErrorKind::ParameterError, "download() may only run once");
    }

    DownloadResult result;
    try {
        validateConfig(config_);
        result.file_name = resolveDestination();

        // Checked before any network I/O.
        std::error_code ec;
        bool exists = fs::exists(result.file_name, ec);
        if (ec) {
            throw DownloadError(ErrorKind::ParameterError,
                                "Cannot access " + result.file_name + ": " + ec.message());
        }
        if (exists && !config_.overwrite) {
            throw DownloadError(ErrorKind::DestinationExists,
                                result.file_name + " already exists");
        }

        DownloadPlan plan = buildPlan();

        setState(DownloadState::Fetching);
        std::vector<ChunkResult> results = fetchAll(plan);

        setState(DownloadState::Assembling);
        if (results.size() != plan.chunks.size()) {
            throw DownloadError(ErrorKind::FetchError,
                                "Expected " + std::to_string(plan.chunks.size())
                                + " chunks, collected " + std::to_string(results.size()));
        }
        sortChunkResults(results);

        // Creating first guarantees a file even for an empty source.
        FileWriter::createEmpty(result.file_name);
        result.bytes_written = FileWriter::appendOrdered(result.file_name, std::move(results));

        setState(DownloadState::Done);
        Logger::instance().info("Downloaded " + target_.url + " to " + result.file_name
            + " (" + std::to_string(result.bytes_written) + " bytes)");
        return result;
    } catch (const DownloadError& e) {
        Logger::instance().error(std::string(errorKindName(e.kind())) + ": " + e.what());
        bool aborted = e.kind() == ErrorKind::DestinationExists
                    || e.kind() == ErrorKind::RangeUnsupported;
        setState(aborted ? DownloadState::Aborted : DownloadState::Failed);
        throw;
    }
}

// ── buildPlan ──────────────────────────────────────────────────

DownloadPlan Downloader::buildPlan()
{
    setState(DownloadState::Probing);

    DownloadPlan plan;
    plan.file_size = probeSize(target_, config_.http);

    // An empty file needs no ranged request, and a 0-0 range is unsatisfiable for it.
    if (plan.file_size > 0 && !checkRangeSupport(target_, config_.http)) {
        throw DownloadError(ErrorKind::RangeUnsupported,
                            "Server does not support Range header");
    }

    setState(DownloadState::Planning);
    plan.chunks = planChunks(plan.file_size, config_.chunk_size, config_.max_chunks);

    Logger::instance().info("Planned " + std::to_string(plan.chunks.size())
        + " chunk(s) of up to " + std::to_string(config_.chunk_size) + " bytes covering "
        + std::to_string(coveredLength(plan.file_size, config_.chunk_size, config_.max_chunks))
        + " of " + std::to_string(plan.file_size) + " bytes");
    return plan;
}

// ── fetchAll ───────────────────────────────────────────────────

std::vector<ChunkResult> Downloader::fetchAll(const DownloadPlan& plan)
{
    std::vector<ChunkResult> completed;
    if (plan.chunks.empty()) {
        return completed;
    }
    completed.reserve(plan.chunks.size());

    std::mutex mutex;
    std::vector<DownloadError> failures;   // completion order
    ChunkFetcher fetcher(target_, config_.http);

    const size_t workers = std::min(static_cast<size_t>(config_.parallelism),
                                     plan.chunks.size());
    Logger::instance().info("Fetching " + std::to_string(plan.chunks.size())
        + " chunk(s) with " + std::to_string(workers) + " worker(s)");

    {
        // Declared after the shared state so its destructor joins first.
        ThreadPool pool(workers);
        std::vector<std::future<void>> futures;
        futures.reserve(plan.chunks.size());

        for (const ChunkSpec& spec : plan.chunks) {
            futures.push_back(pool.submit([this, &fetcher, &mutex, &completed, &failures, spec] {
                ChunkResult chunk;
                try {
                    chunk = fetcher.fetch(spec);
                } catch (const DownloadError& e) {
                    Logger::instance().warn(e.what());
                    std::lock_guard<std::mutex> lock(mutex);
                    failures.push_back(e);
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    completed.push_back(std::move(chunk));
                }
                // Outside the fetch's try: an observer error must not mark a
                // fetched chunk as failed. It surfaces through the future.
                if (on_chunk_done_) {
                    on_chunk_done_(spec);
                }
            }));
        }

        // Barrier: wait for every fetch, successful or not.
        for (auto& f : futures) {
            f.wait();
        }

        // Fetch failures take precedence over errors raised by the observer.
        if (!failures.empty()) {
            Logger::instance().error(std::to_string(failures.size()) + " of "
                + std::to_string(plan.chunks.size()) + " chunk(s) failed; nothing written");
            throw failures.front();
        }
        for (auto& f : futures) {
            f.get();
        }
    }

    return completed;
}

// ── setState ───────────────────────────────────────────────────

void Downloader::setState(DownloadState new_state)
{
    DownloadState old_state = state_;
    state_ = new_state;
    if (on_state_change_ && old_state != new_state) {
        on_state_change_(new_state);
    }
}
