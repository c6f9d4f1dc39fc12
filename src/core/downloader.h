#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "chunk_fetcher.h"
#include "chunk_planner.h"
#include "config.h"
#include "target.h"

enum class DownloadState {
    Idle,
    Probing,
    Aborted,      // precondition failed (destination exists, no range support)
    Planning,
    Fetching,
    Assembling,
    Done,
    Failed
};

const char* downloadStateName(DownloadState state);

struct DownloadResult {
    std::string file_name;
    int64_t bytes_written = 0;
};

/// Invoked on the calling thread whenever the state changes.
using DownloadStateCallback = std::function<void(DownloadState state)>;

/// Invoked on a worker thread after each chunk was fetched successfully.
/// An exception it throws fails the download once every fetch has finished;
/// a real fetch failure is reported in preference to it.
using ChunkDoneCallback = std::function<void(const ChunkSpec& spec)>;

/// Sort chunk results by key (first byte offset), ascending.
void sortChunkResults(std::vector<ChunkResult>& results);

/// Downloads the covered prefix of one remote file with parallel range
/// requests and writes it, in offset order, to a single local file.
///
/// Sequence: resolve destination -> refuse to clobber -> probe size ->
/// probe range support -> plan -> fetch every chunk on a pool of
/// config.parallelism workers -> wait for all -> sort -> write.
///
/// Failure policy is fail-after-collect: every submitted fetch runs to
/// completion, then the first failure (in completion order) is thrown and no
/// output is written. All errors are DownloadError and are terminal.
class Downloader {
public:
    Downloader(Target target, DownloadConfig config);

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    void setStateCallback(DownloadStateCallback cb);
    void setChunkDoneCallback(ChunkDoneCallback cb);

    /// Run the whole download. May be called once.
    DownloadResult download();

    DownloadState state() const { return state_; }

    /// Destination file name: config.destination, else the URL's last path segment.
    /// Throws DownloadError(ParameterError) if neither yields a name.
    std::string resolveDestination() const;

private:
    DownloadPlan buildPlan();
    std::vector<ChunkResult> fetchAll(const DownloadPlan& plan);
    void setState(DownloadState new_state);

    Target target_;
    DownloadConfig config_;
    DownloadState state_ = DownloadState::Idle;
    DownloadStateCallback on_state_change_;
    ChunkDoneCallback on_chunk_done_;
};
