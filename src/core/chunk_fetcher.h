#pragma once

#include <cstdint>
#include <vector>

#include "chunk_planner.h"
#include "http_engine.h"
#include "target.h"

/// Raw bytes of one chunk, keyed by the chunk's first byte offset.
struct ChunkResult {
    int64_t key = 0;
    std::vector<char> payload;
};

/// Fetches single chunks of one target. Each fetch() call opens and releases
/// its own connection, so one ChunkFetcher may be shared by many workers.
class ChunkFetcher {
public:
    ChunkFetcher(Target target, HttpConfig config);

    /// Download spec's byte window into memory.
    /// Throws DownloadError(FetchError) on transport failure, a status other
    /// than 206, or a body whose length differs from spec.length().
    ChunkResult fetch(const ChunkSpec& spec) const;

    const Target& target() const { return target_; }

private:
    Target target_;
    HttpConfig config_;
};
