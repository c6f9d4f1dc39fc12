#pragma once

#include <cstdint>
#include <vector>

/// One contiguous byte window of the remote file, fetched by one request.
struct ChunkSpec {
    int index = 0;
    int64_t byte_start = 0;
    int64_t byte_end_inclusive = 0;

    int64_t length() const { return byte_end_inclusive - byte_start + 1; }
};

/// Plan for one invocation. Built once after size discovery, never modified.
struct DownloadPlan {
    int64_t file_size = 0;
    std::vector<ChunkSpec> chunks;
};

/// Number of leading bytes that will be downloaded: min(file_size, chunk_size * max_chunks).
int64_t coveredLength(int64_t file_size, int64_t chunk_size, int64_t max_chunks);

/// Split the covered prefix of a file into fixed-size chunks.
///
/// @param file_size   Total remote size in bytes (>= 0).
/// @param chunk_size  Bytes per chunk (> 0).
/// @param max_chunks  Upper bound on the number of chunks (> 0).
/// @return Specs at offsets 0, chunk_size, 2*chunk_size, ... while the offset
///         is below coveredLength(), at most max_chunks of them.
///
/// Behaviour:
///  - Every spec but the last is exactly chunk_size bytes long.
///  - The last spec ends at coveredLength() - 1.
///  - Specs are contiguous: spec[i].byte_end_inclusive + 1 == spec[i+1].byte_start.
///  - file_size == 0 yields an empty plan.
///  - Throws DownloadError(InvalidPlanParameters) on a non-positive chunk_size
///    or max_chunks, or a negative file_size.
std::vector<ChunkSpec> planChunks(int64_t file_size,
                                  int64_t chunk_size,
                                  int64_t max_chunks);
