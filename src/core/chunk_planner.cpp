#include "chunk_planner.h"
#include "download_error.h"

#include <algorithm>
#include <limits>

int64_t coveredLength(int64_t file_size, int64_t chunk_size, int64_t max_chunks) {
    // chunk_size * max_chunks may overflow; anything that large covers the file.
    if (chunk_size > 0 && max_chunks > std::numeric_limits<int64_t>::max() / chunk_size) {
        return file_size;
    }
    return std::min(file_size, chunk_size * max_chunks);
}

std::vector<ChunkSpec> planChunks(int64_t file_size,
                                  int64_t chunk_size,
                                  int64_t max_chunks) {
    if (chunk_size <= 0) {
        throw DownloadError(ErrorKind::InvalidPlanParameters, "chunk size must be > 0");
    }
    if (max_chunks <= 0) {
        throw DownloadError(ErrorKind::InvalidPlanParameters, "max chunks must be > 0");
    }
    if (file_size < 0) {
        throw DownloadError(ErrorKind::InvalidPlanParameters, "file size must be >= 0");
    }

    const int64_t covered = coveredLength(file_size, chunk_size, max_chunks);

    std::vector<ChunkSpec> chunks;
    chunks.reserve(static_cast<size_t>(covered / chunk_size + (covered % chunk_size != 0)));

    int64_t offset = 0;
    for (int i = 0; offset < covered && i < max_chunks; ++i) {
        const int64_t remaining = covered - offset;

        ChunkSpec spec;
        spec.index              = i;
        spec.byte_start         = offset;
        spec.byte_end_inclusive = (remaining > chunk_size) ? offset + chunk_size - 1
                                                           : covered - 1;
        chunks.push_back(spec);

        if (remaining <= chunk_size) {
            break;
        }
        offset += chunk_size;
    }

    return chunks;
}
