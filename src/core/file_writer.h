#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "chunk_fetcher.h"

/// Sole writer of the destination file. Only used once every fetch is done.
class FileWriter {
public:
    /// Create the file, or truncate an existing one, to zero length.
    /// Throws DownloadError(WriteError) on failure.
    static void createEmpty(const std::string& path);

    /// Append each payload to path in the given order and return the number
    /// of bytes written. Each payload is released as soon as it is on disk.
    /// Throws DownloadError(WriteError) on any I/O failure; bytes already
    /// appended stay in the file.
    static int64_t appendOrdered(const std::string& path, std::vector<ChunkResult> ordered);
};
