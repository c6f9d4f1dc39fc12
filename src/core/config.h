#pragma once

#include <cstdint>
#include <string>

#include "http_engine.h"

/// Settings for one download. Built once per invocation and handed to the
/// Downloader; there are no process-wide defaults to mutate.
struct DownloadConfig {
    static constexpr int64_t kDefaultChunkSize = 1048576;  // 1 MiB
    static constexpr int64_t kDefaultMaxChunks = 4;
    static constexpr int kDefaultParallelism = 1;
    static constexpr int kMaxParallelism = 1024;

    int64_t chunk_size = kDefaultChunkSize;
    int64_t max_chunks = kDefaultMaxChunks;
    int parallelism = kDefaultParallelism;
    std::string destination;       // empty = derive from the URL path
    bool overwrite = false;
    std::string log_file;          // empty = no log file
    HttpConfig http;
};

/// Throws DownloadError(ParameterError) if any field is out of range:
/// chunk_size and max_chunks > 0, parallelism in [1, kMaxParallelism],
/// timeouts >= 0.
void validateConfig(const DownloadConfig& config);

/// Override fields of config from a JSON object stored at path.
/// Recognised keys: chunk_size, max_chunks, parallelism, overwrite,
/// connect_timeout_sec, transfer_timeout_sec, user_agent, log_file.
/// Unknown keys are logged and ignored. Throws DownloadError(ParameterError)
/// if the file cannot be read, is not a JSON object, a key has the wrong type,
/// or an integer does not fit its field.
void loadConfigFile(const std::string& path, DownloadConfig& config);
