#include "chunk_fetcher.h"
#include "download_error.h"
#include "logger.h"

ChunkFetcher::ChunkFetcher(Target target, HttpConfig config)
    : target_(std::move(target))
    , config_(std::move(config))
{
}

ChunkResult ChunkFetcher::fetch(const ChunkSpec& spec) const
{
    const std::string label = "chunk " + std::to_string(spec.index)
        + " [" + std::to_string(spec.byte_start) + "-"
        + std::to_string(spec.byte_end_inclusive) + "]";

    ChunkResult result;
    result.key = spec.byte_start;
    result.payload.reserve(static_cast<size_t>(spec.length()));

    long status = 0;
    try {
        // Private engine: the connection lives and dies with this call.
        HttpEngine engine;
        status = engine.get(target_.url, spec.byte_start, spec.byte_end_inclusive, config_,
            [&result](const char* data, size_t size) -> size_t {
                result.payload.insert(result.payload.end(), data, data + size);
                return size;
            });
    } catch (const HttpError& e) {
        throw DownloadError(ErrorKind::FetchError,
                            "Failed to fetch " + label + ": " + e.what(),
                            e.httpStatus());
    }

    if (status != 206) {
        throw DownloadError(ErrorKind::FetchError,
                            "Failed to fetch " + label + ": expected HTTP 206, got "
                            + std::to_string(status),
                            status);
    }

    if (static_cast<int64_t>(result.payload.size()) != spec.length()) {
        throw DownloadError(ErrorKind::FetchError,
                            "Failed to fetch " + label + ": received "
                            + std::to_string(result.payload.size()) + " of "
                            + std::to_string(spec.length()) + " bytes",
                            status);
    }

    Logger::instance().debug("Fetched " + label);
    return result;
}
