#include "file_writer.h"
#include "download_error.h"
#include "logger.h"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace {

std::string osError() {
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("unknown I/O error");
}

} // anonymous namespace

void FileWriter::createEmpty(const std::string& path)
{
    errno = 0;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw DownloadError(ErrorKind::WriteError,
                            "Cannot create " + path + ": " + osError());
    }
    ofs.close();
    if (ofs.fail()) {
        throw DownloadError(ErrorKind::WriteError,
                            "Cannot create " + path + ": " + osError());
    }
}

int64_t FileWriter::appendOrdered(const std::string& path, std::vector<ChunkResult> ordered)
{
    errno = 0;
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    if (!ofs.is_open()) {
        throw DownloadError(ErrorKind::WriteError,
                            "Cannot open " + path + " for writing: " + osError());
    }

    int64_t written = 0;
    for (auto& chunk : ordered) {
        ofs.write(chunk.payload.data(), static_cast<std::streamsize>(chunk.payload.size()));
        ofs.flush();
        if (!ofs) {
            throw DownloadError(ErrorKind::WriteError,
                                "Write to " + path + " failed at offset "
                                + std::to_string(written) + ": " + osError());
        }
        written += static_cast<int64_t>(chunk.payload.size());

        // Payload is on disk; drop it.
        std::vector<char>().swap(chunk.payload);
    }

    ofs.close();
    if (ofs.fail()) {
        throw DownloadError(ErrorKind::WriteError,
                            "Closing " + path + " failed: " + osError());
    }

    Logger::instance().info("Wrote " + std::to_string(written) + " bytes to " + path);
    return written;
}
