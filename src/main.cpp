#include <iostream>
#include <mutex>

#include "cli_options.h"
#include "core/download_error.h"
#include "core/downloader.h"
#include "core/logger.h"
#include "core/target.h"

int main(int argc, char* argv[])
{
    const std::string program = argc > 0 ? argv[0] : "mget";

    CliOptions opts;
    try {
        opts = parseCliOptions(argc, argv);
    } catch (const DownloadError& e) {
        std::cerr << e.what() << "\n" << usageText(program);
        return 1;
    }

    if (opts.show_help) {
        std::cout << usageText(program);
        return 0;
    }

    // --- Logging ---
    Logger::instance().setLevel(opts.verbose ? LogLevel::LVL_DEBUG : LogLevel::LVL_INFO);
    Logger::instance().setConsoleOutput(opts.verbose);
    if (!opts.config.log_file.empty() && !Logger::instance().setLogFile(opts.config.log_file)) {
        std::cerr << "mget: cannot open log file " << opts.config.log_file << "\n";
        return 1;
    }

    try {
        Target target = parseTarget(opts.url);
        Downloader downloader(target, opts.config);

        // One dot per finished chunk.
        std::mutex out_mutex;
        downloader.setChunkDoneCallback([&out_mutex](const ChunkSpec&) {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << '.' << std::flush;
        });

        DownloadResult result = downloader.download();
        std::cout << "done." << std::endl;
        Logger::instance().info(result.file_name + ": "
            + std::to_string(result.bytes_written) + " bytes");
        return 0;
    } catch (const DownloadError& e) {
        std::cout << std::flush;
        std::cerr << "\nmget: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Unexpected error: ") + e.what());
        std::cerr << "\nmget: unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
