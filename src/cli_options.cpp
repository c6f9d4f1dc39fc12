#include "cli_options.h"
#include "core/download_error.h"

#include <getopt.h>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace {

int64_t parseInteger(const char* flag, const char* text)
{
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw DownloadError(ErrorKind::ParameterError,
                            std::string("option ") + flag + " expects an integer, got '"
                            + text + "'");
    }
    return static_cast<int64_t>(value);
}

} // anonymous namespace

CliOptions parseCliOptions(int argc, char* argv[])
{
    CliOptions opts;

    std::string config_file;
    std::optional<std::string> destination;
    std::optional<int64_t> chunk_size;
    std::optional<int64_t> max_chunks;
    std::optional<int64_t> parallelism;
    std::optional<std::string> log_file;
    bool force = false;

    // Reset getopt so the parser can run more than once per process.
#ifdef __GLIBC__
    optind = 0;
#else
    optind = 1;
#endif
    opterr = 0;

    int opt;
    while ((opt = getopt(argc, argv, ":o:c:m:p:fC:l:vh")) != -1) {
        switch (opt) {
        case 'o':
            destination = optarg;
            break;
        case 'c':
            chunk_size = parseInteger("-c", optarg);
            break;
        case 'm':
            max_chunks = parseInteger("-m", optarg);
            break;
        case 'p':
            parallelism = parseInteger("-p", optarg);
            break;
        case 'f':
            force = true;
            break;
        case 'C':
            config_file = optarg;
            break;
        case 'l':
            log_file = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            opts.show_help = true;
            break;
        case ':':
            throw DownloadError(ErrorKind::ParameterError,
                                std::string("option -") + static_cast<char>(optopt)
                                + " requires an argument");
        default:
            throw DownloadError(ErrorKind::ParameterError,
                                std::string("unknown option -") + static_cast<char>(optopt));
        }
    }

    if (opts.show_help) {
        return opts;
    }

    if (argc - optind != 1) {
        throw DownloadError(ErrorKind::ParameterError, "Must provide exactly one url");
    }
    opts.url = argv[optind];

    if (!config_file.empty()) {
        loadConfigFile(config_file, opts.config);
    }

    DownloadConfig& config = opts.config;
    if (destination) config.destination = *destination;
    if (chunk_size)  config.chunk_size = *chunk_size;
    if (max_chunks)  config.max_chunks = *max_chunks;
    if (parallelism) {
        if (*parallelism < 1 || *parallelism > DownloadConfig::kMaxParallelism) {
            throw DownloadError(ErrorKind::ParameterError,
                                "option -p must be between 1 and "
                                + std::to_string(DownloadConfig::kMaxParallelism));
        }
        config.parallelism = static_cast<int>(*parallelism);
    }
    if (log_file) config.log_file = *log_file;
    if (force)    config.overwrite = true;

    validateConfig(config);
    return opts;
}

std::string usageText(const std::string& program)
{
    std::ostringstream oss;
    oss << "Download a file in parts over http.\n"
        << "\n"
        << "Usage: " << program << " [options] url\n"
        << "\n"
        << "-o <string>\n"
        << "    Write file contents to <string> instead of the file's actual name\n"
        << "\n"
        << "-c <integer>\n"
        << "    Use <integer> bytes for the chunk size (default is "
        << DownloadConfig::kDefaultChunkSize << ")\n"
        << "\n"
        << "-m <integer>\n"
        << "    Download <integer> chunks (default is "
        << DownloadConfig::kDefaultMaxChunks << ")\n"
        << "\n"
        << "-f\n"
        << "    Force writing file even if it exists\n"
        << "\n"
        << "-p <integer>\n"
        << "    Use <integer> concurrent connections (default is "
        << DownloadConfig::kDefaultParallelism << ")\n"
        << "\n"
        << "-C <file>\n"
        << "    Read defaults from the JSON config <file>; other flags override it\n"
        << "\n"
        << "-l <file>\n"
        << "    Append log output to <file>\n"
        << "\n"
        << "-v\n"
        << "    Echo log output to stderr\n"
        << "\n"
        << "-h\n"
        << "    Show this help\n";
    return oss.str();
}
