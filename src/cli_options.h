#pragma once

#include <string>

#include "core/config.h"

struct CliOptions {
    std::string url;
    DownloadConfig config;
    bool verbose = false;
    bool show_help = false;
};

/// Parse `mget [options] url`.
/// Settings are layered: built-in defaults, then the -C config file, then the
/// remaining flags, whatever their position on the command line.
/// Throws DownloadError(ParameterError) on unknown options, malformed
/// integers, or a missing/extra URL (unless -h was given).
CliOptions parseCliOptions(int argc, char* argv[]);

/// Usage text with the built-in defaults filled in.
std::string usageText(const std::string& program);
