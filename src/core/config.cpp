#include "config.h"
#include "download_error.h"
#include "logger.h"

#include <nlohmann/json.hpp>
#include <climits>
#include <cstdint>
#include <fstream>

using json = nlohmann::json;

namespace {

// Integer keys are range-checked against their field instead of narrowed.
int64_t int64Value(const std::string& key, const json& value)
{
    if (!value.is_number_integer()) {
        throw DownloadError(ErrorKind::ParameterError,
                            "Config key '" + key + "' must be an integer");
    }
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
        throw DownloadError(ErrorKind::ParameterError,
                            "Config key '" + key + "' is out of range: " + value.dump());
    }
    return value.get<int64_t>();
}

int intValue(const std::string& key, const json& value)
{
    int64_t wide = int64Value(key, value);
    if (wide < INT_MIN || wide > INT_MAX) {
        throw DownloadError(ErrorKind::ParameterError,
                            "Config key '" + key + "' is out of range: " + value.dump());
    }
    return static_cast<int>(wide);
}

} // anonymous namespace

void validateConfig(const DownloadConfig& config)
{
    if (config.chunk_size <= 0) {
        throw DownloadError(ErrorKind::ParameterError, "chunk size must be > 0");
    }
    if (config.max_chunks <= 0) {
        throw DownloadError(ErrorKind::ParameterError, "max chunks must be > 0");
    }
    if (config.parallelism < 1 || config.parallelism > DownloadConfig::kMaxParallelism) {
        throw DownloadError(ErrorKind::ParameterError,
                            "parallelism must be between 1 and "
                            + std::to_string(DownloadConfig::kMaxParallelism));
    }
    if (config.http.connect_timeout_sec < 0 || config.http.transfer_timeout_sec < 0) {
        throw DownloadError(ErrorKind::ParameterError, "timeouts must be >= 0");
    }
}

void loadConfigFile(const std::string& path, DownloadConfig& config)
{
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw DownloadError(ErrorKind::ParameterError, "Cannot open config file " + path);
    }

    json j;
    try {
        j = json::parse(ifs);
    } catch (const json::parse_error& e) {
        throw DownloadError(ErrorKind::ParameterError,
                            "Malformed config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw DownloadError(ErrorKind::ParameterError,
                            "Config file " + path + " must contain a JSON object");
    }

    try {
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            const json& value = it.value();

            if (key == "chunk_size") {
                config.chunk_size = int64Value(key, value);
            } else if (key == "max_chunks") {
                config.max_chunks = int64Value(key, value);
            } else if (key == "parallelism") {
                config.parallelism = intValue(key, value);
            } else if (key == "overwrite") {
                config.overwrite = value.get<bool>();
            } else if (key == "connect_timeout_sec") {
                config.http.connect_timeout_sec = intValue(key, value);
            } else if (key == "transfer_timeout_sec") {
                config.http.transfer_timeout_sec = intValue(key, value);
            } else if (key == "user_agent") {
                config.http.user_agent = value.get<std::string>();
            } else if (key == "log_file") {
                config.log_file = value.get<std::string>();
            } else {
                Logger::instance().warn("Ignoring unknown config key '" + key + "' in " + path);
            }
        }
    } catch (const json::type_error& e) {
        throw DownloadError(ErrorKind::ParameterError,
                            "Bad value in config file " + path + ": " + e.what());
    }
}
