#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/logging.hpp"
#include "common/result.hpp"

namespace fleetsync {

constexpr int kDefaultScanIntervalMinutes = 5;
constexpr int kMinScanIntervalMinutes = 1;
constexpr int kMaxScanIntervalMinutes = 60;
constexpr int kDefaultPageSize = 100;
constexpr int kMaxPageSize = 1000;
constexpr int kDefaultRequestTimeoutSeconds = 30;

inline const char *const kDefaultBaseUrl = "https://api.teltonika.lt";
inline const char *const kDefaultAccountId = "default";

// One FOTA account the process keeps in sync.
struct AccountConfig {
    std::string id = kDefaultAccountId;
    std::string apiToken;
    std::string baseUrl = kDefaultBaseUrl;
    int scanIntervalMinutes = kDefaultScanIntervalMinutes;
    int pageSize = kDefaultPageSize;
    int requestTimeoutSeconds = kDefaultRequestTimeoutSeconds;
};

struct FleetSyncConfig {
    std::vector<AccountConfig> accounts;
    bool traceEnabled = false;
    logging::LogLevel logLevel = logging::LogLevel::Info;
};

using ConfigResult = Result<FleetSyncConfig, std::string>;

// Reads a JSON config file. Either a single account at top level or an
// "accounts" array is accepted. The result is validated.
ConfigResult loadConfigFile(const QString &path);

// Reads FLEETSYNC_* environment variables into a single-account config.
ConfigResult loadConfigFromEnvironment();

// Returns an empty string when the config is usable, else the first problem.
std::string validateConfig(const FleetSyncConfig &config);

} // namespace fleetsync
