#include "common/config.hpp"

#include <set>

#include <QFile>

#include <nlohmann/json.hpp>

namespace fleetsync {

namespace {

bool readInt(const nlohmann::json &obj, const char *key, int *out, std::string *error)
{
    if (!obj.contains(key) || obj.at(key).is_null()) {
        return true;
    }
    const auto &value = obj.at(key);
    if (value.is_number_integer()) {
        *out = value.get<int>();
        return true;
    }
    if (value.is_string()) {
        bool ok = false;
        const int parsed = QString::fromStdString(value.get<std::string>()).toInt(&ok);
        if (ok) {
            *out = parsed;
            return true;
        }
    }
    *error = std::string("'") + key + "' must be an integer";
    return false;
}

bool parseAccount(const nlohmann::json &obj, AccountConfig *account, std::string *error)
{
    if (!obj.is_object()) {
        *error = "account entry must be an object";
        return false;
    }
    account->id = obj.value("id", std::string(kDefaultAccountId));
    account->apiToken = obj.value("api_token", std::string());
    account->baseUrl = obj.value("base_url", std::string(kDefaultBaseUrl));
    return readInt(obj, "scan_interval", &account->scanIntervalMinutes, error)
        && readInt(obj, "page_size", &account->pageSize, error)
        && readInt(obj, "request_timeout", &account->requestTimeoutSeconds, error);
}

} // namespace

ConfigResult loadConfigFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return ConfigResult::failure("Cannot open config file " + path.toStdString());
    }

    const auto root = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return ConfigResult::failure("Invalid config JSON in " + path.toStdString());
    }

    FleetSyncConfig config;
    config.traceEnabled = root.value("trace", false);
    config.logLevel = logging::parseLogLevel(
        QString::fromStdString(root.value("log_level", std::string("info"))),
        logging::LogLevel::Info);

    std::string error;
    if (root.contains("accounts")) {
        const auto &accounts = root.at("accounts");
        if (!accounts.is_array()) {
            return ConfigResult::failure("'accounts' must be an array");
        }
        for (const auto &entry : accounts) {
            AccountConfig account;
            if (!parseAccount(entry, &account, &error)) {
                return ConfigResult::failure(error);
            }
            config.accounts.push_back(account);
        }
    } else {
        AccountConfig account;
        if (!parseAccount(root, &account, &error)) {
            return ConfigResult::failure(error);
        }
        config.accounts.push_back(account);
    }

    error = validateConfig(config);
    if (!error.empty()) {
        return ConfigResult::failure(error);
    }
    return ConfigResult::success(config);
}

ConfigResult loadConfigFromEnvironment()
{
    AccountConfig account;
    account.apiToken = qEnvironmentVariable("FLEETSYNC_API_TOKEN").toStdString();

    const QString baseUrl = qEnvironmentVariable("FLEETSYNC_BASE_URL");
    if (!baseUrl.isEmpty()) {
        account.baseUrl = baseUrl.toStdString();
    }

    bool ok = true;
    if (qEnvironmentVariableIsSet("FLEETSYNC_SCAN_INTERVAL")) {
        account.scanIntervalMinutes = qEnvironmentVariableIntValue("FLEETSYNC_SCAN_INTERVAL", &ok);
        if (!ok) {
            return ConfigResult::failure("FLEETSYNC_SCAN_INTERVAL must be an integer");
        }
    }
    if (qEnvironmentVariableIsSet("FLEETSYNC_PAGE_SIZE")) {
        account.pageSize = qEnvironmentVariableIntValue("FLEETSYNC_PAGE_SIZE", &ok);
        if (!ok) {
            return ConfigResult::failure("FLEETSYNC_PAGE_SIZE must be an integer");
        }
    }

    FleetSyncConfig config;
    config.accounts.push_back(account);
    config.traceEnabled = qEnvironmentVariableIntValue("FLEETSYNC_TRACE") == 1;
    config.logLevel = logging::parseLogLevel(qEnvironmentVariable("FLEETSYNC_LOG_LEVEL"),
                                             logging::LogLevel::Info);

    const std::string error = validateConfig(config);
    if (!error.empty()) {
        return ConfigResult::failure(error);
    }
    return ConfigResult::success(config);
}

std::string validateConfig(const FleetSyncConfig &config)
{
    if (config.accounts.empty()) {
        return "No accounts configured";
    }

    std::set<std::string> ids;
    for (const auto &account : config.accounts) {
        if (account.id.empty()) {
            return "Account id must not be empty";
        }
        if (!ids.insert(account.id).second) {
            return "Duplicate account id '" + account.id + "'";
        }
        if (account.apiToken.empty()) {
            return "Account '" + account.id + "' has no API token";
        }
        if (account.baseUrl.empty()) {
            return "Account '" + account.id + "' has no base URL";
        }
        if (account.scanIntervalMinutes < kMinScanIntervalMinutes
            || account.scanIntervalMinutes > kMaxScanIntervalMinutes) {
            return "Account '" + account.id + "' scan interval must be between "
                + std::to_string(kMinScanIntervalMinutes) + " and "
                + std::to_string(kMaxScanIntervalMinutes) + " minutes";
        }
        if (account.pageSize < 1 || account.pageSize > kMaxPageSize) {
            return "Account '" + account.id + "' page size must be between 1 and "
                + std::to_string(kMaxPageSize);
        }
        if (account.requestTimeoutSeconds < 1) {
            return "Account '" + account.id + "' request timeout must be positive";
        }
    }
    return {};
}

} // namespace fleetsync
