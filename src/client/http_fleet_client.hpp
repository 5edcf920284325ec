#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <QByteArray>
#include <QUrlQuery>

#include <nlohmann/json.hpp>

#include "client/fleet_client.hpp"
#include "common/config.hpp"

namespace fleetsync {

struct HttpClientOptions {
    std::string baseUrl = kDefaultBaseUrl;
    std::string apiToken;
    std::chrono::seconds timeout{kDefaultRequestTimeoutSeconds};
};

HttpClientOptions httpOptionsFromAccount(const AccountConfig &account);

// Default ClientFactory.
std::unique_ptr<FleetClient> makeHttpClient(const AccountConfig &account);

/**
 * HttpFleetClient talks to the Teltonika FOTA REST API.
 *
 * Each call creates its own QNetworkAccessManager and waits on a local event
 * loop, so calls are blocking and may be issued from any thread, including the
 * coordinator's worker thread. The local loop also delivers events queued for
 * the calling thread while the request is pending. 401 and 403 responses are reported as
 * Authentication errors; everything else that goes wrong is an Api error.
 */
class HttpFleetClient : public FleetClient
{
public:
    explicit HttpFleetClient(HttpClientOptions options);
    ~HttpFleetClient() override;

    ClientResult<Page<Device>> listDevices(int page, int pageSize) override;
    ClientResult<Page<Task>> listTasks(int page, int pageSize) override;
    ClientResult<AccountStatistics> getAccountStatistics() override;
    ClientResult<nlohmann::json> getBatch(int batchId) override;

    ClientResult<Ack> cancelTasks(const std::vector<int> &taskIds) override;
    ClientResult<Ack> createFirmwareTask(const std::string &deviceId,
                                         int firmwareId) override;
    ClientResult<Ack> createConfigurationTask(const std::string &deviceId,
                                              int configurationId) override;
    ClientResult<Ack> retryFailedTasks(int batchId) override;

    // Fetches company statistics; succeeds only for a usable token.
    ClientResult<AccountStatistics> validateToken();

private:
    ClientResult<nlohmann::json> request(const QByteArray &verb,
                                         const QString &endpoint,
                                         const QUrlQuery &query,
                                         const nlohmann::json &body);

    HttpClientOptions m_options;
};

} // namespace fleetsync
