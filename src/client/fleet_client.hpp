#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/models.hpp"

namespace fleetsync {

/**
 * FleetClient is the remote FOTA capability the synchronization core consumes.
 *
 * Every call either returns a value or a ClientError classified as
 * Authentication (credentials rejected) or Api (anything else). Calls are
 * blocking and bounded by the implementation's own timeout. Implementations
 * must tolerate calls from several threads at once.
 */
class FleetClient
{
public:
    virtual ~FleetClient() = default;

    virtual ClientResult<Page<Device>> listDevices(int page, int pageSize) = 0;
    virtual ClientResult<Page<Task>> listTasks(int page, int pageSize) = 0;
    virtual ClientResult<AccountStatistics> getAccountStatistics() = 0;
    // Raw batch record, as returned by the API.
    virtual ClientResult<nlohmann::json> getBatch(int batchId) = 0;

    virtual ClientResult<Ack> cancelTasks(const std::vector<int> &taskIds) = 0;
    virtual ClientResult<Ack> createFirmwareTask(const std::string &deviceId,
                                                 int firmwareId) = 0;
    virtual ClientResult<Ack> createConfigurationTask(const std::string &deviceId,
                                                      int configurationId) = 0;
    virtual ClientResult<Ack> retryFailedTasks(int batchId) = 0;
};

// Builds the client an account talks through. Tests substitute fakes here.
using ClientFactory = std::function<std::unique_ptr<FleetClient>(const AccountConfig &)>;

} // namespace fleetsync
