#include "client/http_fleet_client.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#include <memory>

#include "client/record_parser.hpp"
#include "common/logging.hpp"

namespace fleetsync {

namespace {

const QString kEndpointDevices = QStringLiteral("/devices");
const QString kEndpointTasks = QStringLiteral("/tasks");
const QString kEndpointTasksBulkCancel = QStringLiteral("/tasks/bulkCancel");
const QString kEndpointBatches = QStringLiteral("/batches");
const QString kEndpointCompanyStats = QStringLiteral("/companies/stats");

QUrlQuery pageQuery(int page, int pageSize)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("page"), QString::number(page));
    query.addQueryItem(QStringLiteral("per_page"), QString::number(pageSize));
    return query;
}

} // namespace

HttpClientOptions httpOptionsFromAccount(const AccountConfig &account)
{
    HttpClientOptions options;
    options.baseUrl = account.baseUrl;
    options.apiToken = account.apiToken;
    options.timeout = std::chrono::seconds(account.requestTimeoutSeconds);
    return options;
}

std::unique_ptr<FleetClient> makeHttpClient(const AccountConfig &account)
{
    return std::make_unique<HttpFleetClient>(httpOptionsFromAccount(account));
}

HttpFleetClient::HttpFleetClient(HttpClientOptions options)
    : m_options(std::move(options))
{
}

HttpFleetClient::~HttpFleetClient() = default;

ClientResult<Page<Device>> HttpFleetClient::listDevices(int page, int pageSize)
{
    const auto body = request("GET", kEndpointDevices, pageQuery(page, pageSize), nullptr);
    if (!body) {
        return ClientResult<Page<Device>>::failure(body.error());
    }
    return parseDevicePage(body.value(), page);
}

ClientResult<Page<Task>> HttpFleetClient::listTasks(int page, int pageSize)
{
    const auto body = request("GET", kEndpointTasks, pageQuery(page, pageSize), nullptr);
    if (!body) {
        return ClientResult<Page<Task>>::failure(body.error());
    }
    return parseTaskPage(body.value(), page);
}

ClientResult<AccountStatistics> HttpFleetClient::getAccountStatistics()
{
    const auto body = request("GET", kEndpointCompanyStats, QUrlQuery(), nullptr);
    if (!body) {
        return ClientResult<AccountStatistics>::failure(body.error());
    }
    if (!body.value().is_object()) {
        return ClientResult<AccountStatistics>::failure(
            apiError("Malformed statistics response: expected an object"));
    }
    return ClientResult<AccountStatistics>::success(parseAccountStatistics(body.value()));
}

ClientResult<Ack> HttpFleetClient::cancelTasks(const std::vector<int> &taskIds)
{
    return request("POST", kEndpointTasksBulkCancel, QUrlQuery(),
                   nlohmann::json{{"id_list", taskIds}});
}

ClientResult<Ack> HttpFleetClient::createFirmwareTask(const std::string &deviceId,
                                                      int firmwareId)
{
    return request("POST", kEndpointTasks, QUrlQuery(),
                   nlohmann::json{{"imei", deviceId},
                                  {"firmware_id", firmwareId},
                                  {"type", "firmware"}});
}

ClientResult<Ack> HttpFleetClient::createConfigurationTask(const std::string &deviceId,
                                                           int configurationId)
{
    return request("POST", kEndpointTasks, QUrlQuery(),
                   nlohmann::json{{"imei", deviceId},
                                  {"configuration_id", configurationId},
                                  {"type", "configuration"}});
}

ClientResult<Ack> HttpFleetClient::retryFailedTasks(int batchId)
{
    return request("POST",
                   kEndpointBatches + QStringLiteral("/%1/retryFailedTasks").arg(batchId),
                   QUrlQuery(), nullptr);
}

ClientResult<nlohmann::json> HttpFleetClient::getBatch(int batchId)
{
    return request("GET", kEndpointBatches + QStringLiteral("/%1").arg(batchId),
                   QUrlQuery(), nullptr);
}

ClientResult<AccountStatistics> HttpFleetClient::validateToken()
{
    return getAccountStatistics();
}

ClientResult<nlohmann::json> HttpFleetClient::request(const QByteArray &verb,
                                                      const QString &endpoint,
                                                      const QUrlQuery &query,
                                                      const nlohmann::json &body)
{
    QUrl url(QString::fromStdString(m_options.baseUrl) + endpoint);
    if (!query.isEmpty()) {
        url.setQuery(query);
    }

    QNetworkRequest networkRequest(url);
    networkRequest.setRawHeader("Authorization",
                                "Bearer " + QByteArray::fromStdString(m_options.apiToken));
    networkRequest.setHeader(QNetworkRequest::ContentTypeHeader,
                             QStringLiteral("application/json"));
    networkRequest.setRawHeader("Accept", "application/json");
    networkRequest.setTransferTimeout(
        static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                             m_options.timeout)
                             .count()));

    QNetworkAccessManager manager;
    QNetworkReply *rawReply = nullptr;
    if (verb == "GET") {
        rawReply = manager.get(networkRequest);
    } else {
        const QByteArray payload = body.is_null()
            ? QByteArray()
            : QByteArray::fromStdString(body.dump());
        rawReply = manager.sendCustomRequest(networkRequest, verb, payload);
    }
    std::unique_ptr<QNetworkReply> reply(rawReply);

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }
    if (!reply->isFinished()) {
        // The owning thread was asked to quit while we waited.
        reply->abort();
        return ClientResult<nlohmann::json>::failure(
            apiError("Connection error: request interrupted"));
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray payload = reply->readAll();

    FSLOG_DEBUG(QStringLiteral("HttpFleetClient"),
                QStringLiteral("request"),
                QStringLiteral("api_request_completed"),
                QStringLiteral("fleet_sync"),
                QStringLiteral("https"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"method", verb.toStdString()},
                                {"endpoint", endpoint.toStdString()},
                                {"status", status},
                                {"bytes", payload.size()}}));

    if (status == 401) {
        return ClientResult<nlohmann::json>::failure(
            authenticationError("Invalid or expired API token", status));
    }
    if (status == 403) {
        return ClientResult<nlohmann::json>::failure(
            authenticationError("Access forbidden", status));
    }
    if (reply->error() != QNetworkReply::NoError) {
        FSLOG_WARN(QStringLiteral("HttpFleetClient"),
                   QStringLiteral("request"),
                   QStringLiteral("api_request_failed"),
                   QStringLiteral("network_error"),
                   QStringLiteral("https"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"endpoint", endpoint.toStdString()},
                                   {"status", status},
                                   {"error", reply->errorString().toStdString()}}));
        return ClientResult<nlohmann::json>::failure(
            apiError("Connection error: " + reply->errorString().toStdString(), status));
    }

    if (payload.trimmed().isEmpty()) {
        return ClientResult<nlohmann::json>::success(nlohmann::json::object());
    }

    auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        return ClientResult<nlohmann::json>::failure(
            apiError("Invalid JSON response from " + endpoint.toStdString(), status));
    }
    return ClientResult<nlohmann::json>::success(std::move(parsed));
}

} // namespace fleetsync
