#include "daemon/triage_api_server.hpp"

#include <algorithm>
#include <chrono>
#include <optional>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>
#include <QUuid>

#include <unistd.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

QString runtimeSocketPath(const TriageConfig &config)
{
    const QString socketName = qEnvironmentVariable("TRIAGE_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }
    if (!config.socketName.empty()) {
        return QString::fromStdString(config.socketName);
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/triage.sock");
}

TriageError invalidParam(const std::string &name)
{
    return makeError(ErrorKind::InvalidInput, "missing or invalid parameter: " + name);
}

Outcome<std::int64_t> requireId(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_number_integer() || it->get<std::int64_t>() <= 0) {
        return invalidParam(key);
    }
    return it->get<std::int64_t>();
}

Outcome<std::optional<std::int64_t>> optionalId(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::optional<std::int64_t>{};
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
        return invalidParam(key);
    }
    return std::optional<std::int64_t>{it->get<std::int64_t>()};
}

Outcome<std::string> requireString(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return invalidParam(key);
    }
    return it->get<std::string>();
}

// Parses an optional enum parameter by name; an unknown name is invalid input.
template <typename Enum, typename Parser>
Outcome<std::optional<Enum>> optionalEnum(const nlohmann::json &params,
                                          const char *key,
                                          Parser parse)
{
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::optional<Enum>{};
    }
    if (!it->is_string()) {
        return invalidParam(key);
    }
    const auto parsed = parse(it->get<std::string>());
    if (!parsed) {
        return makeError(ErrorKind::InvalidInput,
                         std::string("unknown ") + key + ": " + it->get<std::string>());
    }
    return std::optional<Enum>{*parsed};
}

int intParam(const nlohmann::json &params, const char *key, int fallback)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int>();
}

template <typename T>
Outcome<nlohmann::json> toResult(const Outcome<T> &outcome)
{
    if (!outcome) {
        return outcome.error();
    }
    return nlohmann::json(outcome.value());
}

template <typename T>
Outcome<nlohmann::json> toResult(const Outcome<T> &outcome, const char *field)
{
    if (!outcome) {
        return outcome.error();
    }
    nlohmann::json result;
    result[field] = outcome.value();
    return result;
}

} // namespace

TriageApiServer::TriageApiServer(TriageEngine &engine, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
{
}

TriageApiServer::~TriageApiServer() = default;

bool TriageApiServer::start()
{
    const QString socketPath = runtimeSocketPath(m_engine.config());
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing triage socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on triage socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &TriageApiServer::handleNewConnection);

    qInfo() << "Triage API server listening on" << socketPath;
    return true;
}

void TriageApiServer::shutdown()
{
    m_cancel.cancel();
    m_server.close();
}

void TriageApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &TriageApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void TriageApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void TriageApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray TriageApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TLOG_WARN(QStringLiteral("TriageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"),
                                 QStringLiteral("invalid_input"));
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        TLOG_WARN(QStringLiteral("TriageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Missing method"),
                                 QStringLiteral("invalid_input"), id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse(QStringLiteral("Invalid params"),
                                     QStringLiteral("invalid_input"), id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    TLOG_INFO(QStringLiteral("TriageApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                              {"paramKeys", paramKeys}}));

    if (m_cancel.isCancelled()) {
        return makeErrorResponse(QStringLiteral("Server is shutting down"),
                                 QStringLiteral("cancelled"), id);
    }

    const auto start = std::chrono::steady_clock::now();
    try {
        const auto outcome = dispatch(method, params);
        const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start)
                                    .count();
        if (!outcome) {
            const TriageError &error = outcome.error();
            TLOG_WARN(QStringLiteral("TriageApiServer"),
                      QStringLiteral("handleRequest"),
                      QStringLiteral("api_request_error"),
                      QString::fromStdString(errorKindName(error.kind)),
                      QStringLiteral("json_rpc"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"method", method},
                                      {"error", error.message},
                                      {"durationMs", durationMs}}));
            return makeErrorResponse(QString::fromStdString(error.message),
                                     QString::fromStdString(errorKindName(error.kind)),
                                     id);
        }

        TLOG_INFO(QStringLiteral("TriageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method},
                                  {"durationMs", durationMs}}));
        return makeResultResponse(outcome.value(), id);
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("TriageApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QStringLiteral("Internal error"),
                                 QStringLiteral("internal"), id);
    }
}

Outcome<nlohmann::json> TriageApiServer::dispatch(const std::string &method,
                                                  const nlohmann::json &params)
{
    if (method == "health") {
        return nlohmann::json{{"status", "ok"}, {"config", configToJson(m_engine.config())}};
    }

    if (method == "analyze_issue") {
        const auto customerId = requireId(params, "customerId");
        if (!customerId) {
            return customerId.error();
        }
        const auto category = optionalEnum<IssueCategory>(params, "category", parseCategoryString);
        if (!category) {
            return category.error();
        }
        NewIssueRequest request;
        request.customerId = customerId.value();
        request.title = params.value("title", "");
        request.description = params.value("description", "");
        request.category = category.value().value_or(IssueCategory::General);
        request.productArea = params.value("productArea", "");
        return toResult(m_engine.analyzeNewIssue(request, m_cancel));
    }

    if (method == "classify") {
        return toResult(m_engine.classify(params.value("title", ""),
                                          params.value("description", ""),
                                          m_cancel));
    }

    if (method == "rank_similar") {
        const int limit = intParam(params, "limit", m_engine.config().similarLimit);
        if (params.contains("issueId")) {
            const auto issueId = requireId(params, "issueId");
            if (!issueId) {
                return issueId.error();
            }
            return toResult(m_engine.rankSimilarIssue(issueId.value(), limit, m_cancel),
                            "similarIssues");
        }
        return toResult(m_engine.rankSimilarText(params.value("title", ""),
                                                 params.value("description", ""),
                                                 limit, m_cancel),
                        "similarIssues");
    }

    if (method == "score_risk") {
        const auto customerId = requireId(params, "customerId");
        if (!customerId) {
            return customerId.error();
        }
        const auto policy = optionalEnum<RiskPolicy>(params, "policy", parsePolicyString);
        if (!policy) {
            return policy.error();
        }
        return toResult(m_engine.scoreRisk(customerId.value(),
                                           policy.value().value_or(RiskPolicy::History)));
    }

    if (method == "score_priority") {
        const auto severity = optionalEnum<Severity>(params, "severity", parseSeverityString);
        const auto tier = optionalEnum<CustomerTier>(params, "tier", parseTierString);
        const auto risk = optionalEnum<RiskLevel>(params, "riskLevel", parseRiskLevelString);
        if (!severity || !severity.value()) {
            return severity ? invalidParam("severity") : severity.error();
        }
        if (!tier) {
            return tier.error();
        }
        if (!risk) {
            return risk.error();
        }
        const int similarCount = std::max(0, intParam(params, "similarCount", 0));
        const int priority = TriageEngine::scorePriority(*severity.value(),
                                                         tier.value().value_or(CustomerTier::Basic),
                                                         risk.value().value_or(RiskLevel::Low),
                                                         static_cast<std::size_t>(similarCount));
        return nlohmann::json{{"priority", priority}};
    }

    if (method == "detect_critical") {
        const auto customerId = requireId(params, "customerId");
        if (!customerId) {
            return customerId.error();
        }
        return toResult(m_engine.detectCriticalConditions(customerId.value(), m_cancel),
                        "alerts");
    }

    if (method == "customer_history") {
        const auto customerId = requireId(params, "customerId");
        if (!customerId) {
            return customerId.error();
        }
        return toResult(m_engine.customerHistory(customerId.value()));
    }

    if (method == "customer_risk") {
        return toResult(m_engine.customerRiskAnalysis(intParam(params, "limit", 50)),
                        "customers");
    }

    if (method == "list_alerts") {
        const auto status = optionalEnum<AlertStatus>(params, "status", parseAlertStatusString);
        if (!status) {
            return status.error();
        }
        const auto customerId = optionalId(params, "customerId");
        if (!customerId) {
            return customerId.error();
        }
        return toResult(m_engine.listAlerts(status.value(), customerId.value()), "alerts");
    }

    if (method == "acknowledge_alert") {
        const auto alertId = requireId(params, "alertId");
        if (!alertId) {
            return alertId.error();
        }
        const auto actor = requireString(params, "actor");
        if (!actor) {
            return actor.error();
        }
        return toResult(m_engine.acknowledgeAlert(alertId.value(), actor.value()), "alert");
    }

    if (method == "resolve_alert") {
        const auto alertId = requireId(params, "alertId");
        if (!alertId) {
            return alertId.error();
        }
        return toResult(m_engine.resolveAlert(alertId.value()), "alert");
    }

    if (method == "update_issue_status") {
        const auto issueId = requireId(params, "issueId");
        if (!issueId) {
            return issueId.error();
        }
        const auto status = optionalEnum<IssueStatus>(params, "status", parseStatusString);
        if (!status) {
            return status.error();
        }
        if (!status.value()) {
            return invalidParam("status");
        }
        return toResult(m_engine.updateIssueStatus(issueId.value(), *status.value()), "issue");
    }

    if (method == "get_issue") {
        const auto issueId = requireId(params, "issueId");
        if (!issueId) {
            return issueId.error();
        }
        return toResult(m_engine.getIssue(issueId.value()), "issue");
    }

    if (method == "list_issues") {
        IssueFilter filter;
        const auto customerId = optionalId(params, "customerId");
        const auto status = optionalEnum<IssueStatus>(params, "status", parseStatusString);
        const auto severity = optionalEnum<Severity>(params, "severity", parseSeverityString);
        if (!customerId) {
            return customerId.error();
        }
        if (!status) {
            return status.error();
        }
        if (!severity) {
            return severity.error();
        }
        filter.customerId = customerId.value();
        filter.status = status.value();
        filter.severity = severity.value();
        if (params.contains("since")) {
            const auto since = fromIso8601Utc(params.value("since", ""));
            if (since == std::chrono::system_clock::time_point{}) {
                return invalidParam("since");
            }
            filter.createdAfter = since;
        }
        filter.limit = intParam(params, "limit", filter.limit);
        filter.offset = intParam(params, "offset", filter.offset);
        return toResult(m_engine.listIssues(filter), "issues");
    }

    if (method == "add_resolution") {
        const auto issueId = requireId(params, "issueId");
        if (!issueId) {
            return issueId.error();
        }
        IssueResolution resolution;
        resolution.issueId = issueId.value();
        resolution.summary = params.value("summary", "");
        const auto satisfaction = params.find("customerSatisfaction");
        if (satisfaction != params.end() && !satisfaction->is_null()) {
            if (!satisfaction->is_number_integer()) {
                return invalidParam("customerSatisfaction");
            }
            resolution.customerSatisfaction = satisfaction->get<int>();
        }
        return toResult(m_engine.addResolution(resolution), "resolution");
    }

    return makeError(ErrorKind::InvalidInput, "Unknown method: " + method);
}

QByteArray TriageApiServer::makeErrorResponse(const QString &message,
                                              const QString &code,
                                              int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["code"] = code.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

QByteArray TriageApiServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace triage
