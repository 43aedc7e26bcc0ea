#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "common/cancellation.hpp"
#include "common/triage_error.hpp"
#include "daemon/triage_engine.hpp"

namespace triage {

/**
 * TriageApiServer exposes the triage engine over a local UNIX socket
 * using a minimal JSON-RPC-like protocol.
 *
 * Request:  {"id": 1, "method": "analyze_issue", "params": {...}}
 * Success:  {"id": 1, "result": {...}}
 * Failure:  {"id": 1, "error": "message", "code": "not_found"}
 */
class TriageApiServer : public QObject
{
    Q_OBJECT
public:
    explicit TriageApiServer(TriageEngine &engine, QObject *parent = nullptr);
    ~TriageApiServer() override;

    // Listen on TRIAGE_SOCKET_NAME, or the configured socket path.
    bool start();
    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

    // Cancels the in-flight request, if any; later requests are refused.
    void shutdown();

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    Outcome<nlohmann::json> dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message,
                                 const QString &code,
                                 int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    TriageEngine &m_engine;
    CancellationToken m_cancel;
    QLocalServer m_server;
};

} // namespace triage
