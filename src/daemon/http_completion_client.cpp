#include "daemon/http_completion_client.hpp"

#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace triage {

namespace {

void logCompletionFailure(const std::string &reason, const nlohmann::json &context)
{
    TLOG_WARN(QStringLiteral("HttpCompletionClient"),
              QStringLiteral("complete"),
              QStringLiteral("completion_failed"),
              QString::fromStdString(reason),
              QStringLiteral("http_post"),
              logging::defaultWho(),
              QString(),
              context);
}

std::pair<time_t, time_t> splitTimeout(std::chrono::milliseconds timeout)
{
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
    return {static_cast<time_t>(seconds.count()), static_cast<time_t>(micros.count())};
}

} // namespace

HttpCompletionClient::HttpCompletionClient(std::string baseUrl,
                                           std::string path,
                                           std::string model,
                                           std::string apiKey)
    : m_baseUrl(std::move(baseUrl))
    , m_path(std::move(path))
    , m_model(std::move(model))
    , m_apiKey(std::move(apiKey))
{
}

bool HttpCompletionClient::hasCredentials() const
{
    return !m_apiKey.empty();
}

Outcome<std::string> HttpCompletionClient::complete(const std::string &prompt,
                                                    int maxTokens,
                                                    double temperature,
                                                    std::chrono::milliseconds timeout,
                                                    const CancellationToken &cancel)
{
    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "completion cancelled");
    }
    if (!hasCredentials()) {
        return makeError(ErrorKind::CollaboratorUnavailable, "no completion API key configured");
    }

    httplib::Client cli(m_baseUrl);
    if (!cli.is_valid()) {
        logCompletionFailure("invalid_endpoint", nlohmann::json{{"url", m_baseUrl}});
        return makeError(ErrorKind::CollaboratorUnavailable, "invalid completion endpoint");
    }
    const auto split = splitTimeout(timeout);
    cli.set_connection_timeout(split.first, split.second);
    cli.set_read_timeout(split.first, split.second);
    cli.set_write_timeout(split.first, split.second);

    const nlohmann::json body = {
        {"model", m_model},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })},
        {"max_tokens", maxTokens},
        {"temperature", temperature}
    };
    const httplib::Headers headers = {
        {"Authorization", "Bearer " + m_apiKey}
    };

    // Aborts the in-flight request from the cancelling thread.
    CancelRegistration registration(cancel, [&cli]() { cli.stop(); });

    auto res = cli.Post(m_path, headers, body.dump(), "application/json");
    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "completion cancelled");
    }
    if (!res) {
        const int code = static_cast<int>(res.error());
        logCompletionFailure("transport_error", nlohmann::json{{"error", code}});
        return makeError(ErrorKind::CollaboratorUnavailable,
                         "completion request failed (httplib error " + std::to_string(code) + ")");
    }
    if (res->status != 200) {
        logCompletionFailure("http_status", nlohmann::json{{"status", res->status}});
        return makeError(ErrorKind::CollaboratorUnavailable,
                         "completion endpoint returned HTTP " + std::to_string(res->status));
    }

    const auto reply = nlohmann::json::parse(res->body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        logCompletionFailure("invalid_json", nlohmann::json::object());
        return makeError(ErrorKind::CollaboratorUnavailable, "completion reply is not JSON");
    }

    const auto choices = reply.find("choices");
    if (choices == reply.end() || !choices->is_array() || choices->empty()) {
        logCompletionFailure("missing_choices", nlohmann::json::object());
        return makeError(ErrorKind::CollaboratorUnavailable, "completion reply has no choices");
    }
    const auto &first = choices->front();
    if (!first.is_object() || !first.contains("message") || !first.at("message").is_object()) {
        return makeError(ErrorKind::CollaboratorUnavailable, "completion reply has no message");
    }
    const auto &message = first.at("message");
    const auto content = message.find("content");
    if (content == message.end() || !content->is_string()) {
        return makeError(ErrorKind::CollaboratorUnavailable, "completion reply has no content");
    }

    TLOG_DEBUG(QStringLiteral("HttpCompletionClient"),
               QStringLiteral("complete"),
               QStringLiteral("completion_received"),
               QStringLiteral("http_post"),
               QStringLiteral("chat_completions"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"model", m_model}, {"chars", content->get<std::string>().size()}}));

    return content->get<std::string>();
}

} // namespace triage
