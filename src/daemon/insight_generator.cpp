#include "daemon/insight_generator.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

constexpr int kMaxTokens = 500;
constexpr double kTemperature = 0.3;
constexpr std::size_t kPromptSimilarCount = 3;
constexpr std::size_t kFallbackApproachChars = 200;

std::string formatHours(const std::optional<double> &hours)
{
    if (!hours) {
        return "N/A";
    }
    std::ostringstream out;
    out << *hours;
    return out.str();
}

AiInsights pendingFallback(const std::string &reply)
{
    AiInsights insights;
    insights.rootCause = "AI analysis pending";
    insights.resolutionApproach = utf8Prefix(reply, kFallbackApproachChars);
    insights.estimatedHours = 24.0;
    insights.escalationTriggers = {"No response in 4 hours", "Customer escalation"};
    insights.communicationStrategy = "Regular updates every 2 hours";
    return insights;
}

std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

InsightGenerator::InsightGenerator(CompletionClient *model,
                                   bool enabled,
                                   std::chrono::milliseconds timeout)
    : m_model(model)
    , m_enabled(enabled)
    , m_timeout(timeout)
{
}

std::string InsightGenerator::buildPrompt(const std::string &title,
                                          const std::string &description,
                                          const std::vector<SimilarIssue> &similar)
{
    std::string context;
    for (std::size_t i = 0; i < similar.size() && i < kPromptSimilarCount; ++i) {
        if (!context.empty()) {
            context += "\n";
        }
        context += "- " + similar[i].title + " (resolved in "
            + formatHours(similar[i].resolutionHours) + " hours)";
    }

    return "Analyze this support issue and provide insights:\n\n"
           "Title: " + title + "\n"
           "Description: " + description + "\n\n"
           "Similar resolved issues:\n" + context + "\n\n"
           "Please provide:\n"
           "1. Root cause analysis (2-3 sentences)\n"
           "2. Recommended resolution approach\n"
           "3. Estimated resolution time\n"
           "4. Potential escalation triggers\n"
           "5. Customer communication strategy\n\n"
           "Format as JSON with keys: root_cause, resolution_approach, "
           "estimated_time_hours, escalation_triggers, communication_strategy";
}

AiInsights InsightGenerator::parseReply(const std::string &reply)
{
    const std::string text = trim(reply);
    const auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return pendingFallback(text);
    }

    const auto stringField = [&json](const char *key) {
        return json.contains(key) && json.at(key).is_string();
    };
    if (!stringField("root_cause") || !stringField("resolution_approach")
        || !stringField("communication_strategy")
        || !json.contains("estimated_time_hours") || !json.at("estimated_time_hours").is_number()
        || !json.contains("escalation_triggers") || !json.at("escalation_triggers").is_array()) {
        return pendingFallback(text);
    }
    for (const auto &trigger : json.at("escalation_triggers")) {
        if (!trigger.is_string()) {
            return pendingFallback(text);
        }
    }
    const double hours = json.at("estimated_time_hours").get<double>();
    if (hours < 0.0) {
        return pendingFallback(text);
    }

    AiInsights insights;
    insights.rootCause = json.at("root_cause").get<std::string>();
    insights.resolutionApproach = json.at("resolution_approach").get<std::string>();
    insights.estimatedHours = hours;
    insights.escalationTriggers = json.at("escalation_triggers").get<std::vector<std::string>>();
    insights.communicationStrategy = json.at("communication_strategy").get<std::string>();
    return insights;
}

AiInsights InsightGenerator::unavailableFallback()
{
    AiInsights insights;
    insights.rootCause = "Analysis pending";
    insights.resolutionApproach = "Standard troubleshooting process";
    insights.estimatedHours = 24.0;
    insights.escalationTriggers = {"No response in 4 hours"};
    insights.communicationStrategy = "Regular updates";
    return insights;
}

Outcome<AiInsights> InsightGenerator::generate(const std::string &title,
                                               const std::string &description,
                                               const std::vector<SimilarIssue> &similar,
                                               const CancellationToken &cancel) const
{
    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "insight generation cancelled");
    }
    if (!m_enabled || !m_model) {
        return unavailableFallback();
    }

    auto reply = m_model->complete(buildPrompt(title, description, similar),
                                   kMaxTokens, kTemperature, m_timeout, cancel);
    if (!reply) {
        if (reply.error().kind == ErrorKind::Cancelled) {
            return reply.error();
        }
        TLOG_WARN(QStringLiteral("InsightGenerator"),
                  QStringLiteral("generate"),
                  QStringLiteral("insights_unavailable"),
                  QString::fromStdString(errorKindName(reply.error().kind)),
                  QStringLiteral("default_insights"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", reply.error().message}}));
        return unavailableFallback();
    }
    return parseReply(reply.value());
}

} // namespace triage
