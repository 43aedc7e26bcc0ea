#include "daemon/severity_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

constexpr double kWeakSignalThreshold = 2.0;
constexpr int kModelMaxTokens = 10;
constexpr double kModelTemperature = 0.1;

struct KeywordSet {
    Severity severity;
    double weight;
    std::vector<std::string> keywords;
};

const std::vector<KeywordSet> &keywordSets()
{
    static const std::vector<KeywordSet> sets = {
        {Severity::Critical, 3.0,
         {"system down", "outage", "cannot access", "complete failure", "data loss",
          "security breach", "urgent", "emergency", "production down",
          "service unavailable"}},
        {Severity::High, 2.0,
         {"major issue", "significant problem", "blocking", "broken", "not working",
          "error", "failure", "important", "affecting multiple users",
          "performance issue"}},
        {Severity::Normal, 1.0,
         {"question", "help", "how to", "clarification", "minor issue", "improvement",
          "suggestion"}},
        {Severity::Low, 0.5,
         {"feature request", "enhancement", "nice to have", "cosmetic", "documentation",
          "typo"}},
    };
    return sets;
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
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

double maxScore(const SeverityDecision &decision)
{
    return *std::max_element(std::begin(decision.scores), std::end(decision.scores));
}

} // namespace

SeverityClassifier::SeverityClassifier(CompletionClient *model,
                                       bool modelEnabled,
                                       std::chrono::milliseconds modelTimeout)
    : m_model(model)
    , m_modelEnabled(modelEnabled)
    , m_modelTimeout(modelTimeout)
{
}

SeverityDecision SeverityClassifier::scoreKeywords(const std::string &title,
                                                   const std::string &description)
{
    const std::string content = toLower(title + " " + description);

    SeverityDecision decision;
    for (const auto &set : keywordSets()) {
        double score = 0.0;
        for (const auto &keyword : set.keywords) {
            if (content.find(keyword) != std::string::npos) {
                score += set.weight;
            }
        }
        decision.scores[static_cast<int>(set.severity)] = score;
    }

    if (maxScore(decision) <= 0.0) {
        decision.severity = Severity::Normal;
        decision.source = SeveritySource::Default;
        return decision;
    }

    // Walk from most to least severe so ties resolve upward.
    Severity best = Severity::Critical;
    double bestScore = -1.0;
    for (int level = static_cast<int>(Severity::Critical);
         level >= static_cast<int>(Severity::Low); --level) {
        if (decision.scores[level] > bestScore) {
            bestScore = decision.scores[level];
            best = static_cast<Severity>(level);
        }
    }
    decision.severity = best;
    decision.source = SeveritySource::Keywords;
    return decision;
}

std::string SeverityClassifier::buildPrompt(const std::string &title,
                                            const std::string &description)
{
    return "Analyze the following support issue and classify its severity as "
           "Critical, High, Normal, or Low.\n\n"
           "Title: " + title + "\n"
           "Description: " + description + "\n\n"
           "Severity Guidelines:\n"
           "- Critical: System outages, data loss, security breaches, complete service "
           "unavailability\n"
           "- High: Major functionality broken, significant user impact, blocking issues\n"
           "- Normal: Standard issues, questions, minor bugs with workarounds\n"
           "- Low: Feature requests, cosmetic issues, documentation updates\n\n"
           "Respond with only the severity level: Critical, High, Normal, or Low";
}

Outcome<SeverityDecision> SeverityClassifier::classify(const std::string &title,
                                                       const std::string &description,
                                                       const CancellationToken &cancel) const
{
    SeverityDecision decision = scoreKeywords(title, description);
    if (maxScore(decision) >= kWeakSignalThreshold || !m_modelEnabled || !m_model) {
        return decision;
    }

    auto reply = m_model->complete(buildPrompt(title, description),
                                   kModelMaxTokens,
                                   kModelTemperature,
                                   m_modelTimeout,
                                   cancel);
    if (!reply) {
        if (reply.error().kind == ErrorKind::Cancelled) {
            return reply.error();
        }
        TLOG_WARN(QStringLiteral("SeverityClassifier"),
                  QStringLiteral("classify"),
                  QStringLiteral("model_classification_skipped"),
                  QString::fromStdString(errorKindName(reply.error().kind)),
                  QStringLiteral("keyword_fallback"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", reply.error().message}}));
        return decision;
    }

    const std::string answer = trim(reply.value());
    const auto parsed = parseSeverityString(answer);
    if (!parsed) {
        TLOG_DEBUG(QStringLiteral("SeverityClassifier"),
                   QStringLiteral("classify"),
                   QStringLiteral("model_answer_rejected"),
                   QStringLiteral("not_a_level_name"),
                   QStringLiteral("keyword_fallback"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"answer", answer}}));
        return decision;
    }

    decision.severity = *parsed;
    decision.source = SeveritySource::Model;
    return decision;
}

} // namespace triage
