#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/cancellation.hpp"
#include "common/models.hpp"
#include "common/triage_error.hpp"
#include "daemon/completion_client.hpp"

namespace triage {

// InsightGenerator asks the language model for structured resolution insights.
// Replies must match a fixed JSON schema; anything else yields a fallback.
class InsightGenerator {
public:
    InsightGenerator(CompletionClient *model,
                     bool enabled,
                     std::chrono::milliseconds timeout);

    static std::string buildPrompt(const std::string &title,
                                   const std::string &description,
                                   const std::vector<SimilarIssue> &similar);

    // Strict schema check. A reply that is not a matching JSON object becomes
    // the "pending" fallback carrying the first 200 characters of the reply.
    static AiInsights parseReply(const std::string &reply);

    // Used when the model is disabled or unreachable.
    static AiInsights unavailableFallback();

    // Fails only with Cancelled.
    Outcome<AiInsights> generate(const std::string &title,
                                 const std::string &description,
                                 const std::vector<SimilarIssue> &similar,
                                 const CancellationToken &cancel) const;

private:
    CompletionClient *m_model;
    bool m_enabled;
    std::chrono::milliseconds m_timeout;
};

} // namespace triage
