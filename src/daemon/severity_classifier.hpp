#pragma once

#include <chrono>
#include <string>

#include "common/cancellation.hpp"
#include "common/models.hpp"
#include "common/triage_error.hpp"
#include "daemon/completion_client.hpp"

namespace triage {

// SeverityClassifier maps issue text to a Severity using weighted keyword sets.
// When the keyword signal is weak it asks the language model, accepting only an
// exact level name.
class SeverityClassifier {
public:
    // model may be null; the classifier then runs on keywords alone.
    SeverityClassifier(CompletionClient *model,
                       bool modelEnabled,
                       std::chrono::milliseconds modelTimeout);

    // Keyword pass only. Never calls the model.
    static SeverityDecision scoreKeywords(const std::string &title,
                                          const std::string &description);

    static std::string buildPrompt(const std::string &title, const std::string &description);

    // Fails only with Cancelled.
    Outcome<SeverityDecision> classify(const std::string &title,
                                       const std::string &description,
                                       const CancellationToken &cancel) const;

private:
    CompletionClient *m_model;
    bool m_modelEnabled;
    std::chrono::milliseconds m_modelTimeout;
};

} // namespace triage
