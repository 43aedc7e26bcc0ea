#pragma once

#include <chrono>
#include <string>

#include "common/cancellation.hpp"
#include "common/triage_error.hpp"

namespace triage {

// Single request/response text completion against a language model.
class CompletionClient {
public:
    virtual ~CompletionClient() = default;

    // Returns the model's reply text. Unreachable, timed out or malformed replies
    // fail with CollaboratorUnavailable; a cancelled token fails with Cancelled.
    virtual Outcome<std::string> complete(const std::string &prompt,
                                          int maxTokens,
                                          double temperature,
                                          std::chrono::milliseconds timeout,
                                          const CancellationToken &cancel) = 0;
};

} // namespace triage
