#pragma once

#include <string>

#include "daemon/completion_client.hpp"

namespace triage {

// HttpCompletionClient posts to an OpenAI-style chat-completions endpoint and
// returns choices[0].message.content.
class HttpCompletionClient : public CompletionClient {
public:
    HttpCompletionClient(std::string baseUrl,
                         std::string path,
                         std::string model,
                         std::string apiKey);

    Outcome<std::string> complete(const std::string &prompt,
                                  int maxTokens,
                                  double temperature,
                                  std::chrono::milliseconds timeout,
                                  const CancellationToken &cancel) override;

    bool hasCredentials() const;

private:
    std::string m_baseUrl;
    std::string m_path;
    std::string m_model;
    std::string m_apiKey;
};

} // namespace triage
