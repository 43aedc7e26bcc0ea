#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/cancellation.hpp"
#include "common/models.hpp"
#include "common/triage_error.hpp"
#include "daemon/issue_store.hpp"

namespace triage {

struct SimilarityOptions {
    int corpusLimit = 1000;
    int maxFeatures = 1000;
    double threshold = 0.1;
    std::chrono::milliseconds storeTimeout{5000};
};

// SimilarityRanker ranks recently resolved issues by TF-IDF cosine similarity
// to a query. Vectors are recomputed on every call; there is no persistent index.
class SimilarityRanker {
public:
    SimilarityRanker(IssueStore &store, SimilarityOptions options);

    // Ranks corpus against queryText. Stable descending order, first `limit`
    // entries, then scores <= threshold dropped.
    static std::vector<SimilarIssue> rankCorpus(const std::string &queryText,
                                                const std::vector<Issue> &corpus,
                                                int limit,
                                                int maxFeatures,
                                                double threshold,
                                                std::int64_t sourceIssueId = 0);

    // First 200 code points followed by "...".
    static std::string truncateDescription(const std::string &description);

    // An unavailable corpus yields an empty list. Fails only on invalid
    // input or cancellation.
    Outcome<std::vector<SimilarIssue>> rankText(const std::string &title,
                                                const std::string &description,
                                                int limit,
                                                const CancellationToken &cancel) const;

    // Ranks a stored issue's own text; the issue itself is never a candidate.
    Outcome<std::vector<SimilarIssue>> rankForIssue(std::int64_t issueId,
                                                    int limit,
                                                    const CancellationToken &cancel) const;

private:
    IssueStore &m_store;
    SimilarityOptions m_options;

    Outcome<std::vector<SimilarIssue>> rank(const std::string &queryText,
                                            std::int64_t excludeIssueId,
                                            int limit,
                                            const CancellationToken &cancel) const;
};

} // namespace triage
