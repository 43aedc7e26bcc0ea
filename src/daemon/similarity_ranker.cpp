#include "daemon/similarity_ranker.hpp"

#include <algorithm>
#include <numeric>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/tfidf_vectorizer.hpp"

namespace triage {

namespace {

constexpr std::size_t kDescriptionPreviewChars = 200;

void logCorpusUnavailable(const TriageError &error)
{
    TLOG_WARN(QStringLiteral("SimilarityRanker"),
              QStringLiteral("rank"),
              QStringLiteral("corpus_unavailable"),
              QString::fromStdString(errorKindName(error.kind)),
              QStringLiteral("empty_result"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"error", error.message}}));
}

} // namespace

SimilarityRanker::SimilarityRanker(IssueStore &store, SimilarityOptions options)
    : m_store(store)
    , m_options(options)
{
}

std::string SimilarityRanker::truncateDescription(const std::string &description)
{
    return utf8Prefix(description, kDescriptionPreviewChars) + "...";
}

std::vector<SimilarIssue> SimilarityRanker::rankCorpus(const std::string &queryText,
                                                       const std::vector<Issue> &corpus,
                                                       int limit,
                                                       int maxFeatures,
                                                       double threshold,
                                                       std::int64_t sourceIssueId)
{
    if (corpus.empty() || limit <= 0) {
        return {};
    }

    std::vector<std::string> documents;
    documents.reserve(corpus.size() + 1);
    for (const auto &issue : corpus) {
        documents.push_back(issue.title + " " + issue.description);
    }
    documents.push_back(queryText);

    TfidfVectorizer vectorizer(maxFeatures);
    const auto vectors = vectorizer.fitTransform(documents);
    const auto &query = vectors.back();

    std::vector<double> scores(corpus.size(), 0.0);
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        scores[i] = TfidfVectorizer::cosine(query, vectors[i]);
    }

    std::vector<std::size_t> order(corpus.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scores](std::size_t a, std::size_t b) {
        return scores[a] > scores[b];
    });
    if (order.size() > static_cast<std::size_t>(limit)) {
        order.resize(static_cast<std::size_t>(limit));
    }

    std::vector<SimilarIssue> results;
    for (const std::size_t idx : order) {
        if (scores[idx] <= threshold) {
            continue;
        }
        const Issue &issue = corpus[idx];
        SimilarIssue similar;
        similar.sourceIssueId = sourceIssueId;
        similar.issueId = issue.id;
        similar.title = issue.title;
        similar.description = truncateDescription(issue.description);
        similar.severity = issue.severity;
        similar.score = scores[idx];
        similar.resolutionHours = issue.resolutionHours;
        results.push_back(std::move(similar));
    }
    return results;
}

Outcome<std::vector<SimilarIssue>> SimilarityRanker::rankText(const std::string &title,
                                                              const std::string &description,
                                                              int limit,
                                                              const CancellationToken &cancel) const
{
    if (title.empty() && description.empty()) {
        return makeError(ErrorKind::InvalidInput, "similarity query needs a title or description");
    }
    return rank(title + " " + description, 0, limit, cancel);
}

Outcome<std::vector<SimilarIssue>> SimilarityRanker::rankForIssue(std::int64_t issueId,
                                                                  int limit,
                                                                  const CancellationToken &cancel) const
{
    if (issueId <= 0) {
        return makeError(ErrorKind::InvalidInput, "issue id must be positive");
    }
    auto issue = m_store.getIssue(issueId);
    if (!issue) {
        if (issue.error().kind == ErrorKind::NotFound) {
            return issue.error();
        }
        logCorpusUnavailable(issue.error());
        return std::vector<SimilarIssue>{};
    }
    return rank(issue.value().title + " " + issue.value().description, issueId, limit, cancel);
}

Outcome<std::vector<SimilarIssue>> SimilarityRanker::rank(const std::string &queryText,
                                                          std::int64_t excludeIssueId,
                                                          int limit,
                                                          const CancellationToken &cancel) const
{
    if (limit <= 0) {
        return makeError(ErrorKind::InvalidInput, "similarity limit must be positive");
    }
    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "similarity ranking cancelled");
    }

    auto corpus = m_store.recentResolvedIssues(m_options.corpusLimit, cancel, m_options.storeTimeout);
    if (!corpus) {
        if (corpus.error().kind == ErrorKind::Cancelled) {
            return corpus.error();
        }
        logCorpusUnavailable(corpus.error());
        return std::vector<SimilarIssue>{};
    }

    std::vector<Issue> candidates = std::move(corpus.value());
    if (excludeIssueId != 0) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [excludeIssueId](const Issue &issue) {
                                            return issue.id == excludeIssueId;
                                        }),
                         candidates.end());
    }

    if (cancel.isCancelled()) {
        return makeError(ErrorKind::Cancelled, "similarity ranking cancelled");
    }

    auto results = rankCorpus(queryText, candidates, limit, m_options.maxFeatures,
                              m_options.threshold, excludeIssueId);

    TLOG_DEBUG(QStringLiteral("SimilarityRanker"),
               QStringLiteral("rank"),
               QStringLiteral("similarity_ranked"),
               QStringLiteral("request"),
               QStringLiteral("tfidf_cosine"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"corpus", candidates.size()}, {"results", results.size()}}));
    return results;
}

} // namespace triage
