#include <QtTest/QtTest>

#include <chrono>

#include "daemon/similarity_ranker.hpp"
#include "daemon/tfidf_vectorizer.hpp"
#include "support/fake_collaborators.hpp"

using namespace std::chrono_literals;

using triage::CancellationToken;
using triage::ErrorKind;
using triage::Issue;
using triage::IssueStatus;
using triage::Severity;
using triage::SimilarityOptions;
using triage::SimilarityRanker;
using triage::TfidfVectorizer;
using triage::testing::InMemoryIssueStore;

namespace {

Issue resolvedIssue(std::int64_t id, const std::string &title, const std::string &description)
{
    Issue issue;
    issue.id = id;
    issue.customerId = 1;
    issue.title = title;
    issue.description = description;
    issue.severity = Severity::High;
    issue.status = IssueStatus::Resolved;
    issue.resolutionHours = 6.5;
    return issue;
}

} // namespace

class SimilarityRankerTests : public QObject
{
    Q_OBJECT
private slots:
    void testTokenizeAndAnalyze();
    void testTokenizeUnicode();
    void testCosineBounds();
    void testVocabularyCap();
    void testRankCorpusOrdersAndFilters();
    void testLimitAppliedBeforeThreshold();
    void testEmptyCorpus();
    void testTruncateDescription();
    void testStoredIssueExcludesItself();
    void testTiesKeepCorpusOrder();
    void testCorpusUnavailableYieldsEmpty();
    void testInvalidInputAndCancellation();
};

void SimilarityRankerTests::testTokenizeAndAnalyze()
{
    const auto tokens = TfidfVectorizer::tokenize("Hello, World! a x_y 42");
    QCOMPARE(tokens, (std::vector<std::string>{"hello", "world", "x_y", "42"}));

    TfidfVectorizer vectorizer;
    const auto terms = vectorizer.analyze("The login page fails");
    QCOMPARE(terms, (std::vector<std::string>{"login", "page", "fails", "login page", "page fails"}));
    QVERIFY(TfidfVectorizer::isStopWord("the"));
    QVERIFY(!TfidfVectorizer::isStopWord("login"));
}

void SimilarityRankerTests::testTokenizeUnicode()
{
    // Em dash and no-break space separate words.
    QCOMPARE(TfidfVectorizer::tokenize("login\xE2\x80\x94page"),
             (std::vector<std::string>{"login", "page"}));
    QCOMPARE(TfidfVectorizer::tokenize("caf\xC3\xA9\xC2\xA0menu"),
             (std::vector<std::string>{"caf\xC3\xA9", "menu"}));

    // Lower-casing covers accented capitals; length counts characters, not bytes.
    QCOMPARE(TfidfVectorizer::tokenize("\xC3\x89" "CHEC"),
             (std::vector<std::string>{"\xC3\xA9" "chec"}));
    QCOMPARE(TfidfVectorizer::tokenize("\xC3\xA9 ok"), (std::vector<std::string>{"ok"}));
}

void SimilarityRankerTests::testCosineBounds()
{
    TfidfVectorizer vectorizer;
    const auto vectors = vectorizer.fitTransform({"password reset email",
                                                  "password reset email",
                                                  "invoice charge refund"});
    QCOMPARE(vectors.size(), std::size_t(3));
    QVERIFY(qAbs(TfidfVectorizer::cosine(vectors[0], vectors[1]) - 1.0) < 1e-9);
    QCOMPARE(TfidfVectorizer::cosine(vectors[0], vectors[2]), 0.0);
    QCOMPARE(TfidfVectorizer::cosine({}, vectors[0]), 0.0);
}

void SimilarityRankerTests::testVocabularyCap()
{
    TfidfVectorizer vectorizer(3);
    vectorizer.fitTransform({"alpha beta gamma delta", "alpha beta", "alpha"});
    QCOMPARE(vectorizer.vocabulary().size(), std::size_t(3));
    QVERIFY(std::find(vectorizer.vocabulary().begin(), vectorizer.vocabulary().end(), "alpha")
            != vectorizer.vocabulary().end());
    QCOMPARE(vectorizer.idf().size(), std::size_t(3));
}

void SimilarityRankerTests::testRankCorpusOrdersAndFilters()
{
    const std::vector<Issue> corpus = {
        resolvedIssue(1, "Login password reset fails", "reset link expired"),
        resolvedIssue(2, "Invoice billing charge wrong", "charged twice this month"),
        resolvedIssue(3, "Password reset email missing", "no reset email arrives"),
    };

    const auto results = SimilarityRanker::rankCorpus("password reset email not arriving",
                                                      corpus, 5, 1000, 0.1, 42);
    QCOMPARE(results.size(), std::size_t(2));
    QCOMPARE(results.front().issueId, std::int64_t(3));
    for (std::size_t i = 0; i < results.size(); ++i) {
        QVERIFY(results[i].score > 0.1);
        QVERIFY(results[i].score <= 1.0);
        QCOMPARE(results[i].sourceIssueId, std::int64_t(42));
        QVERIFY(results[i].issueId != 2);
        if (i > 0) {
            QVERIFY(results[i - 1].score >= results[i].score);
        }
    }
    QCOMPARE(*results.front().resolutionHours, 6.5);
    QCOMPARE(results.front().severity, Severity::High);

    // Same inputs, same output.
    const auto again = SimilarityRanker::rankCorpus("password reset email not arriving",
                                                    corpus, 5, 1000, 0.1, 42);
    QCOMPARE(again.size(), results.size());
    QCOMPARE(again.front().score, results.front().score);
}

void SimilarityRankerTests::testLimitAppliedBeforeThreshold()
{
    const std::vector<Issue> corpus = {
        resolvedIssue(1, "Invoice billing charge wrong", "charged twice"),
        resolvedIssue(2, "Password reset email missing", "no reset email arrives"),
    };

    // Only the best-scoring slot survives a limit of one.
    const auto top = SimilarityRanker::rankCorpus("password reset email", corpus, 1, 1000, 0.1);
    QCOMPARE(top.size(), std::size_t(1));
    QCOMPARE(top.front().issueId, std::int64_t(2));

    // A query that matches nothing keeps nothing even with room to spare.
    const auto none = SimilarityRanker::rankCorpus("kubernetes cluster", corpus, 5, 1000, 0.1);
    QVERIFY(none.empty());
}

void SimilarityRankerTests::testEmptyCorpus()
{
    QVERIFY(SimilarityRanker::rankCorpus("anything", {}, 5, 1000, 0.1).empty());
}

void SimilarityRankerTests::testTruncateDescription()
{
    const std::string ascii(250, 'x');
    QCOMPARE(SimilarityRanker::truncateDescription(ascii), std::string(200, 'x') + "...");
    QCOMPARE(SimilarityRanker::truncateDescription("short"), std::string("short..."));

    std::string accented;
    for (int i = 0; i < 201; ++i) {
        accented += "\xC3\xA9";
    }
    const std::string truncated = SimilarityRanker::truncateDescription(accented);
    QCOMPARE(truncated.size(), std::size_t(403));
    QCOMPARE(truncated.substr(0, 400), accented.substr(0, 400));
}

void SimilarityRankerTests::testStoredIssueExcludesItself()
{
    InMemoryIssueStore store;
    const auto customer = store.addCustomer("acme", triage::CustomerTier::Basic);
    const auto now = std::chrono::system_clock::now();
    const auto self = store.addIssue(customer.id, "Password reset email missing",
                                     "no reset email arrives", Severity::High,
                                     IssueStatus::Resolved, now - 2h);
    const auto other = store.addIssue(customer.id, "Reset email delayed",
                                      "password reset email arrives late", Severity::Normal,
                                      IssueStatus::Resolved, now - 5h);

    SimilarityRanker ranker(store, SimilarityOptions{});
    CancellationToken cancel;
    const auto results = ranker.rankForIssue(self.id, 5, cancel);
    QVERIFY(results.ok());
    QCOMPARE(results.value().size(), std::size_t(1));
    QCOMPARE(results.value().front().issueId, other.id);
    QCOMPARE(results.value().front().sourceIssueId, self.id);

    const auto missing = ranker.rankForIssue(999, 5, cancel);
    QVERIFY(!missing.ok());
    QCOMPARE(missing.error().kind, ErrorKind::NotFound);
}

void SimilarityRankerTests::testTiesKeepCorpusOrder()
{
    InMemoryIssueStore store;
    const auto customer = store.addCustomer("acme", triage::CustomerTier::Basic);
    const auto now = std::chrono::system_clock::now();
    const auto older = store.addIssue(customer.id, "Webhook retries", "webhook retries exhausted",
                                      Severity::Normal, IssueStatus::Resolved, now - 10h);
    const auto newer = store.addIssue(customer.id, "Webhook retries", "webhook retries exhausted",
                                      Severity::Normal, IssueStatus::Resolved, now - 1h);

    SimilarityRanker ranker(store, SimilarityOptions{});
    CancellationToken cancel;
    const auto results = ranker.rankText("Webhook retries", "exhausted", 5, cancel);
    QVERIFY(results.ok());
    QCOMPARE(results.value().size(), std::size_t(2));
    QCOMPARE(results.value()[0].score, results.value()[1].score);
    QCOMPARE(results.value()[0].issueId, newer.id);
    QCOMPARE(results.value()[1].issueId, older.id);
}

void SimilarityRankerTests::testCorpusUnavailableYieldsEmpty()
{
    InMemoryIssueStore store;
    store.corpusFailure = ErrorKind::CollaboratorUnavailable;

    SimilarityRanker ranker(store, SimilarityOptions{});
    CancellationToken cancel;
    const auto results = ranker.rankText("Password reset", "email missing", 5, cancel);
    QVERIFY(results.ok());
    QVERIFY(results.value().empty());
    QCOMPARE(store.corpusCalls, 1);
}

void SimilarityRankerTests::testInvalidInputAndCancellation()
{
    InMemoryIssueStore store;
    SimilarityRanker ranker(store, SimilarityOptions{});
    CancellationToken cancel;

    const auto empty = ranker.rankText("", "", 5, cancel);
    QVERIFY(!empty.ok());
    QCOMPARE(empty.error().kind, ErrorKind::InvalidInput);

    const auto zeroLimit = ranker.rankText("title", "", 0, cancel);
    QVERIFY(!zeroLimit.ok());
    QCOMPARE(zeroLimit.error().kind, ErrorKind::InvalidInput);

    cancel.cancel();
    const auto cancelled = ranker.rankText("title", "", 5, cancel);
    QVERIFY(!cancelled.ok());
    QCOMPARE(cancelled.error().kind, ErrorKind::Cancelled);
    QCOMPARE(store.corpusCalls, 0);
}

QTEST_MAIN(SimilarityRankerTests)
#include "test_similarity_ranker.moc"
