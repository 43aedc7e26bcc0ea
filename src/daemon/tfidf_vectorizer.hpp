#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace triage {

// Sparse vector as (vocabulary index, weight) pairs sorted by index.
using SparseVector = std::vector<std::pair<int, double>>;

// TfidfVectorizer turns documents into L2-normalised TF-IDF vectors over
// unigrams and bigrams, with English stop words removed before n-grams form.
class TfidfVectorizer {
public:
    explicit TfidfVectorizer(int maxFeatures = 1000);

    // Lower-cased runs of two or more Unicode word characters, stop words kept.
    static std::vector<std::string> tokenize(const std::string &text);
    static bool isStopWord(const std::string &token);

    // Unigrams and space-joined bigrams after stop-word removal.
    std::vector<std::string> analyze(const std::string &text) const;

    // Learns vocabulary and IDF from documents and returns one vector per document.
    std::vector<SparseVector> fitTransform(const std::vector<std::string> &documents);

    const std::vector<std::string> &vocabulary() const;
    const std::vector<double> &idf() const;

    // Both vectors must already be normalised. Result clamped to [0,1].
    static double cosine(const SparseVector &a, const SparseVector &b);

private:
    int m_maxFeatures;
    std::vector<std::string> m_vocabulary;
    std::vector<double> m_idf;
};

} // namespace triage
