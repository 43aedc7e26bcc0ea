#include "daemon/tfidf_vectorizer.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include <QChar>
#include <QString>

namespace triage {

namespace {

const std::unordered_set<std::string> &englishStopWords()
{
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "across", "after", "afterwards", "again", "against",
        "all", "almost", "alone", "along", "already", "also", "although", "always",
        "am", "among", "amongst", "amoungst", "amount", "an", "and", "another", "any",
        "anyhow", "anyone", "anything", "anyway", "anywhere", "are", "around", "as",
        "at", "back", "be", "became", "because", "become", "becomes", "becoming",
        "been", "before", "beforehand", "behind", "being", "below", "beside",
        "besides", "between", "beyond", "bill", "both", "bottom", "but", "by", "call",
        "can", "cannot", "cant", "co", "con", "could", "couldnt", "cry", "de",
        "describe", "detail", "do", "done", "down", "due", "during", "each", "eg",
        "eight", "either", "eleven", "else", "elsewhere", "empty", "enough", "etc",
        "even", "ever", "every", "everyone", "everything", "everywhere", "except",
        "few", "fifteen", "fifty", "fill", "find", "fire", "first", "five", "for",
        "former", "formerly", "forty", "found", "four", "from", "front", "full",
        "further", "get", "give", "go", "had", "has", "hasnt", "have", "he", "hence",
        "her", "here", "hereafter", "hereby", "herein", "hereupon", "hers", "herself",
        "him", "himself", "his", "how", "however", "hundred", "i", "ie", "if", "in",
        "inc", "indeed", "interest", "into", "is", "it", "its", "itself", "keep",
        "last", "latter", "latterly", "least", "less", "ltd", "made", "many", "may",
        "me", "meanwhile", "might", "mill", "mine", "more", "moreover", "most",
        "mostly", "move", "much", "must", "my", "myself", "name", "namely", "neither",
        "never", "nevertheless", "next", "nine", "no", "nobody", "none", "noone",
        "nor", "not", "nothing", "now", "nowhere", "of", "off", "often", "on", "once",
        "one", "only", "onto", "or", "other", "others", "otherwise", "our", "ours",
        "ourselves", "out", "over", "own", "part", "per", "perhaps", "please", "put",
        "rather", "re", "same", "see", "seem", "seemed", "seeming", "seems", "serious",
        "several", "she", "should", "show", "side", "since", "sincere", "six", "sixty",
        "so", "some", "somehow", "someone", "something", "sometime", "sometimes",
        "somewhere", "still", "such", "system", "take", "ten", "than", "that", "the",
        "their", "them", "themselves", "then", "thence", "there", "thereafter",
        "thereby", "therefore", "therein", "thereupon", "these", "they", "thick",
        "thin", "third", "this", "those", "though", "three", "through", "throughout",
        "thru", "thus", "to", "together", "too", "top", "toward", "towards", "twelve",
        "twenty", "two", "un", "under", "until", "up", "upon", "us", "very", "via",
        "was", "we", "well", "were", "what", "whatever", "when", "whence", "whenever",
        "where", "whereafter", "whereas", "whereby", "wherein", "whereupon",
        "wherever", "whether", "which", "while", "whither", "who", "whoever", "whole",
        "whom", "whose", "why", "will", "with", "within", "without", "would", "yet",
        "you", "your", "yours", "yourself", "yourselves"
    };
    return words;
}

// Bytes of multi-byte UTF-8 sequences count as word characters.
// Unicode letters, digits and underscore. Punctuation, symbols, spaces and
// undecodable bytes (read as U+FFFD) all separate tokens.
bool isWordCodePoint(char32_t c)
{
    return c == U'_' || QChar::isLetterOrNumber(c);
}

} // namespace

TfidfVectorizer::TfidfVectorizer(int maxFeatures)
    : m_maxFeatures(maxFeatures)
{
}

std::vector<std::string> TfidfVectorizer::tokenize(const std::string &text)
{
    const QString lowered = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()))
                                .toLower();

    std::vector<std::string> tokens;
    std::u32string current;
    auto flush = [&]() {
        if (current.size() >= 2) {
            tokens.push_back(
                QString::fromUcs4(current.data(), static_cast<qsizetype>(current.size()))
                    .toStdString());
        }
        current.clear();
    };

    for (const auto codePoint : lowered.toUcs4()) {
        const auto c = static_cast<char32_t>(codePoint);
        if (isWordCodePoint(c)) {
            current.push_back(c);
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

bool TfidfVectorizer::isStopWord(const std::string &token)
{
    return englishStopWords().count(token) > 0;
}

std::vector<std::string> TfidfVectorizer::analyze(const std::string &text) const
{
    std::vector<std::string> words;
    for (auto &token : tokenize(text)) {
        if (!isStopWord(token)) {
            words.push_back(std::move(token));
        }
    }

    std::vector<std::string> terms = words;
    for (std::size_t i = 0; i + 1 < words.size(); ++i) {
        terms.push_back(words[i] + " " + words[i + 1]);
    }
    return terms;
}

std::vector<SparseVector> TfidfVectorizer::fitTransform(const std::vector<std::string> &documents)
{
    std::vector<std::map<std::string, int>> counts;
    counts.reserve(documents.size());
    std::map<std::string, std::pair<long long, int>> stats; // total count, document frequency

    for (const auto &document : documents) {
        std::map<std::string, int> termCounts;
        for (const auto &term : analyze(document)) {
            ++termCounts[term];
        }
        for (const auto &entry : termCounts) {
            auto &stat = stats[entry.first];
            stat.first += entry.second;
            stat.second += 1;
        }
        counts.push_back(std::move(termCounts));
    }

    std::vector<std::string> terms;
    terms.reserve(stats.size());
    for (const auto &entry : stats) {
        terms.push_back(entry.first);
    }
    // stats is ordered, so the stable sort keeps frequency ties alphabetical.
    std::stable_sort(terms.begin(), terms.end(), [&stats](const std::string &a, const std::string &b) {
        return stats.at(a).first > stats.at(b).first;
    });
    if (m_maxFeatures > 0 && static_cast<int>(terms.size()) > m_maxFeatures) {
        terms.resize(static_cast<std::size_t>(m_maxFeatures));
    }
    std::sort(terms.begin(), terms.end());

    m_vocabulary = terms;
    m_idf.assign(terms.size(), 0.0);
    std::unordered_map<std::string, int> index;
    const double n = static_cast<double>(documents.size());
    for (std::size_t i = 0; i < terms.size(); ++i) {
        index.emplace(terms[i], static_cast<int>(i));
        const double df = static_cast<double>(stats.at(terms[i]).second);
        m_idf[i] = std::log((1.0 + n) / (1.0 + df)) + 1.0;
    }

    std::vector<SparseVector> vectors;
    vectors.reserve(counts.size());
    for (const auto &termCounts : counts) {
        SparseVector vector;
        double norm = 0.0;
        for (const auto &entry : termCounts) {
            const auto it = index.find(entry.first);
            if (it == index.end()) {
                continue;
            }
            const double weight = entry.second * m_idf[static_cast<std::size_t>(it->second)];
            vector.emplace_back(it->second, weight);
            norm += weight * weight;
        }
        std::sort(vector.begin(), vector.end());
        if (norm > 0.0) {
            const double length = std::sqrt(norm);
            for (auto &entry : vector) {
                entry.second /= length;
            }
        }
        vectors.push_back(std::move(vector));
    }
    return vectors;
}

const std::vector<std::string> &TfidfVectorizer::vocabulary() const
{
    return m_vocabulary;
}

const std::vector<double> &TfidfVectorizer::idf() const
{
    return m_idf;
}

double TfidfVectorizer::cosine(const SparseVector &a, const SparseVector &b)
{
    double dot = 0.0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (ia->first < ib->first) {
            ++ia;
        } else if (ib->first < ia->first) {
            ++ib;
        } else {
            dot += ia->second * ib->second;
            ++ia;
            ++ib;
        }
    }
    return std::clamp(dot, 0.0, 1.0);
}

} // namespace triage
