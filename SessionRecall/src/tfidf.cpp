#include "../include/recall/tfidf.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace recall {

TermVector term_frequency(const Document& tokens) {
    std::unordered_map<std::string, std::size_t> counts;
    std::size_t max_count = 1;
    for (const auto& token : tokens) {
        max_count = std::max(max_count, ++counts[token]);
    }

    TermVector tf;
    tf.reserve(counts.size());
    for (const auto& [token, count] : counts) {
        tf.emplace(token, static_cast<double>(count) / static_cast<double>(max_count));
    }
    return tf;
}

DocumentFrequency document_frequency(const std::vector<Document>& documents) {
    DocumentFrequency df;
    for (const auto& document : documents) {
        const std::unordered_set<std::string> unique(document.begin(), document.end());
        for (const auto& token : unique) {
            ++df[token];
        }
    }
    return df;
}

double inverse_document_frequency(std::size_t df, std::size_t total_documents) {
    return std::log((static_cast<double>(total_documents) + 1.0) / (static_cast<double>(df) + 1.0)) + 1.0;
}

TermVector tfidf(const Document& tokens, const DocumentFrequency& df, std::size_t total_documents) {
    TermVector weights = term_frequency(tokens);
    for (auto& [token, weight] : weights) {
        const auto it = df.find(token);
        const std::size_t frequency = it == df.end() ? 0 : it->second;
        weight *= inverse_document_frequency(frequency, total_documents);
    }
    return weights;
}

} // namespace recall
