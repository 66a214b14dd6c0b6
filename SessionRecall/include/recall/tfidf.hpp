#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace recall {

// Sparse weight vector. Tokens that are absent carry weight zero.
using TermVector = std::unordered_map<std::string, double>;
using DocumentFrequency = std::unordered_map<std::string, std::size_t>;
using Document = std::vector<std::string>;

// Raw counts divided by the largest count in the document, so the most
// frequent token scores exactly 1.0. An empty document yields an empty vector.
TermVector term_frequency(const Document& tokens);

// Number of documents in which each token appears at least once.
DocumentFrequency document_frequency(const std::vector<Document>& documents);

// Smoothed inverse document frequency: ln((N + 1) / (df + 1)) + 1. Always
// positive, also for tokens missing from the table.
double inverse_document_frequency(std::size_t df, std::size_t total_documents);

// tf * idf for every token of the document. The table must have been built
// over the same document set that total_documents counts; this is not checked.
TermVector tfidf(const Document& tokens, const DocumentFrequency& df, std::size_t total_documents);

} // namespace recall
