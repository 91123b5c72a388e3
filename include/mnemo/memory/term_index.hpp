#pragma once

#include "mnemo/core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mnemo::memory {

using namespace mnemo::core;

// One scored search result
struct IndexHit {
    MessageId id;
    double score;

    bool operator==(const IndexHit&) const = default;
};

// Incremental TF-IDF inverted index over message text.
//
// Postings are appended on insert, so indexing cost is proportional to the
// tokens of the new document only. IDF is evaluated at query time from the
// live document-frequency table; document norms use log-scaled term
// frequencies only, which keeps them independent of corpus growth.
class TermIndex {
public:
    TermIndex() = default;

    // Index a document. Returns false if the id was already indexed.
    bool add(MessageId id, std::string_view text);

    // Top-k documents by score descending; ties go to the larger id
    std::vector<IndexHit> query(std::string_view text, size_t k) const;

    // Recovery path: drop everything and replay the given messages
    void rebuild(const std::vector<Message>& messages);

    void clear();

    bool contains(MessageId id) const { return doc_norms_.count(id) > 0; }
    size_t document_count() const { return doc_norms_.size(); }
    size_t term_count() const { return postings_.size(); }

    // Case-folded, punctuation-stripped terms; identifiers also
    // contribute their camelCase / snake_case parts
    static std::vector<std::string> tokenize(std::string_view text);

private:
    struct Posting {
        MessageId id;
        uint32_t tf;
    };

    uint32_t document_frequency(const std::string& term) const;

    std::unordered_map<std::string, std::vector<Posting>> postings_;
    std::unordered_map<std::string, uint32_t> doc_freq_;
    std::unordered_map<MessageId, double> doc_norms_;

    double idf(uint32_t df) const;
};

}  // namespace mnemo::memory
