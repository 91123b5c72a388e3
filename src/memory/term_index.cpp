#include "mnemo/memory/term_index.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <unordered_set>

namespace mnemo::memory {

namespace {

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "the", "a", "an", "is", "are", "was", "were", "be", "been",
        "to", "of", "in", "for", "on", "with", "at", "by", "from",
        "it", "this", "that", "these", "those", "i", "you", "we",
        "and", "or", "but", "if", "then", "else", "when", "while"
    };
    return words;
}

bool is_word_char(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Split an identifier on underscores, lower->Upper, ACRONYMWord and
// letter/digit boundaries
std::vector<std::string_view> identifier_parts(std::string_view word) {
    std::vector<std::string_view> parts;
    size_t start = 0;

    auto flush = [&](size_t end) {
        if (end > start) parts.push_back(word.substr(start, end - start));
        start = end;
    };

    for (size_t i = 0; i < word.size(); ++i) {
        auto c = static_cast<unsigned char>(word[i]);
        if (c == '_') {
            flush(i);
            start = i + 1;
            continue;
        }
        if (i == start) continue;

        auto prev = static_cast<unsigned char>(word[i - 1]);
        bool boundary =
            (std::islower(prev) && std::isupper(c)) ||
            (std::isupper(prev) && std::isupper(c) && i + 1 < word.size() &&
             std::islower(static_cast<unsigned char>(word[i + 1]))) ||
            (std::isalpha(prev) && std::isdigit(c)) ||
            (std::isdigit(prev) && std::isalpha(c));
        if (boundary) flush(i);
    }
    flush(word.size());
    return parts;
}

}  // namespace

std::vector<std::string> TermIndex::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    const auto& stops = stop_words();

    auto emit = [&](std::string term) {
        if (term.size() < 2 || stops.count(term)) return;
        tokens.push_back(std::move(term));
    };

    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_word_char(static_cast<unsigned char>(text[i]))) ++i;
        std::string_view word = text.substr(start, i - start);

        std::string whole = lower(word);
        auto parts = identifier_parts(word);
        emit(whole);
        if (parts.size() > 1) {
            for (auto part : parts) {
                std::string p = lower(part);
                if (p != whole) emit(std::move(p));
            }
        }
    }

    return tokens;
}

bool TermIndex::add(MessageId id, std::string_view text) {
    if (contains(id)) {
        return false;
    }

    std::unordered_map<std::string, uint32_t> tf;
    for (auto& term : tokenize(text)) {
        ++tf[std::move(term)];
    }

    double norm = 0.0;
    for (const auto& [term, count] : tf) {
        postings_[term].push_back(Posting{id, count});
        ++doc_freq_[term];
        double w = 1.0 + std::log(static_cast<double>(count));
        norm += w * w;
    }

    doc_norms_[id] = std::sqrt(norm);
    return true;
}

double TermIndex::idf(uint32_t df) const {
    double n = static_cast<double>(doc_norms_.size());
    return std::log((1.0 + n) / (1.0 + static_cast<double>(df))) + 1.0;
}

uint32_t TermIndex::document_frequency(const std::string& term) const {
    auto it = doc_freq_.find(term);
    return it == doc_freq_.end() ? 0 : it->second;
}

std::vector<IndexHit> TermIndex::query(std::string_view text, size_t k) const {
    if (k == 0 || doc_norms_.empty()) {
        return {};
    }

    // Ordered so that per-document accumulation order is fixed
    std::map<std::string, uint32_t> query_tf;
    for (auto& term : tokenize(text)) {
        ++query_tf[std::move(term)];
    }
    if (query_tf.empty()) {
        return {};
    }

    double query_norm = 0.0;
    std::unordered_map<MessageId, double> dots;
    for (const auto& [term, count] : query_tf) {
        double wq = 1.0 + std::log(static_cast<double>(count));
        query_norm += wq * wq;

        auto it = postings_.find(term);
        if (it == postings_.end()) continue;

        double term_idf = idf(document_frequency(term));
        double idf_sq = term_idf * term_idf;
        for (const auto& posting : it->second) {
            double wd = 1.0 + std::log(static_cast<double>(posting.tf));
            dots[posting.id] += wq * wd * idf_sq;
        }
    }
    query_norm = std::sqrt(query_norm);

    std::vector<IndexHit> hits;
    hits.reserve(dots.size());
    for (const auto& [id, dot] : dots) {
        double doc_norm = doc_norms_.at(id);
        if (doc_norm <= 0.0) continue;
        hits.push_back(IndexHit{id, dot / (query_norm * doc_norm)});
    }

    auto by_rank = [](const IndexHit& a, const IndexHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id > b.id;
    };

    if (hits.size() > k) {
        std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k), hits.end(), by_rank);
        hits.resize(k);
    } else {
        std::sort(hits.begin(), hits.end(), by_rank);
    }

    return hits;
}

void TermIndex::rebuild(const std::vector<Message>& messages) {
    clear();
    for (const auto& msg : messages) {
        add(msg.id, msg.content);
    }
}

void TermIndex::clear() {
    postings_.clear();
    doc_freq_.clear();
    doc_norms_.clear();
}

}  // namespace mnemo::memory
