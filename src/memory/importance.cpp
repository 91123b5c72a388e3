#include "mnemo/memory/importance.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace mnemo::memory {

namespace {

const std::unordered_set<std::string>& decision_words() {
    static const std::unordered_set<std::string> words = {
        "decided", "decision", "agreed", "must", "requirement", "requirements",
        "important", "error", "fix", "breaking", "critical"
    };
    return words;
}

const std::unordered_set<std::string>& filler_phrases() {
    static const std::unordered_set<std::string> phrases = {
        "ok", "okay", "k", "thanks", "thank you", "thx", "ty", "sure", "got it",
        "cool", "great", "nice", "yes", "no", "yep", "nope", "hi", "hello",
        "hey", "bye", "np", "lol", "sounds good", "alright", "right"
    };
    return phrases;
}

// Lowercase, punctuation dropped, runs of whitespace collapsed
std::string normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_space && !out.empty()) out.push_back(' ');
            pending_space = false;
            out.push_back(static_cast<char>(std::tolower(uc)));
        } else if (std::isspace(uc)) {
            pending_space = true;
        }
    }
    return out;
}

}  // namespace

ImportanceScorer::ImportanceScorer(double threshold)
    : threshold_(threshold)
{
}

double ImportanceScorer::role_weight(Role role) {
    switch (role) {
        case Role::System: return 0.35;
        case Role::Assistant: return 0.30;
        case Role::User: return 0.25;
    }
    return 0.25;
}

bool ImportanceScorer::has_code_block(std::string_view content) {
    return content.find("```") != std::string_view::npos;
}

bool ImportanceScorer::has_decision_language(std::string_view content) {
    const auto& words = decision_words();
    std::string word;
    for (size_t i = 0; i <= content.size(); ++i) {
        unsigned char c = i < content.size() ? static_cast<unsigned char>(content[i]) : ' ';
        if (std::isalpha(c)) {
            word.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        if (!word.empty()) {
            if (words.count(word)) return true;
            word.clear();
        }
    }
    return false;
}

bool ImportanceScorer::is_filler(std::string_view content) {
    if (has_code_block(content)) return false;
    std::string normalized = normalize(content);
    if (filler_phrases().count(normalized)) return true;
    return normalized.size() < kFillerLength && !has_decision_language(content);
}

double ImportanceScorer::score(Role role, std::string_view content, size_t age) const {
    double recency = kRecencyWeight / (1.0 + static_cast<double>(age));

    if (is_filler(content)) {
        return std::clamp(role_weight(role) * 0.5 + recency, 0.0, 1.0);
    }

    double score = role_weight(role);
    if (has_code_block(content)) score += kCodeBlockWeight;
    if (has_decision_language(content)) score += kDecisionWeight;
    if (content.size() > kSubstantiveLength) score += kLengthWeight;
    score += recency;

    return std::clamp(score, 0.0, 1.0);
}

double ImportanceScorer::score(const Message& message, size_t age) const {
    return score(message.role, message.content, age);
}

bool ImportanceScorer::is_exempt(const Message& message) const {
    return message.importance > threshold_;
}

}  // namespace mnemo::memory
