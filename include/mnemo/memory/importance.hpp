#pragma once

#include "mnemo/core/types.hpp"

#include <string>
#include <string_view>

namespace mnemo::memory {

using namespace mnemo::core;

// Importance scorer - retention priority of a message in [0, 1].
//
// Structural signals (code blocks, decision or requirement language,
// substantive length) raise the score and conversational filler lowers it.
// Age only feeds a small recency bonus that is smaller than any structural
// weight, so it breaks ties without ever inverting a structural signal.
class ImportanceScorer {
public:
    static constexpr double kCodeBlockWeight = 0.50;
    static constexpr double kDecisionWeight = 0.25;
    static constexpr double kLengthWeight = 0.10;
    static constexpr double kRecencyWeight = 0.05;
    static constexpr size_t kSubstantiveLength = 200;
    static constexpr size_t kFillerLength = 20;

    explicit ImportanceScorer(double threshold = 0.7);

    // age: number of messages appended after this one
    double score(Role role, std::string_view content, size_t age = 0) const;
    double score(const Message& message, size_t age = 0) const;

    // Exempt messages are carried forward verbatim by compression
    bool is_exempt(const Message& message) const;

    double threshold() const { return threshold_; }

    static bool has_code_block(std::string_view content);
    static bool has_decision_language(std::string_view content);
    static bool is_filler(std::string_view content);

private:
    double threshold_;

    static double role_weight(Role role);
};

}  // namespace mnemo::memory
