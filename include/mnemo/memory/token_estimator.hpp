#pragma once

#include "mnemo/core/types.hpp"

#include <string_view>
#include <vector>

namespace mnemo::memory {

using namespace mnemo::core;

// Approximate model-context cost of text.
// Roughly four bytes per token for English text; never fails.
class TokenEstimator {
public:
    static constexpr int kBytesPerToken = 4;
    static constexpr int kDefaultCost = 64;  // non-text payloads

    static int estimate(std::string_view text);
    static int estimate_payload(const Json& payload);
    static int estimate(const Entity& entity);
    static int estimate(const std::vector<Entity>& entities);

    // True if the bytes look like a binary payload rather than text
    static bool is_binary(std::string_view text);
};

}  // namespace mnemo::memory
