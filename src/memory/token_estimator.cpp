#include "mnemo/memory/token_estimator.hpp"

#include <algorithm>

namespace mnemo::memory {

bool TokenEstimator::is_binary(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc == 0 || (uc < 0x20 && c != '\n' && c != '\r' && c != '\t');
    });
}

int TokenEstimator::estimate(std::string_view text) {
    if (is_binary(text)) {
        return kDefaultCost;
    }
    return std::max(1, static_cast<int>(text.size() / kBytesPerToken));
}

int TokenEstimator::estimate_payload(const Json& payload) {
    if (payload.is_string()) {
        return estimate(payload.get_ref<const std::string&>());
    }
    // Binary blobs, nulls and structured values have no meaningful text
    return kDefaultCost;
}

int TokenEstimator::estimate(const Entity& entity) {
    if (const auto* m = std::get_if<Message>(&entity)) {
        return estimate(m->content);
    }
    return estimate(std::get<Summary>(entity).text);
}

int TokenEstimator::estimate(const std::vector<Entity>& entities) {
    int tokens = 0;
    for (const auto& e : entities) {
        tokens += estimate(e);
    }
    return tokens;
}

}  // namespace mnemo::memory
