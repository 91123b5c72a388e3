#pragma once

#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"
#include "term_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mnemo::memory {

using namespace mnemo::core;

// Session - ordered entity timeline plus the index over its messages.
//
// Every message ever appended stays in the timeline. A summary is inserted
// directly before the first message of its span and the span's messages are
// flagged compressed, so the active view (compressed messages filtered out)
// shows the summary in the span's former position.
class Session {
public:
    explicit Session(std::string name, std::string model = "");

    // Rebuild a session from a persisted timeline; the index is re-derived
    // by replaying every message
    static Session restore(std::string name, TimePoint created_at, std::string model,
                           std::vector<Entity> entities);

    // Accessors
    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }
    TimePoint created_at() const { return created_at_; }
    const std::string& model() const { return model_; }

    // Append a new message; assigns id, timestamp and token estimate and
    // indexes its content
    const Message& append(Role role, std::string content, double importance);

    // Full timeline, including compressed messages
    const std::vector<Entity>& entities() const { return entities_; }

    // Active view in timeline order
    std::vector<const Entity*> active() const;
    size_t active_size() const;
    int active_tokens() const;

    // All messages in id order
    std::vector<Message> messages() const;
    size_t message_count() const;
    size_t summary_count() const;
    const Message* find_message(MessageId id) const;

    // Replace an active span with its summary. The caller is responsible for
    // eligibility; this only checks the span is a run of active messages.
    Result<void, Error> fold(const Span& span, Summary summary);

    const TermIndex& index() const { return index_; }

    MessageId next_id() const { return next_id_; }

private:
    std::string name_;
    TimePoint created_at_;
    std::string model_;
    std::vector<Entity> entities_;
    TermIndex index_;
    MessageId next_id_ = 1;

    std::optional<size_t> position_of(MessageId id) const;
};

}  // namespace mnemo::memory
