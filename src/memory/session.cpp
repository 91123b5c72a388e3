#include "mnemo/memory/session.hpp"
#include "mnemo/memory/token_estimator.hpp"

#include <algorithm>

namespace mnemo::memory {

Session::Session(std::string name, std::string model)
    : name_(std::move(name))
    , created_at_(now())
    , model_(std::move(model))
{
}

Session Session::restore(std::string name, TimePoint created_at, std::string model,
                         std::vector<Entity> entities) {
    Session session(std::move(name), std::move(model));
    session.created_at_ = created_at;
    session.entities_ = std::move(entities);

    for (const auto& entity : session.entities_) {
        if (const auto* m = std::get_if<Message>(&entity)) {
            session.index_.add(m->id, m->content);
            session.next_id_ = std::max(session.next_id_, m->id + 1);
        }
    }

    return session;
}

const Message& Session::append(Role role, std::string content, double importance) {
    Message msg;
    msg.id = next_id_++;
    msg.role = role;
    msg.timestamp = now();
    msg.token_estimate = TokenEstimator::estimate(content);
    msg.importance = importance;
    msg.content = std::move(content);

    index_.add(msg.id, msg.content);
    entities_.emplace_back(std::move(msg));
    return std::get<Message>(entities_.back());
}

std::vector<const Entity*> Session::active() const {
    std::vector<const Entity*> view;
    view.reserve(entities_.size());
    for (const auto& entity : entities_) {
        if (is_active(entity)) {
            view.push_back(&entity);
        }
    }
    return view;
}

size_t Session::active_size() const {
    return static_cast<size_t>(std::count_if(entities_.begin(), entities_.end(), is_active));
}

int Session::active_tokens() const {
    int tokens = 0;
    for (const auto& entity : entities_) {
        if (is_active(entity)) {
            tokens += entity_tokens(entity);
        }
    }
    return tokens;
}

std::vector<Message> Session::messages() const {
    std::vector<Message> out;
    for (const auto& entity : entities_) {
        if (const auto* m = std::get_if<Message>(&entity)) {
            out.push_back(*m);
        }
    }
    return out;
}

size_t Session::message_count() const {
    return static_cast<size_t>(std::count_if(entities_.begin(), entities_.end(), is_message));
}

size_t Session::summary_count() const {
    return static_cast<size_t>(std::count_if(entities_.begin(), entities_.end(), is_summary));
}

std::optional<size_t> Session::position_of(MessageId id) const {
    for (size_t i = 0; i < entities_.size(); ++i) {
        const auto* m = std::get_if<Message>(&entities_[i]);
        if (m && m->id == id) {
            return i;
        }
    }
    return std::nullopt;
}

const Message* Session::find_message(MessageId id) const {
    auto pos = position_of(id);
    return pos ? &std::get<Message>(entities_[*pos]) : nullptr;
}

Result<void, Error> Session::fold(const Span& span, Summary summary) {
    if (span.first_id == 0 || span.last_id < span.first_id) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Empty span");
    }

    auto start = position_of(span.first_id);
    if (!start) {
        return Result<void, Error>::err(
            ErrorCode::NotFound,
            "Span start not in session",
            std::to_string(span.first_id)
        );
    }

    size_t count = span.size();
    if (*start + count > entities_.size()) {
        return Result<void, Error>::err(ErrorCode::SpanNotEligible, "Span runs past the timeline");
    }

    for (size_t i = 0; i < count; ++i) {
        const auto* m = std::get_if<Message>(&entities_[*start + i]);
        if (!m || m->compressed || m->id != span.first_id + i) {
            return Result<void, Error>::err(
                ErrorCode::SpanNotEligible,
                "Span is not a run of active messages",
                std::to_string(span.first_id) + "-" + std::to_string(span.last_id)
            );
        }
    }

    for (size_t i = 0; i < count; ++i) {
        std::get<Message>(entities_[*start + i]).compressed = true;
    }

    summary.first_id = span.first_id;
    summary.last_id = span.last_id;
    entities_.insert(entities_.begin() + static_cast<std::ptrdiff_t>(*start), Entity{std::move(summary)});

    return Result<void, Error>::ok();
}

}  // namespace mnemo::memory
