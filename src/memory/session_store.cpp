#include "mnemo/memory/session_store.hpp"

#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace mnemo::memory {

namespace {

std::string dump_line(const Json& j) {
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string short_hash(const std::string& text) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < 4; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
        [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

SessionStore::SessionStore(const fs::path& directory)
    : directory_(directory)
{
}

std::string SessionStore::sanitize_name(const std::string& name) {
    static const std::string unsafe = "<>:\"/\\|?*";

    std::string cleaned;
    cleaned.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || unsafe.find(c) != std::string::npos) continue;
        cleaned.push_back(c);
    }

    // Trim, then collapse inner whitespace runs to '_'
    auto first = std::find_if_not(cleaned.begin(), cleaned.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(cleaned.rbegin(), cleaned.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    std::string result;
    bool in_space = false;
    for (auto it = first; it < last; ++it) {
        if (std::isspace(static_cast<unsigned char>(*it))) {
            if (!in_space) result.push_back('_');
            in_space = true;
        } else {
            result.push_back(*it);
            in_space = false;
        }
    }

    if (result.empty()) {
        // Distinct unusable names must not collide on one file
        return "session_" + short_hash(name);
    }
    return result;
}

fs::path SessionStore::path_for(const std::string& name) const {
    return directory_ / (sanitize_name(name) + kExtension);
}

fs::path SessionStore::backup_path(const fs::path& path) {
    return fs::path(path.string() + kBackupSuffix);
}

std::vector<std::string> SessionStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return names;
    }

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kExtension) {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<fs::path, Error> SessionStore::save(const Session& session) const {
    fs::path path = path_for(session.name());
    auto result = save_to(session, path);
    if (result.is_err()) {
        return Result<fs::path, Error>::err(std::move(result).error());
    }
    return Result<fs::path, Error>::ok(path);
}

Result<Session, Error> SessionStore::load(const std::string& name) const {
    fs::path path = path_for(name);
    if (!fs::exists(path)) {
        return Result<Session, Error>::err(
            ErrorCode::SessionNotFound,
            "Session not found",
            name
        );
    }
    return load_from(path);
}

Result<void, Error> SessionStore::save_to(const Session& session, const fs::path& path) {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        // Rename first: a failed write below leaves the previous state in .bak
        if (fs::exists(path)) {
            std::error_code ec;
            fs::rename(path, backup_path(path), ec);
            if (ec) {
                return Result<void, Error>::err(
                    ErrorCode::FileWriteFailed,
                    "Failed to back up existing session file: " + ec.message(),
                    path.string()
                );
            }
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open file for writing",
                path.string()
            );
        }

        Json header{
            {"type", "session"},
            {"version", kFormatVersion},
            {"name", session.name()},
            {"created_at", to_millis(session.created_at())},
            {"model", session.model()}
        };
        file << dump_line(header) << "\n";

        for (const auto& entity : session.entities()) {
            std::visit([&](const auto& e) { file << dump_line(e.to_json()) << "\n"; }, entity);
        }

        file.flush();
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Write to session file failed",
                path.string()
            );
        }

        spdlog::info("Session saved: {} ({} entities)", path.string(), session.entities().size());
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

Result<Session, Error> SessionStore::load_from(const fs::path& path) {
    try {
        if (!fs::exists(path)) {
            return Result<Session, Error>::err(
                ErrorCode::FileNotFound,
                "Session file not found",
                path.string()
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<Session, Error>::err(
                ErrorCode::FileReadFailed,
                "Failed to open file for reading",
                path.string()
            );
        }

        std::string name = path.stem().string();
        TimePoint created_at = now();
        std::string model;

        std::vector<Entity> entities;
        std::vector<Span> spans;
        MessageId last_id = 0;
        size_t skipped = 0;
        size_t line_num = 0;
        bool header_seen = false;

        auto skip = [&](const std::string& why) {
            ++skipped;
            spdlog::warn("Skipping malformed record at line {} in {}: {}", line_num, path.string(), why);
        };

        std::string line;
        while (std::getline(file, line)) {
            ++line_num;
            if (is_blank(line)) continue;

            try {
                Json j = Json::parse(line);
                std::string type = j.at("type").get<std::string>();

                if (type == "session") {
                    if (header_seen || !entities.empty()) {
                        skip("unexpected session header");
                        continue;
                    }
                    header_seen = true;
                    name = j.value("name", name);
                    model = j.value("model", std::string{});
                    if (j.contains("created_at")) {
                        created_at = from_millis(j["created_at"].get<int64_t>());
                    }
                } else if (type == "message") {
                    Message msg = Message::from_json(j);
                    if (msg.id == 0 || msg.id <= last_id) {
                        skip("duplicate or out-of-order message id " + std::to_string(msg.id));
                        continue;
                    }
                    last_id = msg.id;
                    entities.emplace_back(std::move(msg));
                } else if (type == "summary") {
                    Summary summary = Summary::from_json(j);
                    bool overlaps = std::any_of(spans.begin(), spans.end(), [&](const Span& s) {
                        return summary.first_id <= s.last_id && s.first_id <= summary.last_id;
                    });
                    if (overlaps || summary.first_id <= last_id) {
                        skip("summary span overlaps earlier content");
                        continue;
                    }
                    spans.push_back(Span{summary.first_id, summary.last_id});
                    entities.emplace_back(std::move(summary));
                } else {
                    skip("unknown record type '" + type + "'");
                }
            } catch (const std::exception& e) {
                skip(e.what());
            }
        }

        // A summary stands in for its span only when every message of the
        // span was loaded and is marked compressed
        std::unordered_map<MessageId, bool> loaded;
        for (const auto& entity : entities) {
            if (const auto* m = std::get_if<Message>(&entity)) {
                loaded[m->id] = m->compressed;
            }
        }

        std::vector<Entity> kept;
        kept.reserve(entities.size());
        spans.clear();
        for (auto& entity : entities) {
            const auto* s = std::get_if<Summary>(&entity);
            if (s) {
                bool complete = s->first_id > 0 && s->first_id <= s->last_id;
                for (MessageId id = s->first_id; complete && id <= s->last_id; ++id) {
                    auto it = loaded.find(id);
                    complete = it != loaded.end() && it->second;
                }
                if (!complete) {
                    ++skipped;
                    spdlog::warn("Skipping summary {}-{} in {}: span messages missing or not compressed",
                                 s->first_id, s->last_id, path.string());
                    continue;
                }
                spans.push_back(Span{s->first_id, s->last_id});
            }
            kept.push_back(std::move(entity));
        }
        entities = std::move(kept);

        // A compressed message with no surviving summary goes back to the
        // active view rather than vanishing from context
        for (auto& entity : entities) {
            auto* m = std::get_if<Message>(&entity);
            if (!m || !m->compressed) continue;
            bool covered = std::any_of(spans.begin(), spans.end(), [&](const Span& s) {
                return m->id >= s.first_id && m->id <= s.last_id;
            });
            if (!covered) {
                spdlog::warn("Message {} marked compressed without a summary; restoring it", m->id);
                m->compressed = false;
            }
        }

        Session session = Session::restore(std::move(name), created_at, std::move(model), std::move(entities));

        spdlog::info("Session loaded: {} ({} messages, {} summaries, {} skipped)",
                     session.name(), session.message_count(), session.summary_count(), skipped);

        return Result<Session, Error>::ok(std::move(session));

    } catch (const std::exception& e) {
        return Result<Session, Error>::err(
            ErrorCode::FileReadFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace mnemo::memory
