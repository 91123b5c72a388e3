#pragma once

#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"
#include "session.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mnemo::memory {

using namespace mnemo::core;
namespace fs = std::filesystem;

// Session store - JSONL persistence for sessions.
//
// Line 1 is a session header; every following line is one timeline entity
// with a "type" discriminator ("message" or "summary").
class SessionStore {
public:
    static constexpr int kFormatVersion = 1;
    static constexpr const char* kExtension = ".jsonl";
    static constexpr const char* kBackupSuffix = ".bak";

    explicit SessionStore(const fs::path& directory);

    // Save to <directory>/<sanitized name>.jsonl
    Result<fs::path, Error> save(const Session& session) const;

    // Load <directory>/<sanitized name>.jsonl
    Result<Session, Error> load(const std::string& name) const;

    // Sorted names of the saved sessions
    std::vector<std::string> list() const;

    fs::path path_for(const std::string& name) const;

    // An existing file at path is renamed to path.bak before writing
    static Result<void, Error> save_to(const Session& session, const fs::path& path);

    // Malformed lines are skipped with a warning
    static Result<Session, Error> load_from(const fs::path& path);

    static fs::path backup_path(const fs::path& path);
    static std::string sanitize_name(const std::string& name);

private:
    fs::path directory_;
};

}  // namespace mnemo::memory
