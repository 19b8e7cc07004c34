#pragma once

#include <string>

namespace querydesk {

/// UI state that survives restarts
struct AppState {
    std::string last_sql;
    bool dark_mode = false;

    bool operator==(const AppState&) const = default;
};

/**
 * @brief JSON file holding AppState
 *
 * A missing, unreadable or malformed file loads as defaults; fields of the
 * wrong type fall back individually.
 */
class AppStateStore {
public:
    explicit AppStateStore(std::string path);

    [[nodiscard]] AppState load() const;

    /// Atomic replace; false when the file could not be written
    [[nodiscard]] bool save(const AppState& state) const;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace querydesk
