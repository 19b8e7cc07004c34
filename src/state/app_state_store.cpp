#include "state/app_state_store.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace querydesk {

AppStateStore::AppStateStore(std::string path)
    : path_(std::move(path)) {}

AppState AppStateStore::load() const {
    AppState state;
    std::ifstream in(path_, std::ios::binary);
    if (!in) return state;

    const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const auto doc = nlohmann::json::parse(raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        utils::log::warn(std::format("Ignoring malformed app state {}", path_));
        return state;
    }

    if (doc.contains("last_sql") && doc["last_sql"].is_string()) {
        state.last_sql = doc["last_sql"].get<std::string>();
    }
    if (doc.contains("dark_mode") && doc["dark_mode"].is_boolean()) {
        state.dark_mode = doc["dark_mode"].get<bool>();
    }
    return state;
}

bool AppStateStore::save(const AppState& state) const {
    nlohmann::ordered_json doc;
    doc["last_sql"] = state.last_sql;
    doc["dark_mode"] = state.dark_mode;

    std::string text;
    try {
        text = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        // Raw non-UTF-8 bytes (e.g. from a file name) cannot be encoded
        utils::log::warn(std::format("Cannot serialize app state {}: {}", path_, e.what()));
        return false;
    }

    std::error_code ec;
    const std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    const auto tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            utils::log::warn(std::format("Cannot write app state {}", tmp));
            return false;
        }
        out << text;
        if (!out) {
            utils::log::warn(std::format("Write to {} failed", tmp));
            return false;
        }
    }
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot replace {}: {}", path_, ec.message()));
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace querydesk
