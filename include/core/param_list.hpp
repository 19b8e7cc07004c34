#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace querydesk {

/**
 * @brief Insertion-ordered string map for driver parameters and loose field sets.
 *
 * Lookups are linear; these lists hold a handful of entries.
 */
class ParamList {
public:
    using Entry = std::pair<std::string, std::string>;

    ParamList() = default;
    ParamList(std::initializer_list<Entry> init) : entries_(init) {}

    [[nodiscard]] bool contains(std::string_view key) const {
        return find_index(key).has_value();
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        if (const auto idx = find_index(key)) return entries_[*idx].second;
        return std::nullopt;
    }

    /// Insert or overwrite, keeping the original position of an existing key
    void set(std::string key, std::string value) {
        if (const auto idx = find_index(key)) {
            entries_[*idx].second = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(key), std::move(value));
    }

    /// Insert only when absent
    void set_default(std::string key, std::string value) {
        if (!contains(key)) entries_.emplace_back(std::move(key), std::move(value));
    }

    /// Remove and return the value of key, if present
    std::optional<std::string> take(std::string_view key) {
        const auto idx = find_index(key);
        if (!idx) return std::nullopt;
        auto value = std::move(entries_[*idx].second);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*idx));
        return value;
    }

    bool erase(std::string_view key) { return take(key).has_value(); }

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

    bool operator==(const ParamList&) const = default;

private:
    [[nodiscard]] std::optional<size_t> find_index(std::string_view key) const {
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (entries_[i].first == key) return i;
        }
        return std::nullopt;
    }

    std::vector<Entry> entries_;
};

} // namespace querydesk
