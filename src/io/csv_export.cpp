#include "io/csv_export.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>

namespace querydesk {

std::string csv_escape(std::string_view field, char delimiter) {
    if (field.find_first_of(std::string{delimiter, '"', '\r', '\n'}) == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

Result<std::string> export_csv(const std::vector<std::string>& columns,
                               const std::vector<Row>& rows,
                               const std::string& path,
                               const CsvOptions& options) {
    std::string target = path;
    const auto lower = utils::to_lower(target);
    if (lower.size() < 4 || lower.compare(lower.size() - 4, 4, ".csv") != 0) {
        target += ".csv";
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Cannot open {} for writing", target));
    }

    if (options.utf8_bom) {
        out << "\xEF\xBB\xBF";
    }

    auto write_record = [&](const auto& fields, auto&& to_text) {
        bool first = true;
        for (const auto& f : fields) {
            if (!first) out << options.delimiter;
            first = false;
            out << csv_escape(to_text(f), options.delimiter);
        }
        out << "\r\n";
    };

    if (options.include_header && !columns.empty()) {
        write_record(columns, [](const std::string& s) -> std::string_view { return s; });
    }
    for (const auto& row : rows) {
        write_record(row, [](const Cell& c) -> std::string_view {
            return c ? std::string_view(*c) : std::string_view{};
        });
    }

    out.flush();
    if (!out) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Failed writing {}", target));
    }
    utils::log::info(std::format("Exported {} rows to {}", rows.size(), target));
    return Result<std::string>::ok(std::move(target));
}

std::vector<std::string> parse_csv_line(std::string_view line, char delimiter) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter) {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

} // namespace querydesk
