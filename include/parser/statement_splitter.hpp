#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querydesk {

/// Result of stripping a leading connection directive from SQL text
struct DirectiveExtraction {
    std::optional<std::string> connection_name;
    std::string remaining_sql;
};

/**
 * @brief Lightweight lexical helpers over raw SQL text.
 *
 * Statement splitting is a plain scan for ';'. Semicolons inside string
 * literals, quoted identifiers or dollar-quoted bodies are NOT respected:
 * `SELECT 'a;b'` splits into two fragments.
 */
class StatementSplitter {
public:
    /// Split on ';', trim each piece, drop empty pieces
    [[nodiscard]] static std::vector<std::string> split(std::string_view sql);

    /**
     * @brief Strip one leading directive naming a connection.
     *
     * Recognized forms (case-insensitive), on the first non-blank line:
     *   -- connection: NAME
     *   USE CONNECTION NAME;
     */
    [[nodiscard]] static DirectiveExtraction extract_connection_directive(std::string_view sql);

    /**
     * @brief First identifier after the first top-level FROM.
     *
     * Keeps schema qualification, strips "..", `..` and [..] quoting.
     * Returns nullopt for subqueries, missing FROM, or anything that is not
     * a plain (optionally qualified) identifier.
     */
    [[nodiscard]] static std::optional<std::string> extract_primary_table(std::string_view sql);

    /// Split "schema.table" into parts, honoring quoted parts and stripping quotes
    [[nodiscard]] static std::vector<std::string> split_qualified_name(std::string_view name);
};

} // namespace querydesk
