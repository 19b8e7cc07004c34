#pragma once

#include "core/error.hpp"
#include "core/param_list.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace querydesk {

/**
 * @brief Connection descriptor decomposed into normalized fields.
 *
 * `kind` is "postgresql", "mysql", or, for unrecognized schemes, the first
 * '+'-delimited token of the scheme (e.g. "sqlite", "oracle").
 */
struct NormalizedFields {
    std::string kind;
    std::string host;
    std::optional<uint16_t> port;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::string database;
    ParamList params;
    std::optional<std::string> schema;
};

/**
 * @brief Parses JDBC-style and plain URI connection descriptors.
 *
 * Pure functions: no I/O, deterministic output for a given input.
 *
 * Vendor query parameters are consolidated:
 *  - ssl=false / useSSL=false        -> sslmode=disable
 *  - currentSchema / search_path / schema -> schema field + "-c search_path=<v>" in options
 *  - timezone / serverTimezone (any case) -> "-c TimeZone=<v>" in options
 *  - characterEncoding is dropped
 */
class DescriptorParser {
public:
    static constexpr std::string_view kJdbcPrefix = "jdbc:";

    /// Parse "jdbc:<scheme>://..."; PARSE_ERROR when the jdbc: marker is missing
    [[nodiscard]] static Result<NormalizedFields> parse(std::string_view descriptor);

    /// Parse "<scheme>://[user[:pass]@]host[:port]/database[?k=v&...]"
    [[nodiscard]] static Result<NormalizedFields> parse_uri(std::string_view uri);

    /// Map a scheme (e.g. "postgresql+psycopg2", "mysql") to a normalized kind
    [[nodiscard]] static std::string kind_from_scheme(std::string_view scheme);

    /// Append a fragment to a space-separated libpq options string
    [[nodiscard]] static std::string append_option(const std::string& options,
                                                   const std::string& fragment);

    [[nodiscard]] static std::string percent_decode(std::string_view s, bool plus_as_space = false);
    [[nodiscard]] static std::string percent_encode(std::string_view s);
};

} // namespace querydesk
