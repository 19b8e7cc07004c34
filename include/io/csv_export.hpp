#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace querydesk {

struct CsvOptions {
    bool include_header = true;
    char delimiter = ',';
    bool utf8_bom = true;       // Excel detects UTF-8 only with a BOM
};

/**
 * @brief Write a result grid as CSV
 * @return Path actually written (".csv" appended when missing)
 *
 * RFC 4180 quoting: fields containing the delimiter, a quote, CR or LF are
 * quoted and embedded quotes doubled. NULL cells become empty fields. Rows
 * end with CRLF.
 */
[[nodiscard]] Result<std::string> export_csv(const std::vector<std::string>& columns,
                                             const std::vector<Row>& rows,
                                             const std::string& path,
                                             const CsvOptions& options = {});

/// Single CSV field, quoted only when needed
[[nodiscard]] std::string csv_escape(std::string_view field, char delimiter = ',');

/**
 * @brief Split one CSV record into fields
 *
 * Handles quoted fields and doubled quotes; a trailing CR is ignored.
 */
[[nodiscard]] std::vector<std::string> parse_csv_line(std::string_view line, char delimiter = ',');

} // namespace querydesk
