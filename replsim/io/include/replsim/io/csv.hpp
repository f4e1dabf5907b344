#pragma once

/// @file csv.hpp
/// @brief Minimal RFC 4180 reader and writer helpers.
/// @ingroup io_csv

#include <string>
#include <string_view>
#include <vector>

namespace replsim::io {

/// @brief One parsed CSV row.
using CsvRow = std::vector<std::string>;

/// @brief Split @p text into rows and fields.
///
/// Handles quoted fields, doubled quotes inside quotes, embedded separators
/// and line breaks inside quotes, and both LF and CRLF line endings. A UTF-8
/// byte-order mark at the start is skipped. Blank lines are dropped.
///
/// @throws LoaderError if a quoted field is not terminated.
[[nodiscard]] std::vector<CsvRow> parse_csv(std::string_view text);

/// @brief Quote @p field if it contains a comma, quote, CR or LF.
[[nodiscard]] std::string escape_csv_field(std::string_view field);

/// @brief Join @p fields into one CSV line (without the line terminator).
[[nodiscard]] std::string format_csv_row(const std::vector<std::string>& fields);

} // namespace replsim::io
