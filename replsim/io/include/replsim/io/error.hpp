#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the replsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace replsim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when JSON or CSV input is malformed, required
/// fields or columns are missing, or values fail semantic validation (e.g.
/// negative lead times, unparsable dates).
///
/// @ingroup io
/// @see load_demand, load_items, read_schedule_csv
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief Thrown when adding an item whose SKU is already in a ScheduleStore.
/// @ingroup io
/// @see ScheduleStore::add_item
class DuplicateItemError : public std::runtime_error {
public:
    explicit DuplicateItemError(const std::string& sku)
        : std::runtime_error("Product with SKU '" + sku + "' is already added")
        , sku_(sku) {}

    [[nodiscard]] const std::string& sku() const noexcept { return sku_; }

private:
    std::string sku_;
};

/// @brief Thrown when a ScheduleStore lookup names an unknown SKU.
/// @ingroup io
/// @see ScheduleStore
class UnknownItemError : public std::runtime_error {
public:
    explicit UnknownItemError(const std::string& sku)
        : std::runtime_error("No product with SKU '" + sku + "'")
        , sku_(sku) {}

    [[nodiscard]] const std::string& sku() const noexcept { return sku_; }

private:
    std::string sku_;
};

} // namespace replsim::io
