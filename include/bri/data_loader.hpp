#pragma once

/// @file include/bri/data_loader.hpp
/// @brief CSV loader for (x, value) observations.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV text containing observations into `std::vector<Observation>`.
/// Malformed or non-finite rows are skipped; the loader never crashes on bad
/// input.
///
/// ## Expected CSV Format
/// ```
/// x,value
/// 0.0,0.0
/// 10.0,100.0
/// ```
/// The first non-empty, non-comment line is treated as a header and skipped.
/// Lines starting with '#' are comments.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Rows keep file order; duplicate keys are left for the store to resolve

#include "bri/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bri::core {

class DataLoader {
public:
    /// Load observations from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid rows
    [[nodiscard]] static std::optional<std::vector<Observation>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse observations from CSV-formatted text (first line is a header).
    [[nodiscard]] static std::vector<Observation>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Parse a single data row "x,value". nullopt if malformed or non-finite.
    [[nodiscard]] static std::optional<Observation>
    parse_row(std::string_view line) noexcept;

    /// Parse one finite double occupying the whole (trimmed) token.
    [[nodiscard]] static std::optional<double>
    parse_double(std::string_view token) noexcept;
};

} // namespace bri::core
