#pragma once

/// @file include/cmf/data_loader.hpp
/// @brief CSV loader for price series.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse a CSV file with a header row into a `PriceSeries`. Columns are
/// located by name, case-insensitively:
///
///   | column      | required | notes                        |
///   |-------------|----------|------------------------------|
///   | `close`     | yes*     | *or `price`; `close` wins    |
///   | `timestamp` | no       | numeric (e.g. epoch seconds) |
///   | `volume`    | no       | non-negative                 |
///
/// Other columns are ignored.
///
/// ```
/// timestamp,open,high,low,close,volume
/// 1,100.0,105.0,99.0,103.0,1000000
/// 2,103.0,107.0,102.0,106.5,1200000
/// ```
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the file cannot be opened or the
///   header has no price column
/// - A row with a missing, non-numeric or non-finite value in any located
///   column, or a negative volume, is skipped and counted
/// - Blank lines and lines starting with `#` are ignored

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cmf {

/// Columns read from one CSV source. `timestamps` and `volume` are empty
/// when the header does not name them.
struct PriceSeries {
    std::vector<double> timestamps;
    std::vector<double> prices;
    std::vector<double> volume;
    std::size_t         skipped_rows = 0;

    [[nodiscard]] std::size_t size() const noexcept { return prices.size(); }
};

class DataLoader {
public:
    /// Load a price series from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or has no price column
    /// - otherwise the parsed series, possibly empty
    [[nodiscard]] static std::optional<PriceSeries>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a CSV-formatted string. Same rules as `load_csv`.
    [[nodiscard]] static std::optional<PriceSeries>
    parse_csv_string(const std::string& csv_content) noexcept;

private:
    /// Zero-based column positions resolved from the header.
    struct Columns {
        std::size_t                price;
        std::optional<std::size_t> timestamp;
        std::optional<std::size_t> volume;
    };

    [[nodiscard]] static std::optional<Columns>
    locate_columns(const std::vector<std::string>& header) noexcept;

    [[nodiscard]] static std::vector<std::string>
    split_row(const std::string& line) noexcept;

    /// Strict numeric parse of one trimmed field; `nullopt` if any
    /// characters remain or the value is not finite.
    [[nodiscard]] static std::optional<double>
    parse_field(const std::string& token) noexcept;
};

}  // namespace cmf
