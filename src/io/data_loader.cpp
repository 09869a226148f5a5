/// @file src/io/data_loader.cpp
/// @brief CSV DataLoader for price / timestamp / volume columns.

#include "cmf/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cmf {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_skippable(const std::string& line) {
    return line.empty() || line[0] == '#' ||
           line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // anonymous namespace

// ─── DataLoader::split_row ────────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_row(const std::string& line) noexcept {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    // getline drops a trailing empty field.
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

// ─── DataLoader::parse_field ──────────────────────────────────────────────────

std::optional<double> DataLoader::parse_field(const std::string& token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    const double val = std::strtod(begin, &end);
    if (end != begin + token.size() || errno == ERANGE) {
        return std::nullopt;  // trailing garbage or overflow
    }
    if (!std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

// ─── DataLoader::locate_columns ───────────────────────────────────────────────

std::optional<DataLoader::Columns>
DataLoader::locate_columns(const std::vector<std::string>& header) noexcept {
    std::optional<std::size_t> close, price, timestamp, volume;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string name = lower(header[i]);
        if (name == "close" && !close)              close = i;
        else if (name == "price" && !price)         price = i;
        else if (name == "timestamp" && !timestamp) timestamp = i;
        else if (name == "volume" && !volume)       volume = i;
    }

    if (!close && !price) {
        return std::nullopt;
    }
    return Columns{
        .price     = close ? *close : *price,
        .timestamp = timestamp,
        .volume    = volume,
    };
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

std::optional<PriceSeries>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::istringstream stream(csv_content);
    std::string line;

    std::optional<Columns> cols;
    while (std::getline(stream, line)) {
        if (is_skippable(line)) {
            continue;
        }
        // First non-empty, non-comment line is the header.
        cols = locate_columns(split_row(line));
        break;
    }
    if (!cols) {
        return std::nullopt;
    }

    PriceSeries series;
    while (std::getline(stream, line)) {
        if (is_skippable(line)) {
            continue;
        }

        const auto fields = split_row(line);
        auto read = [&fields](std::size_t idx) -> std::optional<double> {
            if (idx >= fields.size()) {
                return std::nullopt;
            }
            return parse_field(fields[idx]);
        };

        const auto price = read(cols->price);
        std::optional<double> ts, vol;
        if (cols->timestamp) ts  = read(*cols->timestamp);
        if (cols->volume)    vol = read(*cols->volume);

        const bool ok = price &&
                        (!cols->timestamp || ts) &&
                        (!cols->volume || (vol && *vol >= 0.0));
        if (!ok) {
            ++series.skipped_rows;
            continue;
        }

        series.prices.push_back(*price);
        if (ts)  series.timestamps.push_back(*ts);
        if (vol) series.volume.push_back(*vol);
    }

    return series;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<PriceSeries>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace cmf
