/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for (x, value) observations.

#include "bri/data_loader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace bri::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ─── DataLoader::parse_double ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_double(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+'; accept it like stod would.
    if (token.front() == '+') {
        token.remove_prefix(1);
    }

    double value = 0.0;
    const char* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<Observation> DataLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    const auto comma = line.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    // Exactly two fields.
    if (line.find(',', comma + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    const auto key   = parse_double(line.substr(0, comma));
    const auto value = parse_double(line.substr(comma + 1));
    if (!key || !value) {
        return std::nullopt;
    }
    return Observation{.key = *key, .value = *value};
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

std::vector<Observation>
DataLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<Observation> rows;
    bool header_skipped = false;

    while (!csv_content.empty()) {
        const auto nl = csv_content.find('\n');
        const auto line = trim(csv_content.substr(0, nl));
        csv_content = (nl == std::string_view::npos)
            ? std::string_view{}
            : csv_content.substr(nl + 1);

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto row = parse_row(line)) {
            rows.push_back(*row);
        }
    }

    return rows;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<std::vector<Observation>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace bri::core
