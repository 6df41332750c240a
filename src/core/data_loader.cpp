/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for technical snapshots and option chains.

#include "pfv/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace pfv::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return cells;
}

[[nodiscard]] std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Non-blank, non-comment lines with carriage returns stripped.
[[nodiscard]] std::vector<std::string> content_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty() || line[0] == '#') continue;
        lines.push_back(line);
    }
    return lines;
}

[[nodiscard]] std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) return std::nullopt;

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

}  // namespace

// ─── DataLoader::parse_number ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;

    double val = 0.0;
    const auto* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, val);
    if (ec != std::errc{} || ptr != end) return std::nullopt;  // trailing garbage
    if (!std::isfinite(val)) return std::nullopt;
    return val;
}

// ─── DataLoader::parse_date ───────────────────────────────────────────────────

std::optional<Date> DataLoader::parse_date(std::string_view text) noexcept {
    text = trim(text);
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    const auto parse = [](std::string_view part, auto& out) {
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), out);
        return ec == std::errc{} && ptr == part.data() + part.size();
    };
    if (!parse(text.substr(0, 4), y) || !parse(text.substr(5, 2), m) ||
        !parse(text.substr(8, 2), d)) {
        return std::nullopt;
    }

    const Date date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) return std::nullopt;
    return date;
}

// ─── DataLoader::parse_technical ──────────────────────────────────────────────

std::optional<TechnicalData>
DataLoader::parse_technical(const std::string& csv_content) noexcept {
    const auto lines = content_lines(csv_content);
    if (lines.size() < 2) return std::nullopt;

    const auto header = split(lines[0]);
    const auto row    = split(lines[1]);

    TechnicalData data;
    for (std::size_t i = 0; i < header.size() && i < row.size(); ++i) {
        const std::string key = lower(header[i]);
        const auto value = parse_number(row[i]);
        if (!value) continue;

        if      (key == "current_price")       data.current_price = *value;
        else if (key == "ma20")                data.ma20 = value;
        else if (key == "ma50")                data.ma50 = value;
        else if (key == "ma200")               data.ma200 = value;
        else if (key == "fifty_two_week_high") data.fifty_two_week_high = *value;
        else if (key == "fifty_two_week_low")  data.fifty_two_week_low = *value;
        else if (key == "recent_swing_high")   data.recent_swing_high = value;
        else if (key == "recent_swing_low")    data.recent_swing_low = value;
        else if (key == "previous_close")      data.previous_close = value;
        else if (key == "vwap")                data.vwap = value;
        else if (key == "avg_volume")          data.avg_volume = value;
    }
    return data;
}

std::optional<TechnicalData>
DataLoader::load_technical(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_technical(*contents);
}

// ─── DataLoader::parse_chain ──────────────────────────────────────────────────

std::vector<OptionsExpiration>
DataLoader::parse_chain(const std::string& csv_content) noexcept {
    std::vector<OptionsExpiration> expirations;
    const auto lines = content_lines(csv_content);

    // First content line is the header.
    for (std::size_t li = 1; li < lines.size(); ++li) {
        const auto cells = split(lines[li]);
        if (cells.size() < 6) continue;

        const auto date   = parse_date(cells[0]);
        const auto dte    = parse_number(cells[1]);
        const auto strike = parse_number(cells[3]);
        const auto oi     = parse_number(cells[4]);
        const auto volume = parse_number(cells[5]);
        if (!date || !dte || !strike || !oi || !volume) continue;
        if (*dte < 0.0 || *dte > 36500.0 || *strike <= 0.0 || *oi < 0.0 || *volume < 0.0) continue;

        const std::string kind = lower(cells[2]);
        const bool is_call = (kind == "call" || kind == "c");
        const bool is_put  = (kind == "put"  || kind == "p");
        if (!is_call && !is_put) continue;

        OptionContract contract{
            .strike        = *strike,
            .open_interest = *oi,
            .volume        = *volume,
        };
        if (cells.size() > 6) contract.implied_volatility = parse_number(cells[6]);
        if (cells.size() > 7) contract.delta = parse_number(cells[7]);
        if (cells.size() > 8) contract.gamma = parse_number(cells[8]);

        auto it = std::find_if(expirations.begin(), expirations.end(),
                               [&](const OptionsExpiration& e) {
                                   return e.expiration == *date;
                               });
        if (it == expirations.end()) {
            OptionsExpiration fresh;
            fresh.expiration = *date;
            fresh.dte = static_cast<int>(*dte);
            expirations.push_back(std::move(fresh));
            it = std::prev(expirations.end());
        }

        if (is_call) {
            it->calls.push_back(contract);
            it->total_call_oi += contract.open_interest;
        } else {
            it->puts.push_back(contract);
            it->total_put_oi += contract.open_interest;
        }
    }

    return expirations;
}

std::optional<std::vector<OptionsExpiration>>
DataLoader::load_chain(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) return std::nullopt;
    return parse_chain(*contents);
}

}  // namespace pfv::core
