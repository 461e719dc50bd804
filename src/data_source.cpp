#include "data_source.hpp"
#include "timestamp.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace ledgerbt {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

// Whole field must be a number.
bool parseDouble(const std::string& s, double& out) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    std::ifstream f(filepath_);
    if (!f.is_open()) {
        std::cerr << "Failed to open data file: " << filepath_ << "\n";
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) {
        std::cerr << "Data file is empty: " << filepath_ << "\n";
        return false;
    }
    // Strip UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) {
        if (h.size() >= 2 && h.front() == '"' && h.back() == '"') h = h.substr(1, h.size() - 2);
        toLower(h);
    }

    Columns cols;
    cols.time = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    cols.open = findColumn(headers, {"open", "o"});
    cols.high = findColumn(headers, {"high", "h"});
    cols.low = findColumn(headers, {"low", "l"});
    cols.close = findColumn(headers, {"close", "c"});
    cols.volume = findColumn(headers, {"volume", "vol", "v"});

    if (cols.time < 0 || cols.open < 0 || cols.high < 0 || cols.low < 0 || cols.close < 0) {
        std::cerr << "Missing required column (timestamp, open, high, low, close) in " << filepath_ << "\n";
        return false;
    }

    std::size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto bar = parseLine(line, cols);
        if (!bar) {
            std::cerr << "Malformed row at " << filepath_ << ":" << line_no << "\n";
            bars_.clear();
            return false;
        }
        bars_.push_back(*bar);
    }

    return true;
}

std::optional<Bar> DataSource::parseLine(const std::string& line, const Columns& cols) {
    auto parts = split(line, ',');
    auto field = [&parts](int idx) -> const std::string* {
        if (idx < 0 || static_cast<std::size_t>(idx) >= parts.size()) return nullptr;
        return &parts[static_cast<std::size_t>(idx)];
    };

    const std::string* ts = field(cols.time);
    if (!ts) return std::nullopt;
    auto time = parseTimestamp(*ts);
    if (!time) return std::nullopt;

    Bar b;
    b.time = *time;
    const std::string* o = field(cols.open);
    const std::string* h = field(cols.high);
    const std::string* l = field(cols.low);
    const std::string* c = field(cols.close);
    if (!o || !h || !l || !c) return std::nullopt;
    if (!parseDouble(*o, b.open) || !parseDouble(*h, b.high)
        || !parseDouble(*l, b.low) || !parseDouble(*c, b.close))
        return std::nullopt;

    if (cols.volume >= 0) {
        const std::string* v = field(cols.volume);
        if (!v || !parseDouble(*v, b.volume)) return std::nullopt;
    }
    return b;
}

} // namespace ledgerbt
