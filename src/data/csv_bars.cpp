#include "data/csv_bars.hpp"
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data {

// whole field or nothing: stoll/stod alone stop at the first bad character
static std::int64_t to_i64(const std::string& x){
    std::size_t pos = 0;
    const long long v = std::stoll(x, &pos);
    if (pos != x.size()) throw std::invalid_argument("trailing characters in '" + x + "'");
    return v;
}

static double to_f64(const std::string& x){
    std::size_t pos = 0;
    const double v = std::stod(x, &pos);
    if (pos != x.size()) throw std::invalid_argument("trailing characters in '" + x + "'");
    return v;
}

static bool parse_row(const std::string& line, core::Bar& b){
    std::stringstream ss(line);
    std::string x;
    try {
        if (!std::getline(ss,x,',')) return false; b.timestamp_ms = to_i64(x);
        if (!std::getline(ss,x,',')) return false; b.open = to_f64(x);
        if (!std::getline(ss,x,',')) return false; b.high = to_f64(x);
        if (!std::getline(ss,x,',')) return false; b.low = to_f64(x);
        if (!std::getline(ss,x,',')) return false; b.close = to_f64(x);
        if (!std::getline(ss,x,',')) return false; b.volume = to_f64(x);
    } catch (const std::logic_error&) {
        return false; // invalid_argument, out_of_range
    }
    return true;
}

std::vector<core::Bar> read_csv_bars(std::istream& in){
    std::vector<core::Bar> out;
    std::string line;
    std::getline(in, line); // header
    std::size_t lineno = 1, skipped = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        core::Bar b{};
        if (!parse_row(line, b)) {
            spdlog::warn("csv line {}: malformed row skipped", lineno);
            ++skipped;
            continue;
        }
        out.push_back(b);
    }
    if (skipped) spdlog::warn("csv: {} malformed rows skipped", skipped);
    return out;
}

std::vector<core::Bar> load_csv_bars(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("cannot open " + path);
    auto bars = read_csv_bars(f);
    spdlog::info("csv {}: {} bars", path, bars.size());
    return bars;
}

} // namespace data
