#pragma once
#include <istream>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace data {

// timestamp_ms,open,high,low,close,volume with one header line.
// Malformed rows are skipped (and logged); returns the parsed bars in file order.
std::vector<core::Bar> read_csv_bars(std::istream& in);

// Throws std::runtime_error if the file cannot be opened.
std::vector<core::Bar> load_csv_bars(const std::string& path);

} // namespace data
