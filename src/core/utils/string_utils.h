#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sc {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);

// Case conversion
std::string toLower(std::string_view s);

// Split string by delimiter (empty fields are dropped)
std::vector<std::string> split(std::string_view s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, std::string_view delimiter);

// Parse number from string. On failure `out` is left untouched.
bool parseInt(std::string_view s, int& out);
bool parseUint64(std::string_view s, uint64_t& out);
bool parseDouble(std::string_view s, double& out);

// Accepts true/false, yes/no, on/off, 1/0
bool parseBool(std::string_view s, bool& out);

// Format a millimetre length for messages: "850 mm" or "12.40 m"
std::string formatLength(double millimeters);

// Format a money amount with two decimals
std::string formatAmount(double amount);

} // namespace str
} // namespace sc
