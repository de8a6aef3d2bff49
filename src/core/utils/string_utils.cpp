#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace sc {
namespace str {

std::string trim(std::string_view s) {
    auto first = std::find_if(s.begin(), s.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    auto last = std::find_if(s.rbegin(), s.rend(),
                             [](unsigned char c) { return !std::isspace(c); });
    if (first == s.end()) {
        return {};
    }
    return std::string(first, last.base());
}

std::string toLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> result;
    std::string current;

    for (char c : s) {
        if (c == delimiter) {
            if (!current.empty()) {
                result.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        result.push_back(std::move(current));
    }

    return result;
}

std::string join(const std::vector<std::string>& parts, std::string_view delimiter) {
    if (parts.empty()) {
        return "";
    }

    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter;
        result += parts[i];
    }
    return result;
}

bool parseInt(std::string_view s, int& out) {
    int value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec != std::errc{} || result.ptr != s.data() + s.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parseUint64(std::string_view s, uint64_t& out) {
    uint64_t value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec != std::errc{} || result.ptr != s.data() + s.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parseDouble(std::string_view s, double& out) {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    std::string str(s);
    double value = std::strtod(str.c_str(), &end);
    if (end != str.c_str() + str.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

bool parseBool(std::string_view s, bool& out) {
    std::string value = toLower(s);
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        out = true;
    } else if (value == "false" || value == "no" || value == "off" || value == "0") {
        out = false;
    } else {
        return false;
    }
    return true;
}

std::string formatLength(double millimeters) {
    std::ostringstream ss;
    if (std::abs(millimeters) < 1000.0) {
        ss << std::fixed << std::setprecision(0) << millimeters << " mm";
    } else {
        ss << std::fixed << std::setprecision(2) << millimeters / 1000.0 << " m";
    }
    return ss.str();
}

std::string formatAmount(double amount) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << amount;
    return ss.str();
}

}  // namespace str
}  // namespace sc
