#pragma once
/// @file numberFormatUtil.hpp
/// @brief Strict numeric parsing and display/storage number formatting

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace SkuMaster::util {

/// @brief Currency symbol used for every currency rendering (Philippine peso)
constexpr const char* kCurrencySymbol = "₱";

/// @brief Copy of @p s without leading/trailing ASCII whitespace
inline std::string trimCopy(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    if (first >= last)
        return std::string();
    return std::string(first, last);
}

/// @brief ASCII lower-case copy of @p s
inline std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// @brief Parse a whole string as a base-10 long
/// @details Surrounding whitespace and a leading sign are accepted. Anything else left
///          over after the digits ("12abc", "12.5") is invalid_argument; values outside
///          the range of long are result_out_of_range.
/// @return true on success, @p out untouched on failure
inline bool parseLongStrict(const std::string& s, long& out, std::error_code& ec) {
    ec.clear();
    const std::string t = trimCopy(s);
    if (t.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    try {
        size_t pos = 0;
        long v = std::stol(t, &pos, 10);
        if (pos != t.size()) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        out = v;
        return true;
    } catch (const std::out_of_range&) {
        ec = std::make_error_code(std::errc::result_out_of_range);
    } catch (const std::invalid_argument&) {
        ec = std::make_error_code(std::errc::invalid_argument);
    }
    return false;
}

/// @brief Parse a whole string as a double
/// @details Accepts decimal and exponent notation, "inf" and "nan" with surrounding
///          whitespace. Hexadecimal floats are rejected. Overflow yields +-inf and
///          underflow the nearest subnormal (or zero); neither is an error.
inline bool parseDoubleStrict(const std::string& s, double& out, std::error_code& ec) {
    ec.clear();
    const std::string t = trimCopy(s);
    if (t.empty() || t.find_first_of("xX") != std::string::npos) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    // strtod은 ERANGE일 때도 HUGE_VAL 또는 subnormal 값을 돌려주므로 그대로 쓴다.
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || end != t.c_str() + t.size()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    out = v;
    return true;
}

/// @brief Shortest text that parses back to exactly @p v
/// @details Integral values keep a ".0" suffix so that the column still reads as a
///          decimal (10.0, not 10).
inline std::string formatDecimal(double v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string s(buf, res.ptr);
    if (s.find_first_not_of("-0123456789") == std::string::npos)
        s += ".0";
    return s;
}

/// @brief Fixed-point rendering with ',' every three integer digits
/// @param decimals Digits after the decimal point
/// @details -1234.5 -> "-1,234.50". Rounding follows printf.
inline std::string formatGrouped(double v, int decimals = 2) {
    if (!std::isfinite(v)) {
        if (std::isnan(v))
            return "nan";
        return v < 0 ? "-inf" : "inf";
    }

    char buf[512];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, std::fabs(v));
    std::string digits(buf);

    const size_t dot = digits.find('.');
    std::string intPart = digits.substr(0, dot);
    std::string fracPart = (dot == std::string::npos) ? std::string() : digits.substr(dot);

    std::string grouped;
    grouped.reserve(intPart.size() + intPart.size() / 3);
    const size_t lead = intPart.size() % 3;
    for (size_t i = 0; i < intPart.size(); ++i) {
        if (i != 0 && i % 3 == lead)
            grouped.push_back(',');
        grouped.push_back(intPart[i]);
    }

    return (std::signbit(v) ? "-" : "") + grouped + fracPart;
}

/// @brief Currency rendering: symbol, thousands separator, two decimals ("₱1,234.50")
inline std::string formatCurrency(double v) { return kCurrencySymbol + formatGrouped(v, 2); }

} // namespace SkuMaster::util
