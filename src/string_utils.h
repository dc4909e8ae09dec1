#pragma once
#ifndef IMOVERLAY_STRING_UTILS_H
#define IMOVERLAY_STRING_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <locale>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

static inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c));
}

static inline void ltrim(std::string &s) {
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), is_space));
}

static inline void rtrim(std::string &s) {
    s.erase(std::find_if_not(s.rbegin(), s.rend(), is_space).base(), s.end());
}

static inline void trim(std::string &s) {
    rtrim(s);
    ltrim(s);
}

static inline std::string trim_copy(std::string s) {
    trim(s);
    return s;
}

static inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Splits on any of `delims`, empty tokens are dropped.
static std::vector<std::string> str_tokenize(const std::string& s, const std::string& delims)
{
    std::vector<std::string> tokens;
    size_t start = s.find_first_not_of(delims);
    while (start != std::string::npos) {
        size_t end = s.find_first_of(delims, start);
        tokens.push_back(s.substr(start, end - start));
        start = s.find_first_not_of(delims, end);
    }
    return tokens;
}

// Whole string must be an integer, surrounding whitespace is fine.
static bool try_stoi(int& val, const std::string& str)
{
    const char *begin = str.c_str();
    char *end = nullptr;
    errno = 0;
    long v = strtol(begin, &end, 0);
    if (end == begin || errno == ERANGE || v < INT_MIN || v > INT_MAX)
        return false;
    while (*end && is_space(*end))
        end++;
    if (*end)
        return false;
    val = static_cast<int>(v);
    return true;
}

// Locale independent, "1,5" never parses as 1.5. Trailing garbage throws.
static float parse_float(const std::string& s)
{
    std::istringstream ss(s);
    ss.imbue(std::locale::classic());
    float ret;
    ss >> ret;
    if (ss.fail())
        throw std::invalid_argument("not a number: '" + s + "'");
    ss >> std::ws;
    if (!ss.eof())
        throw std::invalid_argument("trailing characters in '" + s + "'");
    return ret;
}

#pragma GCC diagnostic pop

#endif //IMOVERLAY_STRING_UTILS_H
