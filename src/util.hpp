#pragma once
#include <string>
#include <optional>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstdint>

inline bool is_space(char c){
    return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v';
}

inline std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e-1])) --e;
    return s.substr(b, e-b);
}

// Whole trimmed text must be a finite decimal number; "12abc", "", "nan", "inf"
// and hex forms like "0x10" are rejected.
inline std::optional<double> parse_number(const std::string& text){
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    size_t digits = (t[0] == '+' || t[0] == '-') ? 1 : 0;
    if (t.size() > digits + 1 && t[digits] == '0' && (t[digits+1] == 'x' || t[digits+1] == 'X'))
        return std::nullopt;
    const char* begin = t.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end != begin + t.size() || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
    return v;
}

inline std::optional<long long> parse_integer(const std::string& text){
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    const char* begin = t.c_str();
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(begin, &end, 10);
    if (end != begin + t.size() || errno == ERANGE) return std::nullopt;
    return v;
}

inline bool is_valid_utf8(const std::string& s){
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t n = s.size(), i = 0;
    while (i < n){
        unsigned char c = p[i];
        if (c < 0x80) { ++i; continue; }
        size_t len; uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k){
            if ((p[i+k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i+k] & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}
