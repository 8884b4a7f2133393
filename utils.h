#ifndef UTILS_H
#define UTILS_H

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

// --- Environment configuration ---

inline int getenv_int(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    try { return std::stoi(v); } catch (...) { return def; }
}

inline bool getenv_bool(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    std::string s(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

inline std::string getenv_string(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    return std::string(v);
}

// --- Text helpers ---

// printf-style "%.Nf" without pulling iomanip into every caller
inline std::string format_fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::string(buf);
}

// Decodes one UTF-8 sequence starting at text[i] and advances i past it.
// Malformed input yields U+FFFD: a stray lead or continuation byte consumes one
// byte, a bad continuation byte stops before it, a truncated tail ends the string.
inline int utf8_next_codepoint(const std::string& text, size_t& i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    size_t len = 1;
    int cp = 0xFFFD;
    if (c < 0x80) {
        cp = c;
    } else if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
    } else {
        ++i;
        return 0xFFFD;
    }
    if (i + len > text.size()) {
        i = text.size();
        return 0xFFFD;
    }
    for (size_t k = 1; k < len; ++k) {
        const unsigned char cc = static_cast<unsigned char>(text[i + k]);
        if ((cc & 0xC0) != 0x80) {
            i += k;
            return 0xFFFD;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    i += len;
    return cp;
}

// First line of a sysfs/procfs file, trailing whitespace stripped.
// Returns false when the file cannot be opened or is empty.
inline bool read_first_line(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    if (!std::getline(f, out)) return false;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' ||
                            out.back() == ' ' || out.back() == '\t')) {
        out.pop_back();
    }
    return !out.empty();
}

#endif // UTILS_H
