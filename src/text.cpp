/*
 * Text helpers implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/text.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace pyresolve {

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b-a);
}

std::string wrap_text(const std::string& text, std::size_t width) {
    if (width == 0) return text;
    std::istringstream iss(text);
    std::string word, out, line;
    while (iss >> word) {
        if (line.empty()) { line = word; continue; }
        if (line.size() + 1 + word.size() <= width) {
            line += ' ';
            line += word;
        } else {
            out += line;
            out += '\n';
            line = word;
        }
    }
    out += line;
    return out;
}

std::size_t terminal_width() {
    const char* cols = std::getenv("COLUMNS");
    if (cols && *cols) {
        char* end = nullptr;
        long n = std::strtol(cols, &end, 10);
        if (end && *end == '\0' && n > 0) return static_cast<std::size_t>(n);
    }
    return 80;
}

} // namespace pyresolve
