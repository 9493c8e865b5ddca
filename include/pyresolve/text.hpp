/*
 * Text helpers - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <string>

namespace pyresolve {

// Strip leading/trailing whitespace (spaces, tabs, CR, LF).
std::string trim(const std::string& s);

// Greedy word wrap. Words longer than width are kept whole on their own line.
std::string wrap_text(const std::string& text, std::size_t width);

// Width from $COLUMNS when it is a positive number, else 80.
std::size_t terminal_width();

} // namespace pyresolve
