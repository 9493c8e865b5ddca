/*
 * Diagnostics - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace pyresolve::log {

// Debug lines are dropped unless verbose is on. Warnings always go to stderr.
void set_verbose(bool on);
bool verbose();

void warn(const std::string& msg);
void debug(const std::string& msg);

} // namespace pyresolve::log
