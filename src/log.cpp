/*
 * Diagnostics implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/log.hpp>
#include <iostream>

namespace pyresolve::log {

static bool g_verbose = false;

void set_verbose(bool on) { g_verbose = on; }
bool verbose() { return g_verbose; }

void warn(const std::string& msg) {
    std::cerr << "[warn] " << msg << '\n';
}

void debug(const std::string& msg) {
    if (!g_verbose) return;
    std::cerr << "[debug] " << msg << '\n';
}

} // namespace pyresolve::log
