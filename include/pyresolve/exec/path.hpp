/*
 * PATH resolution utilities - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace pyresolve {

// Locate an executable the way a shell would.
// A name with a directory separator is checked as-is (no PATH search);
// otherwise each PATH entry is tried in order. On Windows PATHEXT suffixes
// are tried too when the name carries no known extension.
std::optional<std::string> resolve_executable(const std::string& cmd);

// Same lookup against an explicit search path instead of $PATH.
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path);

// True for an existing regular file the current user may execute.
bool is_executable(const std::string& p);

} // namespace pyresolve
