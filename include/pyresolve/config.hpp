/*
 * Configuration - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <pyresolve/platform.hpp>
#include <istream>
#include <optional>
#include <string>

#ifndef PYRESOLVE_DEFAULT_HOST_PYTHON
#define PYRESOLVE_DEFAULT_HOST_PYTHON "/usr/bin/python3"
#endif

namespace pyresolve {

// Override variable for the default interpreter.
inline constexpr const char* kDefaultPythonEnv = "PIPX_DEFAULT_PYTHON";

// Built once at startup and passed down by reference.
struct ResolverConfig {
    std::optional<PlatformKind> platform;                   // platform (auto when unset)
    std::string host_python;                                // host_python (unset: see host_executable)
    bool host_has_venv = true;                              // host_has_venv
    bool verbose = false;                                   // verbose
    std::string default_python;                             // PIPX_DEFAULT_PYTHON (env only)
};

// Host interpreter for the given platform. An unset host_python falls back to
// PYRESOLVE_DEFAULT_HOST_PYTHON on the standard platform and stays empty on the
// restricted one, where the default is searched for instead.
std::string host_executable(const ResolverConfig& cfg, PlatformKind kind);

// Apply one "key=value" line. Blank lines, comments and lines without '='
// are skipped; returns false only for an unknown key or a bad value.
bool parse_config_line(ResolverConfig& cfg, const std::string& line);

// Apply every line of an rc stream.
void load_config_stream(ResolverConfig& cfg, std::istream& in);

// PYRESOLVE_PLATFORM, PYRESOLVE_HOST_PYTHON, PYRESOLVE_VERBOSE, PIPX_DEFAULT_PYTHON.
void apply_environment(ResolverConfig& cfg);

// Defaults, then ~/.pyresolverc, then the environment.
ResolverConfig load_config();

// Configured platform or the detected one.
PlatformKind platform_kind(const ResolverConfig& cfg);

} // namespace pyresolve
