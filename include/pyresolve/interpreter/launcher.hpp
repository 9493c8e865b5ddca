/*
 * Python launcher probe - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <pyresolve/exec/runner.hpp>
#include <optional>
#include <string>

namespace pyresolve {

// Script every candidate runs to report where it really lives.
inline constexpr const char* kSelfReportScript = "import sys; print(sys.executable)";

// Name of the version-dispatch launcher looked up on PATH.
inline constexpr const char* kPyLauncher = "py";

// Ask the `py` launcher for an interpreter.
//  - launcher not on PATH: nullopt (caller falls back, not an error)
//  - no version: the launcher's own path
//  - version: `py -<version> -c <self-report>` stdout, trimmed; a leading
//    "python" is dropped from the version first. Empty output comes back
//    as an empty string.
// Throws InterpreterResolutionError (source "py launcher") when the launcher
// cannot be started or exits non-zero, e.g. for an unregistered version.
std::optional<std::string> find_py_launcher_python(CommandRunner& runner,
                                                   const std::optional<std::string>& python_version = std::nullopt);

// "python3.11" -> "3.11"; anything not starting with "python" is returned as-is.
std::string launcher_version_tag(const std::string& python_version);

} // namespace pyresolve
