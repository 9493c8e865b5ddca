/*
 * Interpreter resolution - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <pyresolve/error.hpp>
#include <pyresolve/exec/runner.hpp>
#include <optional>
#include <string>

namespace pyresolve {

// Resolve an explicit version/path request to an interpreter executable.
// Tries the py launcher first and falls back to a PATH lookup of the literal
// request followed by a self-report run of what was found.
// Throws InterpreterResolutionError tagged with the probe that failed.
std::string find_python_interpreter(CommandRunner& runner, const std::string& python_version);

// Symlinks are returned untouched (virtual environments depend on them);
// anything else becomes its canonical absolute path. A path whose target
// does not exist throws InterpreterResolutionError{source, version}.
std::string canonicalize_interpreter(const std::string& path, ResolutionSource source, const std::string& version);

// Entry point used by the CLI: a non-empty request goes through
// find_python_interpreter, otherwise default_python (computed at startup)
// is returned.
std::string resolve_request(CommandRunner& runner, const std::optional<std::string>& request,
                            const std::string& default_python);

} // namespace pyresolve
