/*
 * Error types - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace pyresolve {

// Fatal resolution/configuration error. wrap_message tells the CLI whether
// the text may be re-flowed to the terminal width when printed.
class ResolveError : public std::runtime_error {
public:
    explicit ResolveError(const std::string& message, bool wrap_message = true)
        : std::runtime_error(message), m_wrap(wrap_message) {}
    bool wrap_message() const { return m_wrap; }
private:
    bool m_wrap;
};

enum class ResolutionSource { PyLauncher, Path };

// "py launcher" | "PATH"
const char* to_string(ResolutionSource source);

// No executable found (or it could not be invoked) for a requested version.
class InterpreterResolutionError : public ResolveError {
public:
    InterpreterResolutionError(ResolutionSource source, const std::string& version, bool wrap_message = true);
    ResolutionSource source() const { return m_source; }
    const std::string& version() const { return m_version; }
private:
    ResolutionSource m_source;
    std::string m_version;
};

// Builds the InterpreterResolutionError text, including the hints about
// what the version string looks like.
std::string resolution_message(ResolutionSource source, const std::string& version);

// A child process could not be started. Message: "<strerror>: '<argv0>'".
class SpawnError : public std::runtime_error {
public:
    SpawnError(int error_code, const std::string& program);
    int error_code() const { return m_errno; }
    const std::string& program() const { return m_program; }
private:
    int m_errno;
    std::string m_program;
};

} // namespace pyresolve
