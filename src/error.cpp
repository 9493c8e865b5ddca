/*
 * Error types implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/error.hpp>
#include <cstring>

namespace pyresolve {

const char* to_string(ResolutionSource source) {
    switch (source) {
        case ResolutionSource::PyLauncher: return "py launcher";
        case ResolutionSource::Path: return "PATH";
    }
    return "?";
}

std::string resolution_message(ResolutionSource source, const std::string& version) {
    bool potentially_path = version.find('/') != std::string::npos;
    bool potentially_pylauncher = version.find("python") == std::string::npos && !potentially_path;

    std::string message = "No executable for the provided Python version '" + version + "' found in " +
                          to_string(source) + ". Please make sure the provided version is ";
    if (source == ResolutionSource::PyLauncher) {
        message += "listed when running `py --list`.";
    } else {
        message += "on your PATH or the file path is valid. ";
        if (potentially_path)
            message += "The provided version looks like a path, but no executable was found there.";
        if (potentially_pylauncher)
            message += "The provided version looks like a version for Python Launcher, but `py` was not found on PATH.";
    }
    return message;
}

InterpreterResolutionError::InterpreterResolutionError(ResolutionSource source, const std::string& version,
                                                       bool wrap_message)
    : ResolveError(resolution_message(source, version), wrap_message), m_source(source), m_version(version) {}

SpawnError::SpawnError(int error_code, const std::string& program)
    : std::runtime_error(std::string(std::strerror(error_code)) + ": '" + program + "'"),
      m_errno(error_code), m_program(program) {}

} // namespace pyresolve
