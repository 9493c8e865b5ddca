/*
 * Interpreter resolution implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/interpreter/resolver.hpp>
#include <pyresolve/interpreter/launcher.hpp>
#include <pyresolve/log.hpp>
#include <pyresolve/text.hpp>
#include <filesystem>
#include <system_error>

namespace pyresolve {
namespace fs = std::filesystem;

static bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

std::string canonicalize_interpreter(const std::string& path, ResolutionSource source, const std::string& version) {
    if (path.empty()) throw InterpreterResolutionError(source, version);
    if (is_symlink(path)) return path;
    std::error_code ec;
    fs::path real = fs::canonical(path, ec);
    if (ec) {
        log::debug("cannot canonicalize '" + path + "': " + ec.message());
        throw InterpreterResolutionError(source, version);
    }
    return real.string();
}

// PATH fallback: literal lookup, then ask the found executable where it lives.
static std::string find_on_path(CommandRunner& runner, const std::string& python_version) {
    auto found = runner.which(python_version);
    if (!found) throw InterpreterResolutionError(ResolutionSource::Path, python_version);

    std::string path_python = canonicalize_interpreter(*found, ResolutionSource::Path, python_version);
    ProcessResult res;
    try {
        res = runner.run({path_python, "-c", kSelfReportScript});
    } catch (const SpawnError& e) {
        log::debug(std::string("PATH candidate: ") + e.what());
        throw InterpreterResolutionError(ResolutionSource::Path, python_version);
    }
    if (res.exit_code != 0) {
        log::debug("'" + path_python + "' exited with status " + std::to_string(res.exit_code));
        throw InterpreterResolutionError(ResolutionSource::Path, python_version);
    }
    return trim(res.out);
}

std::string find_python_interpreter(CommandRunner& runner, const std::string& python_version) {
    ResolutionSource source = ResolutionSource::PyLauncher;
    std::optional<std::string> py_executable = find_py_launcher_python(runner, python_version);
    if (!py_executable || py_executable->empty()) {
        log::debug("falling back to PATH lookup for '" + python_version + "'");
        source = ResolutionSource::Path;
        py_executable = find_on_path(runner, python_version);
    }
    return canonicalize_interpreter(*py_executable, source, python_version);
}

std::string resolve_request(CommandRunner& runner, const std::optional<std::string>& request,
                            const std::string& default_python) {
    if (request && !request->empty()) return find_python_interpreter(runner, *request);
    return default_python;
}

} // namespace pyresolve
