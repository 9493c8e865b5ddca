/*
 * Python launcher probe implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/interpreter/launcher.hpp>
#include <pyresolve/error.hpp>
#include <pyresolve/log.hpp>
#include <pyresolve/text.hpp>

namespace pyresolve {

std::string launcher_version_tag(const std::string& python_version) {
    static const std::string prefix = "python";
    if (python_version.rfind(prefix, 0) != 0) return python_version;
    log::warn("Removing `python` from the start of the version, as pylauncher just expects the semantic version");
    return python_version.substr(prefix.size());
}

std::optional<std::string> find_py_launcher_python(CommandRunner& runner,
                                                   const std::optional<std::string>& python_version) {
    auto py = runner.which(kPyLauncher);
    if (!py) {
        log::debug("py launcher not found on PATH");
        return std::nullopt;
    }
    if (!python_version || python_version->empty()) return py;

    std::string tag = launcher_version_tag(*python_version);
    ProcessResult res;
    try {
        res = runner.run({*py, "-" + tag, "-c", kSelfReportScript});
    } catch (const SpawnError& e) {
        log::debug(std::string("py launcher: ") + e.what());
        throw InterpreterResolutionError(ResolutionSource::PyLauncher, *python_version);
    }
    if (res.exit_code != 0) {
        log::debug("py launcher exited with status " + std::to_string(res.exit_code) + ": " + trim(res.err));
        throw InterpreterResolutionError(ResolutionSource::PyLauncher, *python_version);
    }
    return trim(res.out);
}

} // namespace pyresolve
