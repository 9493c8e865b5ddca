/*
 * Command runner implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/exec/runner.hpp>
#include <pyresolve/exec/path.hpp>
#include <pyresolve/log.hpp>

namespace pyresolve {

std::optional<std::string> SystemRunner::which(const std::string& name) {
    return resolve_executable(name);
}

ProcessResult SystemRunner::run(const std::vector<std::string>& argv, StderrMode err_mode) {
    if (log::verbose()) {
        std::string line;
        for (auto &a : argv) { if (!line.empty()) line.push_back(' '); line += a; }
        log::debug("exec: " + line);
    }
    return run_process(argv, err_mode);
}

std::unique_ptr<CommandRunner> make_runner() {
    return std::make_unique<SystemRunner>();
}

} // namespace pyresolve
