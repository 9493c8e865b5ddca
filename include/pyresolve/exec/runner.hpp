/*
 * Command runner seam - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <pyresolve/exec/process.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pyresolve {

// Everything the probes need from the outside world besides the filesystem:
// PATH lookups and blocking subprocess runs.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual std::optional<std::string> which(const std::string& name) = 0;
    // Throws SpawnError when the program cannot be started.
    virtual ProcessResult run(const std::vector<std::string>& argv, StderrMode err_mode = StderrMode::Capture) = 0;
};

// Real PATH and real child processes.
class SystemRunner : public CommandRunner {
public:
    std::optional<std::string> which(const std::string& name) override;
    ProcessResult run(const std::vector<std::string>& argv, StderrMode err_mode = StderrMode::Capture) override;
};

std::unique_ptr<CommandRunner> make_runner();

} // namespace pyresolve
