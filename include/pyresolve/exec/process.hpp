/*
 * Child process execution - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace pyresolve {

enum class StderrMode { Capture, Discard };

struct ProcessResult {
    int exit_code = 0;   // 128+signal when killed by a signal
    std::string out;     // captured stdout, untrimmed
    std::string err;     // captured stderr (empty with StderrMode::Discard)
};

// Run argv (argv[0] looked up on PATH when it has no directory part),
// block until it exits and collect its output. stdin is /dev/null.
// Throws SpawnError when the program cannot be started at all; a non-zero
// exit is reported through exit_code, never thrown.
ProcessResult run_process(const std::vector<std::string>& argv, StderrMode err_mode = StderrMode::Capture);

} // namespace pyresolve
