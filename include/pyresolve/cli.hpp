/*
 * Command line parsing - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <pyresolve/config.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyresolve {

// Bad command line; the CLI prints usage and exits with status 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    bool help = false;
    std::optional<std::string> request; // --python
};

// Parse arguments (without argv[0]). --platform and --verbose are applied to cfg.
CliOptions parse_args(const std::vector<std::string>& args, ResolverConfig& cfg);

} // namespace pyresolve
