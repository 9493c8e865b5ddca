/*
 * Command line parsing - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/cli.hpp>
#include <pyresolve/platform.hpp>

namespace pyresolve {

CliOptions parse_args(const std::vector<std::string>& args, ResolverConfig& cfg) {
    CliOptions opts;
    for (size_t i=0;i<args.size();++i) {
        const std::string& a = args[i];
        if (a=="-h"||a=="--help") { opts.help = true; return opts; }
        if (a=="-v"||a=="--verbose") { cfg.verbose = true; continue; }
        if (a=="--python"||a=="--platform") {
            if (i+1 >= args.size()) throw UsageError("option '" + a + "' requires a value");
            const std::string& val = args[++i];
            if (a=="--python") { opts.request = val; continue; }
            if (val=="auto") { cfg.platform.reset(); continue; }
            auto kind = parse_platform(val);
            if (!kind) throw UsageError("unknown platform '" + val + "'");
            cfg.platform = kind;
            continue;
        }
        throw UsageError("unexpected argument '" + a + "'");
    }
    return opts;
}

} // namespace pyresolve
