/*
 * pyresolve CLI - print the interpreter a request resolves to
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/cli.hpp>
#include <pyresolve/config.hpp>
#include <pyresolve/error.hpp>
#include <pyresolve/exec/runner.hpp>
#include <pyresolve/interpreter/default_python.hpp>
#include <pyresolve/interpreter/resolver.hpp>
#include <pyresolve/log.hpp>
#include <pyresolve/platform.hpp>
#include <pyresolve/text.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace pyresolve;

static void usage(std::ostream& os) {
    os << "Usage: pyresolve [--python <version|path|name>] [--platform auto|restricted|standard] [-v|--verbose]\n"
          "Prints the absolute path of the Python interpreter the request resolves to.\n"
          "Without --python prints the default interpreter (" << kDefaultPythonEnv << " overrides it).\n";
}

static void print_error(const ResolveError& e) {
    std::string msg = e.what();
    if (e.wrap_message()) msg = wrap_text(msg, terminal_width());
    std::cerr << msg << '\n';
}

int main(int argc, char* argv[]) {
    ResolverConfig cfg = load_config();
    CliOptions opts;
    try {
        opts = parse_args(std::vector<std::string>(argv+1, argv+argc), cfg);
    } catch (const UsageError& e) {
        std::cerr << "pyresolve: " << e.what() << '\n';
        usage(std::cerr);
        return 2;
    }
    if (opts.help) { usage(std::cout); return 0; }
    log::set_verbose(cfg.verbose);
    log::debug(std::string("platform=") + to_string(platform_kind(cfg)) + " host_python=" + host_executable(cfg, platform_kind(cfg)));

    auto runner = make_runner();
    std::string default_python;
    try {
        default_python = compute_default_python(cfg, *runner);
    } catch (const ResolveError& e) {
        print_error(e);
        return 1;
    }

    try {
        std::cout << resolve_request(*runner, opts.request, default_python) << '\n';
    } catch (const ResolveError& e) {
        print_error(e);
        return 1;
    }
    return 0;
}
