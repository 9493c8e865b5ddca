/*
 * Default interpreter selection - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <pyresolve/config.hpp>
#include <pyresolve/exec/runner.hpp>
#include <pyresolve/platform.hpp>
#include <memory>
#include <utility>
#include <string>

namespace pyresolve {

// The interpreter this tool acts on behalf of ("the running interpreter").
struct HostInterpreter {
    std::string executable;
    bool has_venv = true;   // the venv module is importable
};

// Path fragment of app-store installed executables.
inline constexpr const char* kStoreStubMarker = "WindowsApps";

class DefaultResolver {
public:
    virtual ~DefaultResolver() = default;
    // Throws ResolveError("No suitable Python found") when nothing usable exists.
    virtual std::string find_default() = 0;
};

// Standard platform: the host interpreter, no probing.
class StandardDefaultResolver : public DefaultResolver {
public:
    explicit StandardDefaultResolver(HostInterpreter host) : m_host(std::move(host)) {}
    std::string find_default() override;
private:
    HostInterpreter m_host;
};

// Restricted platform: host if it has venv, else py launcher / PATH python,
// rejecting app-store stubs.
class RestrictedDefaultResolver : public DefaultResolver {
public:
    RestrictedDefaultResolver(CommandRunner& runner, HostInterpreter host)
        : m_runner(runner), m_host(std::move(host)) {}
    std::string find_default() override;
private:
    // A store candidate counts only if `-V` succeeds and prints something.
    bool store_python_works(const std::string& python);
    CommandRunner& m_runner;
    HostInterpreter m_host;
};

std::unique_ptr<DefaultResolver> make_default_resolver(PlatformKind kind, CommandRunner& runner,
                                                       const HostInterpreter& host);

// Strict PATH lookup of an operator-supplied default. No launcher, no
// self-report. Throws ResolveError("Default python interpreter '<x>' is invalid.").
std::string get_absolute_python_interpreter(CommandRunner& runner, const std::string& env_python);

// Startup computation of the default interpreter: the PIPX_DEFAULT_PYTHON
// override when set, otherwise the platform's default resolver.
std::string compute_default_python(const ResolverConfig& cfg, CommandRunner& runner);

} // namespace pyresolve
