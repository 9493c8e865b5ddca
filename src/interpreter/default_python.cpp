/*
 * Default interpreter selection implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/interpreter/default_python.hpp>
#include <pyresolve/interpreter/launcher.hpp>
#include <pyresolve/error.hpp>
#include <pyresolve/log.hpp>
#include <pyresolve/text.hpp>

namespace pyresolve {

static const char* kNoSuitablePython = "No suitable Python found";

std::string StandardDefaultResolver::find_default() {
    return m_host.executable;
}

bool RestrictedDefaultResolver::store_python_works(const std::string& python) {
    ProcessResult res;
    try {
        res = m_runner.run({python, "-V"}, StderrMode::Discard);
    } catch (const SpawnError& e) {
        log::debug(std::string("store python: ") + e.what());
        return false;
    }
    // The stub exits with 9009 or prints nothing; a real interpreter prints its version.
    if (res.exit_code != 0) return false;
    return !trim(res.out).empty();
}

std::string RestrictedDefaultResolver::find_default() {
    if (m_host.has_venv && !m_host.executable.empty()) return m_host.executable;

    std::optional<std::string> python = find_py_launcher_python(m_runner);
    if (!python) python = m_runner.which("python");
    if (!python) throw ResolveError(kNoSuitablePython);

    if (python->find(kStoreStubMarker) == std::string::npos) return *python;
    log::debug("'" + *python + "' looks like a store install, checking it runs");
    if (!store_python_works(*python)) throw ResolveError(kNoSuitablePython);
    return *python;
}

std::unique_ptr<DefaultResolver> make_default_resolver(PlatformKind kind, CommandRunner& runner,
                                                       const HostInterpreter& host) {
    if (kind == PlatformKind::Restricted) return std::make_unique<RestrictedDefaultResolver>(runner, host);
    return std::make_unique<StandardDefaultResolver>(host);
}

std::string get_absolute_python_interpreter(CommandRunner& runner, const std::string& env_python) {
    auto which_python = runner.which(env_python);
    if (!which_python) throw ResolveError("Default python interpreter '" + env_python + "' is invalid.");
    return *which_python;
}

std::string compute_default_python(const ResolverConfig& cfg, CommandRunner& runner) {
    if (!cfg.default_python.empty()) {
        log::debug(std::string(kDefaultPythonEnv) + "=" + cfg.default_python);
        return get_absolute_python_interpreter(runner, cfg.default_python);
    }
    PlatformKind kind = platform_kind(cfg);
    HostInterpreter host{host_executable(cfg, kind), cfg.host_has_venv};
    return make_default_resolver(kind, runner, host)->find_default();
}

} // namespace pyresolve
