/*
 * Configuration implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/config.hpp>
#include <pyresolve/log.hpp>
#include <pyresolve/text.hpp>
#include <cstdlib>
#include <fstream>

namespace pyresolve {

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static bool is_true(const std::string& v) { return v=="1"||v=="true"||v=="on"; }

bool parse_config_line(ResolverConfig& cfg, const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0]=='#') return true;
    auto eq = line.find('=');
    if (eq == std::string::npos) return true;
    std::string key = trim(line.substr(0,eq)), val = trim(line.substr(eq+1));
    if (key=="platform") {
        if (val=="auto") { cfg.platform.reset(); return true; }
        auto kind = parse_platform(val);
        if (!kind) { log::warn("config: unknown platform '" + val + "'"); return false; }
        cfg.platform = kind;
    }
    else if (key=="host_python") cfg.host_python = val;
    else if (key=="host_has_venv") cfg.host_has_venv = is_true(val);
    else if (key=="verbose") cfg.verbose = is_true(val);
    else { log::warn("config: unknown key '" + key + "'"); return false; }
    return true;
}

void load_config_stream(ResolverConfig& cfg, std::istream& in) {
    std::string line;
    while (std::getline(in, line)) parse_config_line(cfg, line);
}

void apply_environment(ResolverConfig& cfg) {
    std::string platform = getenv_or("PYRESOLVE_PLATFORM");
    if (!platform.empty()) parse_config_line(cfg, "platform=" + platform);
    std::string host = getenv_or("PYRESOLVE_HOST_PYTHON");
    if (!host.empty()) cfg.host_python = host;
    std::string verbose = getenv_or("PYRESOLVE_VERBOSE");
    if (!verbose.empty()) cfg.verbose = is_true(verbose);
    cfg.default_python = getenv_or(kDefaultPythonEnv);
}

ResolverConfig load_config() {
    ResolverConfig cfg;
    std::string home = getenv_or("HOME");
#ifdef _WIN32
    if (home.empty()) home = getenv_or("USERPROFILE");
#endif
    if (!home.empty()) {
        std::ifstream in(home + "/.pyresolverc");
        if (in) load_config_stream(cfg, in);
    }
    apply_environment(cfg);
    return cfg;
}

PlatformKind platform_kind(const ResolverConfig& cfg) {
    return cfg.platform ? *cfg.platform : detect_platform();
}

std::string host_executable(const ResolverConfig& cfg, PlatformKind kind) {
    if (!cfg.host_python.empty() || kind == PlatformKind::Restricted) return cfg.host_python;
    return PYRESOLVE_DEFAULT_HOST_PYTHON;
}

} // namespace pyresolve
