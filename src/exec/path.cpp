/*
 * PATH resolution implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/exec/path.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#ifndef _WIN32
#include <unistd.h>
#endif

namespace pyresolve {
namespace fs = std::filesystem;

#ifdef _WIN32
static constexpr char kPathSep = ';';
#else
static constexpr char kPathSep = ':';
#endif

bool is_executable(const std::string& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec) || ec) return false;
#ifdef _WIN32
    return true;
#else
    return access(p.c_str(), X_OK) == 0;
#endif
}

static bool has_dir_component(const std::string& cmd) {
#ifdef _WIN32
    return cmd.find_first_of("/\\:") != std::string::npos;
#else
    return cmd.find('/') != std::string::npos;
#endif
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) { parts.push_back(s.substr(start)); break; }
        parts.push_back(s.substr(start, pos-start));
        start = pos+1;
    }
    return parts;
}

// Candidate file names for cmd within one directory.
static std::vector<std::string> candidates(const std::string& cmd) {
#ifdef _WIN32
    const char* pathext = std::getenv("PATHEXT");
    std::string exts = (pathext && *pathext) ? pathext : ".COM;.EXE;.BAT;.CMD";
    auto lower = [](std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); }); return s; };
    std::string lcmd = lower(cmd);
    std::vector<std::string> out;
    bool has_ext = false;
    for (auto &e : split(exts, ';')) {
        if (e.empty()) continue;
        std::string le = lower(e);
        if (lcmd.size() >= le.size() && lcmd.compare(lcmd.size()-le.size(), le.size(), le) == 0) { has_ext = true; break; }
    }
    if (has_ext) out.push_back(cmd);
    else for (auto &e : split(exts, ';')) if (!e.empty()) out.push_back(cmd + e);
    return out;
#else
    return {cmd};
#endif
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path) {
    if (cmd.empty()) return std::nullopt;
    if (has_dir_component(cmd)) {
        for (auto &c : candidates(cmd)) if (is_executable(c)) return c;
        return std::nullopt;
    }
    for (auto &d : split(search_path, kPathSep)) {
        if (d.empty()) continue;
        for (auto &c : candidates(cmd)) {
            std::string full = (fs::path(d) / c).string();
            if (is_executable(full)) return full;
        }
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        if (has_dir_component(cmd)) return resolve_executable(cmd, std::string());
        return std::nullopt;
    }
    return resolve_executable(cmd, path_env);
}

} // namespace pyresolve
