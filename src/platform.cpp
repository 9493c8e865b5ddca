/*
 * Platform selection implementation - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <pyresolve/platform.hpp>

namespace pyresolve {

PlatformKind detect_platform() {
#ifdef _WIN32
    return PlatformKind::Restricted;
#else
    return PlatformKind::Standard;
#endif
}

const char* to_string(PlatformKind kind) {
    return kind == PlatformKind::Restricted ? "restricted" : "standard";
}

std::optional<PlatformKind> parse_platform(const std::string& s) {
    if (s == "restricted" || s == "windows") return PlatformKind::Restricted;
    if (s == "standard" || s == "posix") return PlatformKind::Standard;
    return std::nullopt;
}

} // namespace pyresolve
