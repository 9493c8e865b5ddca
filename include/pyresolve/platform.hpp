/*
 * Platform selection - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace pyresolve {

// Restricted: Windows, where the host runtime may be an embeddable build
// without venv and app-store stubs can shadow a real interpreter.
// Standard: everything else.
enum class PlatformKind { Restricted, Standard };

// Decided from the build target, once, at startup.
PlatformKind detect_platform();

// "restricted" | "standard"
const char* to_string(PlatformKind kind);

// Accepts "restricted", "windows", "standard", "posix". Anything else: nullopt.
std::optional<PlatformKind> parse_platform(const std::string& s);

} // namespace pyresolve
