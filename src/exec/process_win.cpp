/*
 * Windows child process execution - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifdef _WIN32
#include <pyresolve/exec/process.hpp>
#include <pyresolve/exec/path.hpp>
#include <pyresolve/error.hpp>
#include <windows.h>
#include <cerrno>
#include <string>
#include <thread>

namespace pyresolve {

static int errno_from_win32(DWORD code) {
    switch (code) {
        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND: return ENOENT;
        case ERROR_ACCESS_DENIED: return EACCES;
        case ERROR_BAD_EXE_FORMAT: return ENOEXEC;
        default: return EINVAL;
    }
}

// Quote one argument following the MSVC runtime command line rules.
static std::string quote_arg(const std::string& a) {
    if (!a.empty() && a.find_first_of(" \t\"") == std::string::npos) return a;
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : a) {
        if (c == '\\') { ++backslashes; continue; }
        if (c == '"') { out.append(backslashes*2+1, '\\'); out.push_back('"'); }
        else { out.append(backslashes, '\\'); out.push_back(c); }
        backslashes = 0;
    }
    out.append(backslashes*2, '\\');
    out.push_back('"');
    return out;
}

static void read_all(HANDLE h, std::string& into) {
    char buf[4096]; DWORD n = 0;
    while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0) into.append(buf, buf+n);
}

ProcessResult run_process(const std::vector<std::string>& argv, StderrMode err_mode) {
    if (argv.empty() || argv[0].empty()) throw SpawnError(ENOENT, "");
    // CreateProcess does not search PATH with PATHEXT the way a shell does.
    auto exe = resolve_executable(argv[0]);
    if (!exe) throw SpawnError(ENOENT, argv[0]);

    std::string cmdline;
    for (size_t i=0;i<argv.size();++i) {
        if (i) cmdline.push_back(' ');
        cmdline += quote_arg(i == 0 ? *exe : argv[i]);
    }

    SECURITY_ATTRIBUTES sa{sizeof(sa), nullptr, TRUE};
    HANDLE out_read = nullptr, out_write = nullptr, err_read = nullptr, err_write = nullptr;
    if (!CreatePipe(&out_read, &out_write, &sa, 0)) throw SpawnError(errno_from_win32(GetLastError()), argv[0]);
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    if (err_mode == StderrMode::Capture) {
        if (!CreatePipe(&err_read, &err_write, &sa, 0)) {
            DWORD code = GetLastError();
            CloseHandle(out_read); CloseHandle(out_write);
            throw SpawnError(errno_from_win32(code), argv[0]);
        }
        SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);
    } else {
        err_write = CreateFileA("NUL", GENERIC_WRITE, FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr);
    }
    HANDLE in_null = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ, &sa, OPEN_EXISTING, 0, nullptr);

    STARTUPINFOA si{}; si.cb = sizeof(si);
    si.hStdInput = in_null; si.hStdOutput = out_write; si.hStdError = err_write;
    si.dwFlags |= STARTF_USESTDHANDLES;
    PROCESS_INFORMATION pi{};
    BOOL ok = CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    DWORD create_error = ok ? 0 : GetLastError();

    CloseHandle(out_write);
    if (err_write && err_write != INVALID_HANDLE_VALUE) CloseHandle(err_write);
    if (in_null && in_null != INVALID_HANDLE_VALUE) CloseHandle(in_null);

    if (!ok) {
        CloseHandle(out_read);
        if (err_read) CloseHandle(err_read);
        throw SpawnError(errno_from_win32(create_error), argv[0]);
    }

    ProcessResult res;
    std::thread err_reader;
    if (err_read) err_reader = std::thread([&]{ read_all(err_read, res.err); });
    read_all(out_read, res.out);
    if (err_reader.joinable()) err_reader.join();
    CloseHandle(out_read);
    if (err_read) CloseHandle(err_read);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 0;
    GetExitCodeProcess(pi.hProcess, &code);
    res.exit_code = static_cast<int>(code);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return res;
}

} // namespace pyresolve
#endif // _WIN32
