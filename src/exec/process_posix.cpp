/*
 * POSIX child process execution - pyresolve
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifndef _WIN32
#include <pyresolve/exec/process.hpp>
#include <pyresolve/error.hpp>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pyresolve {

static void close_fd(int& fd) {
    if (fd != -1) { ::close(fd); fd = -1; }
}

static bool make_pipe(int p[2]) {
    if (pipe(p) != 0) return false;
    fcntl(p[0], F_SETFD, FD_CLOEXEC);
    fcntl(p[1], F_SETFD, FD_CLOEXEC);
    return true;
}

// Drain stdout and stderr together so neither pipe can fill up and stall the child.
// Both descriptors are closed and reset to -1 on return.
static void drain(int& out_fd, int& err_fd, ProcessResult& res) {
    char buf[4096];
    while (out_fd != -1 || err_fd != -1) {
        pollfd fds[2]; nfds_t n = 0;
        if (out_fd != -1) fds[n++] = pollfd{out_fd, POLLIN, 0};
        if (err_fd != -1) fds[n++] = pollfd{err_fd, POLLIN, 0};
        if (poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i=0;i<n;++i) {
            if (!(fds[i].revents & (POLLIN|POLLHUP|POLLERR))) continue;
            ssize_t r = read(fds[i].fd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            bool is_out = fds[i].fd == out_fd;
            if (r <= 0) {
                if (is_out) close_fd(out_fd); else close_fd(err_fd);
                continue;
            }
            (is_out ? res.out : res.err).append(buf, buf+r);
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);
}

ProcessResult run_process(const std::vector<std::string>& argv, StderrMode err_mode) {
    if (argv.empty() || argv[0].empty()) throw SpawnError(ENOENT, "");

    std::vector<char*> cargv; cargv.reserve(argv.size()+1);
    for (auto &s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2] = {-1,-1}, err_pipe[2] = {-1,-1}, exec_pipe[2] = {-1,-1};
    auto close_all = [&]{
        for (int* p : {out_pipe, err_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
    };
    if (!make_pipe(out_pipe) || !make_pipe(exec_pipe) ||
        (err_mode == StderrMode::Capture && !make_pipe(err_pipe))) {
        int e = errno; close_all();
        throw SpawnError(e, argv[0]);
    }

    pid_t pid = fork();
    if (pid < 0) { int e = errno; close_all(); throw SpawnError(e, argv[0]); }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devnull != -1) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        if (err_mode == StderrMode::Capture) dup2(err_pipe[1], STDERR_FILENO);
        else if (devnull != -1) dup2(devnull, STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = write(exec_pipe[1], &e, sizeof(e));
        (void)w;
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe is close-on-exec: EOF means execvp succeeded, an int means it failed.
    int exec_errno = 0;
    ssize_t r;
    while ((r = read(exec_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    close_fd(exec_pipe[0]);

    ProcessResult res;
    if (r <= 0) drain(out_pipe[0], err_pipe[0], res);
    close_all();

    int st = 0;
    while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    if (r > 0) throw SpawnError(exec_errno, argv[0]);

    if (WIFEXITED(st)) res.exit_code = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) res.exit_code = 128 + WTERMSIG(st);
    return res;
}

} // namespace pyresolve
#endif // !_WIN32
