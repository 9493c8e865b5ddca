#include <gtest/gtest.h>
#include <pyresolve/interpreter/resolver.hpp>
#include "stub_runner.hpp"
#include <functional>
#include "temp_dir.hpp"

using namespace pyresolve;
using namespace pyresolve::testing_support;

static ResolutionSource source_of(const std::function<void()>& fn) {
    try { fn(); } catch (const InterpreterResolutionError& e) { return e.source(); }
    ADD_FAILURE() << "expected InterpreterResolutionError";
    return ResolutionSource::PyLauncher;
}

TEST(FindPython, NotFoundAnywhere) {
    StubRunner runner;
    try {
        find_python_interpreter(runner, "python99.99");
        FAIL() << "expected InterpreterResolutionError";
    } catch (const InterpreterResolutionError& e) {
        EXPECT_EQ(e.source(), ResolutionSource::Path);
        EXPECT_NE(std::string(e.what()).find("No executable for the provided Python version 'python99.99' found in PATH."),
                  std::string::npos);
    }
    EXPECT_TRUE(runner.calls.empty());
}

TEST(FindPython, PlainFileIsCanonicalized) {
    TempDir d("res_plain");
    auto real = d.write("bin/python3.12", "#!/bin/sh\n");
    StubRunner runner;
    runner.on_path["python3.12"] = d.str("bin/../bin/python3.12");
    runner.results[real] = exited(0, d.str("bin/./python3.12") + "\n");
    EXPECT_EQ(find_python_interpreter(runner, "python3.12"), real);
    ASSERT_EQ(runner.calls.size(), 1u);
    std::vector<std::string> expected{real, "-c", "import sys; print(sys.executable)"};
    EXPECT_EQ(runner.calls[0], expected);
}

TEST(FindPython, SymlinkIsKept) {
    TempDir d("res_link");
    d.write("real/python3.12", "#!/bin/sh\n");
    auto link = d.symlink("real/python3.12", "python3");
    StubRunner runner;
    runner.on_path["python3"] = link;
    runner.results[link] = exited(0, link + "\n");
    EXPECT_EQ(find_python_interpreter(runner, "python3"), link);
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0][0], link);
}

TEST(FindPython, DanglingSelfReportFails) {
    TempDir d("res_dangling");
    auto shim = d.write("shims/python", "#!/bin/sh\n");
    StubRunner runner;
    runner.on_path["python"] = shim;
    runner.results[shim] = exited(0, d.str("gone/python") + "\n");
    EXPECT_EQ(source_of([&]{ find_python_interpreter(runner, "python"); }), ResolutionSource::Path);
}

TEST(FindPython, SelfReportFailures) {
    TempDir d("res_fail");
    auto shim = d.write("shims/python", "#!/bin/sh\n");
    StubRunner nonzero;
    nonzero.on_path["python"] = shim;
    nonzero.results[shim] = exited(1, "");
    EXPECT_EQ(source_of([&]{ find_python_interpreter(nonzero, "python"); }), ResolutionSource::Path);

    StubRunner unspawnable;
    unspawnable.on_path["python"] = shim;
    EXPECT_EQ(source_of([&]{ find_python_interpreter(unspawnable, "python"); }), ResolutionSource::Path);

    StubRunner empty;
    empty.on_path["python"] = shim;
    empty.results[shim] = exited(0, "\n");
    EXPECT_EQ(source_of([&]{ find_python_interpreter(empty, "python"); }), ResolutionSource::Path);
}

TEST(FindPython, LauncherResultWins) {
    TempDir d("res_launcher");
    auto real = d.write("Python312/python.exe", "");
    StubRunner runner;
    runner.on_path["py"] = "C:/Windows/py.exe";
    runner.results["C:/Windows/py.exe"] = exited(0, real + "\r\n");
    EXPECT_EQ(find_python_interpreter(runner, "3.12"), real);
    EXPECT_FALSE(runner.looked_up("3.12"));
}

TEST(FindPython, LauncherFailureDoesNotFallBack) {
    StubRunner runner;
    runner.on_path["py"] = "C:/Windows/py.exe";
    runner.on_path["3.99"] = "/should/not/be/used";
    runner.results["C:/Windows/py.exe"] = exited(103);
    EXPECT_EQ(source_of([&]{ find_python_interpreter(runner, "3.99"); }), ResolutionSource::PyLauncher);
    EXPECT_FALSE(runner.looked_up("3.99"));
}

TEST(FindPython, EmptyLauncherOutputFallsBackToPath) {
    TempDir d("res_empty_launcher");
    auto real = d.write("bin/python3", "#!/bin/sh\n");
    StubRunner runner;
    runner.on_path["py"] = "C:/Windows/py.exe";
    runner.results["C:/Windows/py.exe"] = exited(0, "");
    runner.on_path["python3"] = real;
    runner.results[real] = exited(0, real + "\n");
    EXPECT_EQ(find_python_interpreter(runner, "python3"), real);
    EXPECT_TRUE(runner.looked_up("python3"));
}

TEST(FindPython, LauncherDanglingPathTaggedLauncher) {
    StubRunner runner;
    runner.on_path["py"] = "C:/Windows/py.exe";
    runner.results["C:/Windows/py.exe"] = exited(0, "/nonexistent/pyresolve/python.exe\n");
    EXPECT_EQ(source_of([&]{ find_python_interpreter(runner, "3.12"); }), ResolutionSource::PyLauncher);
}

TEST(Canonicalize, Rules) {
    TempDir d("canon");
    auto real = d.write("x/python", "");
    auto link = d.symlink("x/python", "link");
    EXPECT_EQ(canonicalize_interpreter(d.str("x/../x/python"), ResolutionSource::Path, "v"), real);
    EXPECT_EQ(canonicalize_interpreter(link, ResolutionSource::Path, "v"), link);
    auto dangling = d.symlink("x/missing", "dangling");
    EXPECT_EQ(canonicalize_interpreter(dangling, ResolutionSource::Path, "v"), dangling);
    EXPECT_THROW(canonicalize_interpreter(d.str("x/missing"), ResolutionSource::Path, "v"), InterpreterResolutionError);
    EXPECT_THROW(canonicalize_interpreter("", ResolutionSource::Path, "v"), InterpreterResolutionError);
}

TEST(ResolveRequest, NoVersionUsesDefault) {
    StubRunner runner;
    EXPECT_EQ(resolve_request(runner, std::nullopt, "/usr/bin/python3"), "/usr/bin/python3");
    EXPECT_EQ(resolve_request(runner, std::string(""), "/usr/bin/python3"), "/usr/bin/python3");
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_TRUE(runner.lookups.empty());
}

TEST(ResolveRequest, ExplicitVersionProbes) {
    StubRunner runner;
    EXPECT_THROW(resolve_request(runner, std::string("python99.99"), "/usr/bin/python3"), InterpreterResolutionError);
    EXPECT_TRUE(runner.looked_up("py"));
    EXPECT_TRUE(runner.looked_up("python99.99"));
}
