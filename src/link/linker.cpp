#include "linker.hpp"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/Errno.h"
#include "llvm/Support/Program.h"

#if OS_WINDOWS
    #include <Windows.h>
#else
    #include <cerrno>
    #include <spawn.h>
    #include <sys/wait.h>

    #if OS_DARWIN
        #include <crt_externs.h>
        #define environ (*_NSGetEnviron())
    #else
        extern char** environ;
    #endif
#endif

#if OS_WINDOWS

[[ noreturn ]] static void handleWindowsError(const std::string& base_msg) {
    auto err_code = GetLastError();
    LPSTR buff = nullptr;

    if (!FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        err_code, 0,
        (LPSTR)(&buff),
        0, nullptr
    )) {
        ReportFatal("{0}", base_msg);
    }

    std::string sys_msg { buff };
    LocalFree(buff);

    ReportFatal("{0}: {1}", base_msg, llvm::StringRef(sys_msg).rtrim());
}

static int runWindowsLinker(const std::string& linker_path, const LinkConfig& cfg) {
    llvm::SmallVector<llvm::StringRef, 16> argv;
    argv.push_back(cfg.linker_name);
    for (const auto& arg : cfg.args) {
        argv.push_back(arg);
    }

    auto command = llvm::sys::flattenWindowsCommandLine(argv);
    if (!command) {
        ReportFatal("building linker command line: {0}", command.getError().message());
    }

    std::wstring w_linker_path;
    if (!llvm::ConvertUTF8toWide(linker_path, w_linker_path)) {
        ReportFatal("linker path is not valid UTF-8: {0}", linker_path);
    }

    // CreateProcessW is allowed to modify the command line buffer, so it has
    // to be a mutable, null-terminated copy.
    std::vector<wchar_t> cmd_buff(command->begin(), command->end());
    cmd_buff.push_back(L'\0');

    // Standard handles are inherited from the console since no redirection is
    // requested through STARTF_USESTDHANDLES.
    STARTUPINFOW start_info;
    SecureZeroMemory(&start_info, sizeof(STARTUPINFOW));
    start_info.cb = sizeof(STARTUPINFOW);

    PROCESS_INFORMATION proc_info;
    SecureZeroMemory(&proc_info, sizeof(PROCESS_INFORMATION));
    if (!CreateProcessW(
        w_linker_path.c_str(),
        cmd_buff.data(),
        nullptr,
        nullptr,
        TRUE,
        0,
        nullptr,
        nullptr,
        &start_info,
        &proc_info
    )) {
        handleWindowsError("creating linker process");
    }

    CloseHandle(proc_info.hThread);

    if (WaitForSingleObject(proc_info.hProcess, INFINITE) == WAIT_FAILED) {
        CloseHandle(proc_info.hProcess);
        handleWindowsError("waiting on linker process");
    }

    DWORD exit_code;
    if (!GetExitCodeProcess(proc_info.hProcess, &exit_code)) {
        CloseHandle(proc_info.hProcess);
        handleWindowsError("getting linker process exit code");
    }

    CloseHandle(proc_info.hProcess);
    return (int)exit_code;
}

#else

static int runPosixLinker(const std::string& linker_path, const LinkConfig& cfg) {
    // posix_spawn takes a non-const argv, but it does not modify the strings.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cfg.linker_name.c_str()));
    for (const auto& arg : cfg.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid;
    int err = posix_spawn(&pid, linker_path.c_str(), nullptr, nullptr, argv.data(), environ);
    if (err != 0) {
        ReportFatal("could not execute linker {0}: {1}", linker_path, llvm::sys::StrError(err));
    }

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            ReportFatal("waiting on linker process: {0}", llvm::sys::StrError());
        }
    }

    if (WIFSIGNALED(status)) {
        // Same status a wrapper exiting with the negated signal number gets.
        return (256 - WTERMSIG(status)) & 0xFF;
    }

    return WEXITSTATUS(status);
}

#endif

/* -------------------------------------------------------------------------- */

int RunLinker(const LinkConfig& cfg) {
    auto linker_path = llvm::sys::findProgramByName(cfg.linker_name);
    if (!linker_path) {
        ReportFatal("could not find linker {0}: {1}", cfg.linker_name, linker_path.getError().message());
    }

#if OS_WINDOWS
    return runWindowsLinker(*linker_path, cfg);
#else
    return runPosixLinker(*linker_path, cfg);
#endif
}
