#include "process/ProcessRunner.h"
#include "utils/Logger.h"
#include <chrono>
#include <cstring>
#include <cerrno>
#include <exception>

#ifdef _WIN32
    #ifndef NOMINMAX
    #define NOMINMAX
    #endif
    #include <windows.h>
    #include <functional>
    #include <thread>
#else
    #include <unistd.h>
    #include <fcntl.h>
    #include <poll.h>
    #include <signal.h>
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <thread>
    extern char** environ;
#endif

namespace fs = std::filesystem;

ProcessRunner::ProcessRunner(const Config& config, Platform platform)
    : config(config), platform(platform) {}

std::string ProcessRunner::describe(const std::vector<std::string>& arguments) {
    std::string text;
    for (const auto& arg : arguments) {
        if (!text.empty()) text += ' ';
        text += arg;
    }
    return text;
}

bool ProcessRunner::hasCustomExecutable() const {
    return config.npm.executablePath.find_first_not_of(" \t\r\n") != std::string::npos;
}

bool ProcessRunner::usesCommandInterpreter() const {
    return platform == Platform::Windows && !hasCustomExecutable();
}

LaunchCommand ProcessRunner::buildCommand(const std::vector<std::string>& arguments) const {
    LaunchCommand cmd;
    const std::string& custom = config.npm.executablePath;

    if (hasCustomExecutable()) {
        cmd.program = custom;
        cmd.argv.push_back(custom);
        cmd.argv.insert(cmd.argv.end(), arguments.begin(), arguments.end());
    } else if (usesCommandInterpreter()) {
        // cmd.exe finds npm.cmd through PATH
        cmd.program = "cmd.exe";
        cmd.argv = {"cmd.exe", "/c", kToolName};
        cmd.argv.insert(cmd.argv.end(), arguments.begin(), arguments.end());
    } else {
        // Arguments travel as positional parameters, never spliced into the script
        cmd.program = "/bin/sh";
        cmd.argv = {"/bin/sh", "-c", std::string("exec ") + kToolName + " \"$@\"", kToolName};
        cmd.argv.insert(cmd.argv.end(), arguments.begin(), arguments.end());
        cmd.pathPrefix = kExtraSearchPath;
    }
    return cmd;
}

ProcessOutcome ProcessRunner::run(const std::vector<std::string>& arguments,
                                  const fs::path& workingDirectory) const {
    const std::string args = describe(arguments);
    const std::string what = std::string(kToolName) + " " + args;
    const std::string where = workingDirectory.u8string();
    auto& logger = Logger::getInstance();

    ProcessOutcome outcome;
    if (usesCommandInterpreter()) {
        for (const auto& arg : arguments) {
            if (arg.find_first_of(kCmdMetacharacters) != std::string::npos) {
                outcome.error = "Argument '" + arg + "' contains characters cmd.exe would interpret";
                logger.error("[MCP Unity] Failed to start " + std::string(kToolName) + " process with arguments: " +
                             args + " in " + where + ". " + outcome.error);
                return outcome;
            }
        }
    }

    try {
        outcome = execute(buildCommand(arguments), workingDirectory, config.npm.timeoutSeconds);
    } catch (const std::exception& e) {
        logger.error("[MCP Unity] Exception while running " + what + " in " + where + ". Error: " + e.what());
        outcome.started = false;
        outcome.error = e.what();
        return outcome;
    }

    if (!outcome.started) {
        logger.error("[MCP Unity] Failed to start " + std::string(kToolName) + " process with arguments: " +
                     args + " in " + where + ". " + outcome.error);
    } else if (outcome.timedOut) {
        logger.error("[MCP Unity] " + what + " timed out after " + std::to_string(config.npm.timeoutSeconds) +
                     "s in " + where + " and was terminated. Error: " + outcome.stderrText);
    } else if (outcome.exitCode == 0) {
        logger.success("[MCP Unity] " + what + " completed successfully in " + where + ".\n" + outcome.stdoutText);
    } else {
        logger.error("[MCP Unity] " + what + " failed in " + where + ". Exit Code: " +
                     std::to_string(outcome.exitCode) + ". Error: " + outcome.stderrText);
    }
    return outcome;
}

#ifndef _WIN32
// POSIX Implementation
namespace {
    void setCloseOnExec(int fd) {
        int flags = fcntl(fd, F_GETFD);
        if (flags != -1) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }

    void closePipe(int fds[2]) {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
        fds[0] = fds[1] = -1;
    }

    // Child side: report errno to the parent and exit
    [[noreturn]] void childFail(int errFd) {
        int err = errno;
        ssize_t ignored = write(errFd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    std::vector<std::string> buildEnvironment(const std::string& pathPrefix) {
        std::vector<std::string> env;
        std::string currentPath;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            if (entry.compare(0, 5, "PATH=") == 0) {
                currentPath = entry.substr(5);
                continue;
            }
            env.push_back(entry);
        }
        env.push_back("PATH=" + pathPrefix + ":" + currentPath);
        return env;
    }
}

ProcessOutcome ProcessRunner::execute(const LaunchCommand& command,
                                      const fs::path& workingDirectory,
                                      int timeoutSeconds) {
    ProcessOutcome outcome;
    if (command.argv.empty()) {
        outcome.error = "Empty command line";
        return outcome;
    }

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage;
    std::vector<char*> envp;
    if (!command.pathPrefix.empty()) {
        envStorage = buildEnvironment(command.pathPrefix);
        for (auto& entry : envStorage) {
            envp.push_back(const_cast<char*>(entry.c_str()));
        }
        envp.push_back(nullptr);
    }
    const std::string cwd = workingDirectory.string();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0 || pipe(errPipe) != 0 || pipe(execPipe) != 0) {
        outcome.error = std::string("pipe() failed: ") + std::strerror(errno);
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(execPipe);
        return outcome;
    }
    setCloseOnExec(outPipe[0]);
    setCloseOnExec(errPipe[0]);
    setCloseOnExec(execPipe[0]);
    setCloseOnExec(execPipe[1]);

    pid_t pid = fork();
    if (pid == -1) {
        outcome.error = std::string("fork() failed: ") + std::strerror(errno);
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(execPipe);
        return outcome;
    }

    if (pid == 0) { // Child
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        close(execPipe[0]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            childFail(execPipe[1]);
        }
        if (!envp.empty()) {
            execve(command.program.c_str(), argv.data(), envp.data());
        } else {
            execvp(command.program.c_str(), argv.data());
        }
        childFail(execPipe[1]);
    }

    // Parent
    close(outPipe[1]);
    close(errPipe[1]);
    close(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n == -1 && errno == EINTR);
    close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        close(outPipe[0]);
        close(errPipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        outcome.error = "Could not launch " + command.program + " in " + cwd + ": " + std::strerror(childErrno);
        return outcome;
    }
    outcome.started = true;

    const bool bounded = timeoutSeconds > 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(bounded ? timeoutSeconds : 0);

    struct pollfd fds[2];
    fds[0] = {outPipe[0], POLLIN, 0};
    fds[1] = {errPipe[0], POLLIN, 0};
    std::string* sinks[2] = {&outcome.stdoutText, &outcome.stderrText};
    int openStreams = 2;
    char buffer[4096];

    while (openStreams > 0) {
        int waitMs = -1;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                outcome.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(left.count());
        }

        int ready = poll(fds, 2, waitMs);
        if (ready == -1) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }

    if (outcome.timedOut) {
        kill(pid, SIGKILL);
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) close(fd.fd);
    }

    int status = 0;
    bool reaped = false;
    // The child may close its streams long before it exits
    while (bounded && !outcome.timedOut) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
            break;
        }
        if (done == -1 && errno != EINTR) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            outcome.timedOut = true;
            kill(pid, SIGKILL);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!reaped) {
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    }
    if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exitCode = 128 + WTERMSIG(status);
    }
    return outcome;
}
#else
// Windows Implementation
namespace {
    // MSVCRT argument quoting rules
    std::string quoteArgument(const std::string& arg) {
        if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
            return arg;
        }
        std::string quoted = "\"";
        size_t backslashes = 0;
        for (char c : arg) {
            if (c == '\\') {
                ++backslashes;
            } else if (c == '"') {
                quoted.append(backslashes * 2 + 1, '\\');
                quoted.push_back('"');
                backslashes = 0;
            } else {
                quoted.append(backslashes, '\\');
                quoted.push_back(c);
                backslashes = 0;
            }
        }
        quoted.append(backslashes * 2, '\\');
        quoted.push_back('"');
        return quoted;
    }

    void drain(HANDLE pipe, std::string& sink) {
        char buffer[4096];
        DWORD got = 0;
        while (ReadFile(pipe, buffer, sizeof(buffer), &got, NULL) && got > 0) {
            sink.append(buffer, got);
        }
    }

    std::string lastErrorText() {
        DWORD code = GetLastError();
        char* text = nullptr;
        FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                       NULL, code, 0, reinterpret_cast<LPSTR>(&text), 0, NULL);
        std::string message = text ? text : ("error " + std::to_string(code));
        if (text) LocalFree(text);
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) message.pop_back();
        return message;
    }
}

ProcessOutcome ProcessRunner::execute(const LaunchCommand& command,
                                      const fs::path& workingDirectory,
                                      int timeoutSeconds) {
    ProcessOutcome outcome;
    if (command.argv.empty()) {
        outcome.error = "Empty command line";
        return outcome;
    }

    SECURITY_ATTRIBUTES saAttr;
    saAttr.nLength = sizeof(SECURITY_ATTRIBUTES);
    saAttr.bInheritHandle = TRUE;
    saAttr.lpSecurityDescriptor = NULL;

    HANDLE outRead = NULL, outWrite = NULL, errRead = NULL, errWrite = NULL;
    if (!CreatePipe(&outRead, &outWrite, &saAttr, 0) || !SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0) ||
        !CreatePipe(&errRead, &errWrite, &saAttr, 0) || !SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0)) {
        outcome.error = "CreatePipe failed: " + lastErrorText();
        for (HANDLE h : {outRead, outWrite, errRead, errWrite}) {
            if (h) CloseHandle(h);
        }
        return outcome;
    }

    std::string cmdLine;
    for (size_t i = 0; i < command.argv.size(); ++i) {
        if (i) cmdLine += ' ';
        cmdLine += quoteArgument(command.argv[i]);
    }

    PROCESS_INFORMATION piProcInfo;
    STARTUPINFOA siStartInfo;
    ZeroMemory(&piProcInfo, sizeof(PROCESS_INFORMATION));
    ZeroMemory(&siStartInfo, sizeof(STARTUPINFOA));
    siStartInfo.cb = sizeof(STARTUPINFOA);
    siStartInfo.hStdError = errWrite;
    siStartInfo.hStdOutput = outWrite;
    siStartInfo.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    siStartInfo.dwFlags |= STARTF_USESTDHANDLES;

    const std::string cwd = workingDirectory.string();
    BOOL created = CreateProcessA(NULL, &cmdLine[0], NULL, NULL, TRUE, CREATE_NO_WINDOW, NULL,
                                  cwd.empty() ? NULL : cwd.c_str(), &siStartInfo, &piProcInfo);
    CloseHandle(outWrite);
    CloseHandle(errWrite);
    if (!created) {
        outcome.error = "Could not launch " + command.program + " in " + cwd + ": " + lastErrorText();
        CloseHandle(outRead);
        CloseHandle(errRead);
        return outcome;
    }
    outcome.started = true;

    std::thread outReader(drain, outRead, std::ref(outcome.stdoutText));
    std::thread errReader(drain, errRead, std::ref(outcome.stderrText));

    DWORD waitMs = timeoutSeconds > 0 ? static_cast<DWORD>(timeoutSeconds) * 1000 : INFINITE;
    if (WaitForSingleObject(piProcInfo.hProcess, waitMs) == WAIT_TIMEOUT) {
        outcome.timedOut = true;
        TerminateProcess(piProcInfo.hProcess, 1);
        WaitForSingleObject(piProcInfo.hProcess, INFINITE);
    }
    outReader.join();
    errReader.join();

    DWORD exitCode = 1;
    GetExitCodeProcess(piProcInfo.hProcess, &exitCode);
    outcome.exitCode = static_cast<int>(exitCode);

    CloseHandle(outRead);
    CloseHandle(errRead);
    CloseHandle(piProcInfo.hProcess);
    CloseHandle(piProcInfo.hThread);
    return outcome;
}
#endif
