#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "core/ConfigManager.h"
#include "core/HostEnvironment.h"

struct ProcessOutcome {
    bool started = false;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
    std::string error;   // why the process could not be started

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

/**
 * @brief What actually gets executed
 *
 * argv[0] is the program as the child sees it. pathPrefix, when set, is
 * prepended to the child's PATH.
 */
struct LaunchCommand {
    std::string program;
    std::vector<std::string> argv;
    std::string pathPrefix;
};

/**
 * @brief Runs the package manager (npm) to completion with captured output
 *
 * The caller's thread blocks until the child exits and both output streams
 * are drained. With npm.timeoutSeconds > 0 the child is killed once the
 * deadline passes, even after it has closed its output streams. With 0 a
 * hung child hangs the caller.
 */
class ProcessRunner {
public:
    static constexpr const char* kToolName = "npm";
    static constexpr const char* kExtraSearchPath = "/usr/local/bin:/opt/homebrew/bin";
    // Arguments holding any of these are refused when npm goes through cmd.exe
    static constexpr const char* kCmdMetacharacters = "&|<>^%!()\"";

    explicit ProcessRunner(const Config& config, Platform platform = HostEnvironment::currentPlatform());

    /**
     * @brief Runs `npm <arguments...>` in workingDirectory
     *
     * Logs success with stdout or failure with stderr. Never throws.
     * When npm is started through cmd.exe, an argument containing one of
     * kCmdMetacharacters is refused and the process is not started.
     */
    ProcessOutcome run(const std::vector<std::string>& arguments,
                       const std::filesystem::path& workingDirectory) const;

    // Custom executable, cmd.exe on Windows, /bin/sh with an extended PATH elsewhere
    LaunchCommand buildCommand(const std::vector<std::string>& arguments) const;

    /**
     * @brief Executes an already-built command, no logging
     */
    static ProcessOutcome execute(const LaunchCommand& command,
                                  const std::filesystem::path& workingDirectory,
                                  int timeoutSeconds);

private:
    const Config& config;
    Platform platform;

    bool hasCustomExecutable() const;
    bool usesCommandInterpreter() const;

    static std::string describe(const std::vector<std::string>& arguments);
};
