#pragma once
#include "process/ProcessRunner.h"

class InstallationResolver;

/**
 * @brief Installs and builds the Node.js server in its resolved directory
 */
class ServerBuilder {
public:
    ServerBuilder(const ProcessRunner& runner, const InstallationResolver& resolver);

    // npm install
    ProcessOutcome install() const;

    // npm run build
    ProcessOutcome build() const;

    // install, then build only if install succeeded
    ProcessOutcome installAndBuild() const;

private:
    const ProcessRunner& runner;
    const InstallationResolver& resolver;

    ProcessOutcome runInServerDir(const std::vector<std::string>& arguments) const;
};
