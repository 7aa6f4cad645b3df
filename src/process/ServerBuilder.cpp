#include "process/ServerBuilder.h"
#include "install/InstallationResolver.h"
#include "utils/PathUtils.h"

ServerBuilder::ServerBuilder(const ProcessRunner& runner, const InstallationResolver& resolver)
    : runner(runner), resolver(resolver) {}

ProcessOutcome ServerBuilder::install() const {
    return runInServerDir({"install"});
}

ProcessOutcome ServerBuilder::build() const {
    return runInServerDir({"run", "build"});
}

ProcessOutcome ServerBuilder::installAndBuild() const {
    ProcessOutcome outcome = install();
    if (!outcome.succeeded()) return outcome;
    return build();
}

ProcessOutcome ServerBuilder::runInServerDir(const std::vector<std::string>& arguments) const {
    auto installation = resolver.resolve();
    if (!installation) {
        ProcessOutcome outcome;
        outcome.error = InstallationResolver::kServerNotFoundError;
        return outcome;
    }
    return runner.run(arguments, PathUtils::fromUtf8(installation->serverPath));
}
