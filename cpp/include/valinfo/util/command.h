#ifndef VALINFO_COMMAND_H
#define VALINFO_COMMAND_H

#include <string>
#include <vector>

namespace valinfo {

    struct CommandResult {
        int exit_code{-1};
        std::string output;  // captured stdout

        [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
    };

    /**
     * Runs a binary (resolved through PATH) with the given arguments, without a shell, and captures its stdout.
     * stderr is discarded. Blocks until the child exits.
     *
     * Throws ProbeFailure when the child cannot be spawned or the binary cannot be executed.
     */
    CommandResult run_command(const std::string &binary, const std::vector<std::string> &args);

} // namespace valinfo

#endif // VALINFO_COMMAND_H
