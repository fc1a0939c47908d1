#pragma once

#include <cstdint>
#include "Messages.hpp"

namespace garlic_shell {

/**
 * Runs one CommandRequest as a child process.
 *
 * The child gets an empty environment plus the request's env, /dev/null on
 * stdin and its own process group. The program is looked up on the server's
 * PATH. On timeout the whole process group is killed and reaped before
 * execute() returns.
 */
class CommandExecutor {
public:
    // Per stream; keeps a response inside a single packet
    static constexpr size_t MAX_CAPTURED_OUTPUT = 24 * 1024;

    explicit CommandExecutor(uint64_t defaultTimeoutSeconds);

    // Throws ExecutionError for an empty command or ".." in working_dir
    void validateRequest(const CommandRequest& request) const;

    CommandResponse execute(const CommandRequest& request) const;

    uint64_t defaultTimeout() const { return default_timeout_; }

private:
    uint64_t default_timeout_;
};

} // namespace garlic_shell
