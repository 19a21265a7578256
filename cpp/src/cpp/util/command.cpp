#include <valinfo/util/command.h>
#include <valinfo/util/errors.h>
#include <valinfo/util/scope.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace valinfo {

    namespace {
        constexpr int EXEC_FAILED = 127;
    }

    CommandResult run_command(const std::string &binary, const std::vector<std::string> &args) {
        int out_pipe[2];
        if (pipe(out_pipe) != 0) {
            throw_error<ProbeFailure>("pipe() failed for '{}': {}", binary, std::strerror(errno));
        }

        pid_t pid = fork();
        if (pid == -1) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            throw_error<ProbeFailure>("fork() failed for '{}': {}", binary, std::strerror(errno));
        }

        if (pid == 0) {
            // Child: stdout to the pipe, stderr to /dev/null, no shell
            dup2(out_pipe[1], STDOUT_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
            int dev_null = open("/dev/null", O_WRONLY);
            if (dev_null >= 0) {
                dup2(dev_null, STDERR_FILENO);
                close(dev_null);
            }

            std::vector<char *> c_args;
            c_args.push_back(const_cast<char *>(binary.c_str()));
            for (const auto &arg : args) { c_args.push_back(const_cast<char *>(arg.c_str())); }
            c_args.push_back(nullptr);

            execvp(binary.c_str(), c_args.data());
            _exit(EXEC_FAILED);
        }

        close(out_pipe[1]);
        auto close_read = make_scope_exit([fd = out_pipe[0]] { close(fd); });

        CommandResult result;
        char buffer[4096];
        for (;;) {
            ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                break;
            }
        }

        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                throw_error<ProbeFailure>("waitpid() failed for '{}': {}", binary, std::strerror(errno));
            }
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else {
            throw_error<ProbeFailure>("'{}' terminated abnormally", binary);
        }
        if (result.exit_code == EXEC_FAILED) {
            throw_error<ProbeFailure>("'{}' could not be executed", binary);
        }
        return result;
    }

} // namespace valinfo
