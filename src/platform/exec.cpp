#include "apco/exec.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

namespace apco {
namespace exec {

ExecResult run_and_wait(const std::vector<std::string>& argv_strings) {
    ExecResult result;

    if (argv_strings.empty() || argv_strings[0].empty()) {
        result.error = "empty command";
        return result;
    }

    // Build C-style array
    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    // The child reports a failed exec through this pipe; a successful exec
    // closes it (O_CLOEXEC) and the parent reads EOF.
    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();

    if (pid == -1) {
        close(err_pipe[0]);
        close(err_pipe[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        close(err_pipe[0]);
        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close(err_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.exit_code = 127;
        result.error = "failed to execute " + argv_strings[0] + ": " + std::string(strerror(exec_errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].empty() ||
                            argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "\"";
        cmd += argv[i];
        if (needs_quotes) cmd += "\"";
    }
    return cmd;
}

} // namespace exec
} // namespace apco
