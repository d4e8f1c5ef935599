#include "util/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace fdrop::util {

std::optional<std::filesystem::path> findExecutable(const std::string& name) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;

    std::istringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        const auto candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return std::nullopt;
}

int runWithInput(const std::vector<std::string>& argv, const std::string& input) {
    if (argv.empty()) throw std::invalid_argument("runWithInput requires a command");

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create pipe for " + argv.front());

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error("Failed to fork " + argv.front());
    }

    if (pid == 0) {
        // Child process: stdin from pipe, stdout/stderr silenced
        dup2(pipefd[0], STDIN_FILENO);
        if (const int devnull = open("/dev/null", O_WRONLY); devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    // Parent process: feed stdin, then wait
    close(pipefd[0]);

    const char* data = input.data();
    size_t remaining = input.size();
    while (remaining > 0) {
        const ssize_t w = write(pipefd[1], data, remaining);
        if (w < 0) {
            if (errno == EINTR) continue;
            break;
        }
        data += w;
        remaining -= static_cast<size_t>(w);
    }
    close(pipefd[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error("Failed to wait for " + argv.front());
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

}
