#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

namespace {

[[noreturn]] void exec_child(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    ::execvp(args[0], args.data());
    ::_exit(127);
}

std::expected<void, std::string> wait_child(pid_t pid, const std::string& name) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected(name + " not found in PATH");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(name + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(name + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return {};
}

} // namespace

std::expected<void, std::string> run(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }
    if (pid == 0) exec_child(argv);

    return wait_child(pid, argv[0]);
}

std::expected<std::vector<uint8_t>, std::string> read_stdout(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout into the pipe
        ::dup2(pipefd[1], STDOUT_FILENO);
        exec_child(argv);
    }

    ::close(pipefd[1]);
    std::vector<uint8_t> out;
    uint8_t buf[65536];
    while (true) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(pipefd[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }
    ::close(pipefd[0]);

    auto status = wait_child(pid, argv[0]);
    if (!status) return std::unexpected(status.error());
    return out;
}

std::expected<void, std::string> spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setsid();
        // Grandchild is reparented to init; we only reap the intermediate child.
        if (::fork() != 0) ::_exit(0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        exec_child(argv);
    }

    return wait_child(pid, argv[0]);
}

} // namespace subprocess
