#include "util/Subprocess.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <sys/wait.h>

namespace reel::util {

namespace {

std::string describe(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

}  // namespace

std::unique_ptr<Subprocess> Subprocess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "spawn: empty command line");
    }

    // Build argument list before fork: the child may only make async-signal-safe calls
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // Close-on-exec pipe: EOF means exec succeeded, an int means it failed
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "spawn: pipe2 failed");
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw std::system_error(err, std::generic_category(), "spawn: fork failed");
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execvp(args[0], args.data());

        // If execvp returns, it failed
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        throw std::system_error(child_errno, std::generic_category(), "exec " + argv[0]);
    }

    Logger::debug("Subprocess: Started pid " + std::to_string(pid) + ": " + describe(argv));
    return std::unique_ptr<Subprocess>(new Subprocess(pid));
}

bool Subprocess::reap(bool block) {
    if (reaped_) return true;

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) return false;

    reaped_ = true;
    if (result == pid_ && WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    }
    return true;
}

bool Subprocess::is_running() {
    return pid_ > 0 && !reap(false);
}

std::optional<int> Subprocess::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return exit_code_;
}

void Subprocess::terminate() {
    if (pid_ <= 0 || reap(false)) return;

    Logger::debug("Subprocess: Terminating pid " + std::to_string(pid_));
    if (kill(pid_, SIGTERM) < 0 && errno != ESRCH) {
        Logger::warn("Subprocess: SIGTERM failed for pid " + std::to_string(pid_) +
                     ": " + std::strerror(errno));
    }

    // Give it a second to exit, then force
    int wait_attempts = 10;
    while (wait_attempts-- > 0) {
        if (reap(false)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        Logger::warn("Subprocess: SIGKILL failed for pid " + std::to_string(pid_) +
                     ": " + std::strerror(errno));
    }
    reap(true);
}

std::optional<int> Subprocess::run(const std::vector<std::string>& argv,
                                   std::chrono::milliseconds timeout) {
    std::unique_ptr<Subprocess> child;
    try {
        child = spawn(argv);
    } catch (const std::system_error& e) {
        Logger::warn("Subprocess: Cannot run " + describe(argv) + ": " + e.what());
        return std::nullopt;
    }

    auto code = child->wait_for(timeout);
    if (!child->reaped_) {
        Logger::warn("Subprocess: Timed out after " + std::to_string(timeout.count()) +
                     "ms, killing: " + describe(argv));
        child->terminate();
        return std::nullopt;
    }
    return code;
}

std::unique_ptr<ProcessHandle> SubprocessLauncher::launch(const std::vector<std::string>& argv) {
    return Subprocess::spawn(argv);
}

}  // namespace reel::util
