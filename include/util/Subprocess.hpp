#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace reel::util {

/// A started external process.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual pid_t pid() const = 0;
    virtual bool is_running() = 0;

    // Best effort: never throws, errors are logged
    virtual void terminate() = 0;
};

/// Seam for starting processes; tests substitute a recording launcher.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Throws std::system_error when the program cannot be started
    virtual std::unique_ptr<ProcessHandle> launch(const std::vector<std::string>& argv) = 0;
};

/**
 * fork/execvp based child process.
 *
 * Destroying a Subprocess does not stop the child: a launched player keeps
 * running after the handle goes away. Use terminate() to stop it.
 */
class Subprocess : public ProcessHandle {
public:
    ~Subprocess() override = default;

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /**
     * Starts argv[0] (looked up in PATH) with stdin/stdout/stderr on /dev/null.
     * Exec failures in the child are reported back and thrown here as
     * std::system_error.
     */
    static std::unique_ptr<Subprocess> spawn(const std::vector<std::string>& argv);

    /**
     * Runs to completion. Returns the exit code, or nullopt if the program
     * could not be started, died on a signal, or outlived `timeout` (it is
     * killed in that case).
     */
    static std::optional<int> run(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds timeout);

    pid_t pid() const override { return pid_; }
    bool is_running() override;
    void terminate() override;

    // Waits up to timeout; returns the exit code once the child is reaped
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

private:
    explicit Subprocess(pid_t pid) : pid_(pid) {}

    bool reap(bool block);

    pid_t pid_ = -1;
    bool reaped_ = false;
    std::optional<int> exit_code_;
};

class SubprocessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ProcessHandle> launch(const std::vector<std::string>& argv) override;
};

}  // namespace reel::util
