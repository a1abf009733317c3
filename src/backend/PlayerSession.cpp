#include "backend/PlayerSession.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <thread>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace reel::backend {

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:         return "idle";
        case SessionState::Launching:    return "launching";
        case SessionState::Connected:    return "connected";
        case SessionState::Disconnected: return "disconnected";
    }
    return "idle";
}

PlayerSettings PlayerSettings::from_config(const Config& cfg) {
    PlayerSettings settings;
    settings.executable = cfg.player_executable;
    settings.rc_host = cfg.rc_host;
    settings.rc_port = cfg.rc_port;
    return settings;
}

namespace {

// One blocking connect attempt per resolved address. -1 if none accepted.
int try_connect(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        util::Logger::debug("PlayerSession: Cannot resolve " + host + ": " + gai_strerror(rc));
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) continue;
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);
    return fd;
}

}  // namespace

struct PlayerSession::Impl {
    PlayerSettings settings;
    util::ProcessLauncher& launcher;

    mutable std::mutex mutex;
    std::condition_variable_any state_changed;

    SessionState state = SessionState::Idle;
    std::unique_ptr<util::ProcessHandle> process;
    int channel_fd = -1;
    uint64_t generation = 0;
    std::jthread connector;

    Impl(PlayerSettings s, util::ProcessLauncher& l) : settings(std::move(s)), launcher(l) {}

    void connect_loop(std::stop_token stop, uint64_t launch_generation) {
        const auto deadline = std::chrono::steady_clock::now() + settings.connect_timeout;
        const std::string endpoint = settings.rc_host + ":" + std::to_string(settings.rc_port);
        int attempts = 0;

        while (!stop.stop_requested()) {
            ++attempts;
            int fd = try_connect(settings.rc_host, settings.rc_port);

            std::unique_lock<std::mutex> lock(mutex);
            if (fd >= 0) {
                if (stop.stop_requested() || generation != launch_generation) {
                    ::close(fd);
                    return;
                }
                channel_fd = fd;
                state = SessionState::Connected;
                util::Logger::info("PlayerSession: Connected to " + endpoint +
                                   " after " + std::to_string(attempts) + " attempts");
                state_changed.notify_all();
                return;
            }

            if (std::chrono::steady_clock::now() + settings.connect_interval > deadline) {
                util::Logger::warn("PlayerSession: Gave up connecting to " + endpoint + " after " +
                                   std::to_string(attempts) + " attempts");
                return;
            }

            // Sleeps one interval; wakes early on stop or relaunch
            state_changed.wait_for(lock, stop, settings.connect_interval,
                                   [&] { return generation != launch_generation; });
            if (generation != launch_generation) return;
        }
    }

    // Stops the connect thread and closes the channel. Returns the process handle.
    std::unique_ptr<util::ProcessHandle> release() {
        std::jthread old_connector;
        {
            std::lock_guard<std::mutex> lock(mutex);
            old_connector = std::move(connector);
            ++generation;
        }
        if (old_connector.joinable()) {
            old_connector.request_stop();
            state_changed.notify_all();
            old_connector.join();
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (channel_fd >= 0) {
            ::close(channel_fd);
            channel_fd = -1;
            util::Logger::debug("PlayerSession: Closed control channel");
        }
        state = SessionState::Idle;
        state_changed.notify_all();
        return std::move(process);
    }
};

PlayerSession::PlayerSession(PlayerSettings settings, util::ProcessLauncher& launcher)
    : impl_(std::make_unique<Impl>(std::move(settings), launcher)) {
    util::Logger::debug("PlayerSession: Created for " + impl_->settings.executable);
}

PlayerSession::~PlayerSession() {
    close();
}

std::vector<std::string> PlayerSession::command_line(const std::string& target) const {
    return {
        impl_->settings.executable,
        "--extraintf", "rc",
        "--rc-host", impl_->settings.rc_host + ":" + std::to_string(impl_->settings.rc_port),
        target,
    };
}

void PlayerSession::launch(const std::string& target) {
    util::Logger::info("PlayerSession: Launching player for " + target);

    auto previous = impl_->release();
    if (previous) {
        util::Logger::info("PlayerSession: Stopping previous player (pid " +
                           std::to_string(previous->pid()) + ")");
        previous->terminate();
    }

    std::unique_ptr<util::ProcessHandle> handle;
    try {
        handle = impl_->launcher.launch(command_line(target));
    } catch (const std::system_error& e) {
        util::Logger::error("PlayerSession: Cannot start " + impl_->settings.executable + ": " + e.what());
        throw ProcessLaunchError("Cannot start player '" + impl_->settings.executable + "' for " +
                                 target + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->process = std::move(handle);
    impl_->state = SessionState::Launching;
    uint64_t launch_generation = ++impl_->generation;
    impl_->connector = std::jthread([impl = impl_.get(), launch_generation](std::stop_token stop) {
        impl->connect_loop(stop, launch_generation);
    });
    impl_->state_changed.notify_all();
}

bool PlayerSession::send_command(const std::string& cmd) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->state != SessionState::Connected || impl_->channel_fd < 0) {
        util::Logger::debug("PlayerSession: Not connected, dropping '" + cmd + "'");
        return false;
    }

    std::string line = cmd + "\n";
    size_t offset = 0;
    while (offset < line.size()) {
        ssize_t sent = ::send(impl_->channel_fd, line.data() + offset, line.size() - offset, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) {
            util::Logger::warn("PlayerSession: Write of '" + cmd + "' failed: " + std::strerror(errno) +
                               ", dropping channel");
            ::close(impl_->channel_fd);
            impl_->channel_fd = -1;
            impl_->state = SessionState::Disconnected;
            impl_->state_changed.notify_all();
            return false;
        }
        offset += static_cast<size_t>(sent);
    }

    util::Logger::debug("PlayerSession: Sent '" + cmd + "'");
    return true;
}

bool PlayerSession::play() { return send_command("play"); }
bool PlayerSession::pause() { return send_command("pause"); }
bool PlayerSession::next() { return send_command("next"); }
bool PlayerSession::previous() { return send_command("prev"); }

bool PlayerSession::wait_until_connected(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->state_changed.wait_for(lock, timeout, [this] {
        return impl_->state == SessionState::Connected;
    });
}

SessionState PlayerSession::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

std::optional<pid_t> PlayerSession::process_id() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->process) return std::nullopt;
    return impl_->process->pid();
}

bool PlayerSession::process_running() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->process && impl_->process->is_running();
}

void PlayerSession::close() {
    auto process = impl_->release();
    if (process) {
        util::Logger::info("PlayerSession: Detached from player (pid " + std::to_string(process->pid()) + ")");
    }
}

}  // namespace reel::backend
