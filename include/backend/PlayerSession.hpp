#pragma once

#include "backend/Config.hpp"
#include "util/Subprocess.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::backend {

enum class SessionState {
    Idle,           // No player started by this session
    Launching,      // Player started, control channel not (yet) open
    Connected,      // Control channel open
    Disconnected,   // Channel lost after a failed write; player may still run
};

std::string_view to_string(SessionState state);

struct PlayerSettings {
    std::string executable = "vlc";
    std::string rc_host = "localhost";
    int rc_port = 42123;
    std::chrono::milliseconds connect_interval{100};
    std::chrono::milliseconds connect_timeout{5000};

    static PlayerSettings from_config(const Config& cfg);
};

/**
 * PlayerSession: one external player process and its remote-control socket.
 *
 * launch() tears down whatever the session owned before starting the new
 * player, so at most one process and one channel belong to the session at any
 * time. The channel is opened by a background thread that retries every
 * connect_interval until connect_timeout; commands sent before it is open
 * fail without side effects.
 *
 * Dropping the session (or close()) releases the channel but leaves the
 * player running.
 */
class PlayerSession {
public:
    PlayerSession(PlayerSettings settings, util::ProcessLauncher& launcher);
    ~PlayerSession();

    PlayerSession(const PlayerSession&) = delete;
    PlayerSession& operator=(const PlayerSession&) = delete;

    // Throws ProcessLaunchError; the session is Idle afterwards in that case
    void launch(const std::string& target);

    // Writes "<cmd>\n". False if not connected or the write failed.
    bool send_command(const std::string& cmd);

    bool play();
    bool pause();
    bool next();
    bool previous();

    bool wait_until_connected(std::chrono::milliseconds timeout);

    SessionState state() const;
    std::optional<pid_t> process_id() const;
    bool process_running() const;

    void close();

    std::vector<std::string> command_line(const std::string& target) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace reel::backend
