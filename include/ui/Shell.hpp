#pragma once

#include "backend/Config.hpp"
#include "backend/DescriptorStore.hpp"
#include "backend/Dispatcher.hpp"
#include "backend/LibraryIndex.hpp"
#include "backend/MediaScanner.hpp"
#include "backend/PlayerSession.hpp"
#include "backend/ThumbnailCache.hpp"
#include "util/Subprocess.hpp"
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace reel::ui {

/**
 * Line-oriented command interpreter wiring the library, dispatcher and
 * player session together. One instance per process; main() feeds it stdin.
 */
class Shell {
public:
    Shell(backend::Config config,
          std::filesystem::path config_file,
          util::ProcessLauncher& launcher,
          backend::Dispatcher::DocumentOpener opener);

    // Runs one command. Returns false once the user asked to quit.
    bool execute(const std::string& line, std::ostream& out);

    // Auto-scan (when enabled) followed by the first refresh
    void startup(std::ostream& out);

    const backend::LibraryIndex& index() const { return index_; }
    backend::PlayerSession& session() { return session_; }
    const backend::Config& config() const { return config_; }

    static std::vector<std::string> split_command(const std::string& line);

private:
    void cmd_scan(const std::vector<std::string>& args, const std::string& rest, std::ostream& out);
    void cmd_autoscan(std::ostream& out);
    void cmd_refresh(std::ostream& out);
    void cmd_list(const std::vector<std::string>& args, std::ostream& out);
    void cmd_filter(const std::string& query, std::ostream& out);
    void cmd_play(const std::string& query, std::ostream& out);
    void cmd_open(const std::string& row, std::ostream& out);
    void cmd_random(const std::vector<std::string>& args, std::ostream& out);
    void cmd_transport(const std::string& verb, std::ostream& out);
    void cmd_status(std::ostream& out);
    void cmd_thumb(const std::string& query, std::ostream& out);
    void cmd_config(const std::vector<std::string>& args, std::ostream& out);
    void cmd_help(std::ostream& out) const;

    // Row n (1-based) of the last list or filter output, nullptr if none
    const model::LibraryEntry* listed_row(const std::string& text) const;

    void launch_player(const std::filesystem::path& target, std::ostream& out);
    void open_document(const std::filesystem::path& document, std::ostream& out);
    void print_report(const backend::ScanReport& report, std::ostream& out) const;
    static void print_entries(const std::vector<model::LibraryEntry>& entries, std::ostream& out);

    backend::Config config_;
    std::filesystem::path config_file_;
    backend::DescriptorStore store_;
    backend::LibraryIndex index_;
    backend::Dispatcher dispatcher_;
    backend::PlayerSession session_;
    backend::MediaScanner scanner_;
    backend::ThumbnailCache thumbnails_;
    backend::Dispatcher::DocumentOpener opener_;
    std::vector<model::LibraryEntry> last_listing_;
};

}  // namespace reel::ui
