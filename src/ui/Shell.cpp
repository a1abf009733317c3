#include "ui/Shell.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <format>
#include <sstream>
#include <sys/random.h>

namespace reel::ui {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

// Everything after the first `words` words, trimmed
std::string remainder(const std::string& line, size_t words) {
    size_t pos = 0;
    for (size_t i = 0; i < words; ++i) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) return "";
        pos = line.find_first_of(" \t", pos);
        if (pos == std::string::npos) return "";
    }
    return trim(line.substr(pos));
}

size_t random_index(size_t size) {
    uint64_t rand_val = 0;
    if (getrandom(&rand_val, sizeof(rand_val), 0) != static_cast<ssize_t>(sizeof(rand_val))) {
        util::Logger::warn("Shell: getrandom failed, picking the first entry");
        return 0;
    }
    return static_cast<size_t>(rand_val % size);
}

}  // namespace

Shell::Shell(backend::Config config,
             std::filesystem::path config_file,
             util::ProcessLauncher& launcher,
             backend::Dispatcher::DocumentOpener opener)
    : config_(std::move(config)),
      config_file_(std::move(config_file)),
      store_(config_.library_paths()),
      index_(store_),
      dispatcher_(index_, store_, opener),
      session_(backend::PlayerSettings::from_config(config_), launcher),
      scanner_(store_),
      thumbnails_(config_.thumbnail_directory),
      opener_(std::move(opener)) {
    util::Logger::info("Shell: Library at " + config_.library_directory.string());
}

std::vector<std::string> Shell::split_command(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

void Shell::startup(std::ostream& out) {
    if (config_.auto_scan_enabled) {
        cmd_autoscan(out);
    } else {
        cmd_refresh(out);
    }
}

bool Shell::execute(const std::string& line, std::ostream& out) {
    auto args = split_command(line);
    if (args.empty()) return true;

    const std::string& cmd = args[0];
    util::Logger::debug("Shell: Command '" + trim(line) + "'");

    try {
        if (cmd == "quit" || cmd == "exit") {
            return false;
        } else if (cmd == "scan") {
            cmd_scan(args, remainder(line, 2), out);
        } else if (cmd == "autoscan") {
            cmd_autoscan(out);
        } else if (cmd == "refresh") {
            cmd_refresh(out);
        } else if (cmd == "list") {
            cmd_list(args, out);
        } else if (cmd == "filter") {
            cmd_filter(remainder(line, 1), out);
        } else if (cmd == "play") {
            cmd_play(remainder(line, 1), out);
        } else if (cmd == "open") {
            cmd_open(remainder(line, 1), out);
        } else if (cmd == "random") {
            cmd_random(args, out);
        } else if (cmd == "pause" || cmd == "next" || cmd == "prev" || cmd == "resume") {
            cmd_transport(cmd, out);
        } else if (cmd == "status") {
            cmd_status(out);
        } else if (cmd == "thumb") {
            cmd_thumb(remainder(line, 1), out);
        } else if (cmd == "config") {
            cmd_config(args, out);
        } else if (cmd == "help" || cmd == "?") {
            cmd_help(out);
        } else {
            out << "Unknown command: " << cmd << " (try 'help')\n";
        }
    } catch (const backend::IOError& e) {
        util::Logger::error(std::string("Shell: ") + e.what());
        out << "Error: " << e.what() << "\n";
    } catch (const backend::ProcessLaunchError& e) {
        out << "Error: " << e.what() << "\n";
    } catch (const std::filesystem::filesystem_error& e) {
        util::Logger::error(std::string("Shell: ") + e.what());
        out << "Error: " << e.what() << "\n";
    }
    return true;
}

void Shell::cmd_scan(const std::vector<std::string>& args, const std::string& rest, std::ostream& out) {
    if (args.size() < 3 || rest.empty()) {
        out << "Usage: scan mkv|mp4|music|pdf <folder>\n";
        return;
    }

    const std::string& kind = args[1];
    std::filesystem::path folder(rest);
    backend::ScanReport report;
    if (kind == "mkv") {
        report = scanner_.scan_videos(folder, ".mkv", "Movie");
    } else if (kind == "mp4") {
        report = scanner_.scan_videos(folder, ".mp4", "Movie");
    } else if (kind == "music") {
        report = scanner_.scan_music(folder);
    } else if (kind == "pdf") {
        report = scanner_.scan_documents(folder);
    } else {
        out << "Unknown scan kind: " << kind << "\n";
        return;
    }

    print_report(report, out);
    cmd_refresh(out);
}

void Shell::cmd_autoscan(std::ostream& out) {
    auto report = scanner_.run_auto_scan(config_);
    if (report.folders_scanned == 0 && report.skipped_folders.empty()) {
        out << "No auto-scan folders configured.\n";
    } else {
        print_report(report, out);
    }
    cmd_refresh(out);
}

void Shell::cmd_refresh(std::ostream& out) {
    auto result = index_.refresh();
    out << "Library: " << result.entries->size() << " entries";
    if (!result.warnings.empty()) {
        out << ", " << result.warnings.size() << " skipped";
    }
    out << "\n";
    for (const auto& warning : result.warnings) {
        out << "  skipped " << warning.file.filename().string() << ": " << warning.reason << "\n";
    }
}

void Shell::cmd_list(const std::vector<std::string>& args, std::ostream& out) {
    auto column = backend::LibraryIndex::SortColumn::Name;
    bool descending = false;

    if (args.size() > 1) {
        auto parsed = backend::LibraryIndex::parse_column(args[1]);
        if (!parsed) {
            out << "Usage: list [name|type|path] [desc]\n";
            return;
        }
        column = *parsed;
    }
    if (args.size() > 2) {
        descending = args[2] == "desc";
    }

    last_listing_ = index_.sorted(column, descending);
    print_entries(last_listing_, out);
}

void Shell::cmd_filter(const std::string& query, std::ostream& out) {
    auto parts = backend::Dispatcher::parse_query(query);
    if (parts.size() > 3) {
        out << "Use at most three parts: song, album, artist\n";
        return;
    }
    last_listing_ = dispatcher_.filter(query);
    print_entries(last_listing_, out);
}

void Shell::cmd_play(const std::string& query, std::ostream& out) {
    if (query.empty()) {
        out << "Usage: play <query>\n";
        return;
    }

    auto resolution = dispatcher_.dispatch(query, session_);
    if (auto* no_match = std::get_if<model::NoMatch>(&resolution)) {
        out << backend::Dispatcher::describe(*no_match) << "\n";
        return;
    }

    const auto& result = std::get<model::DispatchResult>(resolution);
    switch (result.kind) {
        case model::DispatchResult::Kind::Media:
            out << "Playing: " << result.title << " (score " << result.score << ")\n";
            break;
        case model::DispatchResult::Kind::Document:
            out << "Opening: " << result.title << " (score " << result.score << ")\n";
            break;
    }
}

void Shell::cmd_random(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "Usage: random audio|video|pdf|opened|search\n";
        return;
    }

    const auto& paths = store_.paths();
    const std::string& source = args[1];

    if (source == "search") {
        auto titles = backend::DescriptorStore::read_lines(paths.query_history);
        if (titles.empty()) {
            out << "Search history is empty.\n";
            return;
        }
        const auto& title = titles[random_index(titles.size())];
        out << "Random search: " << title << "\n";
        cmd_play(title, out);
        return;
    }

    std::filesystem::path log;
    bool is_document = false;
    if (source == "audio") {
        log = paths.audio_history;
    } else if (source == "video") {
        log = paths.video_history;
    } else if (source == "pdf") {
        log = paths.document_history;
        is_document = true;
    } else if (source == "opened") {
        log = paths.opened_documents;
        is_document = true;
    } else {
        out << "Unknown history: " << source << "\n";
        return;
    }

    auto entries = backend::DescriptorStore::read_history(log);
    if (entries.empty()) {
        out << "No entries in " << log.filename().string() << ".\n";
        return;
    }

    const auto& pick = entries[random_index(entries.size())];
    std::error_code ec;
    if (!std::filesystem::exists(pick, ec)) {
        out << "Picked file no longer exists: " << pick.string() << "\n";
        return;
    }

    if (is_document) {
        open_document(pick, out);
    } else {
        launch_player(pick, out);
    }
}

void Shell::cmd_transport(const std::string& verb, std::ostream& out) {
    bool sent = false;
    if (verb == "pause") sent = session_.pause();
    else if (verb == "next") sent = session_.next();
    else if (verb == "prev") sent = session_.previous();
    else if (verb == "resume") sent = session_.play();

    if (!sent) {
        out << "Player not connected (" << backend::to_string(session_.state()) << ")\n";
    }
}

void Shell::cmd_status(std::ostream& out) {
    out << "Player: " << backend::to_string(session_.state());
    if (auto pid = session_.process_id()) {
        out << " (pid " << *pid << (session_.process_running() ? "" : ", exited") << ")";
    }
    out << "\n";
    out << "Library: " << index_.size() << " entries in " << config_.library_directory.string() << "\n";
    out << "Log: " << util::Logger::log_path().string() << "\n";
}

void Shell::cmd_open(const std::string& row, std::ostream& out) {
    const model::LibraryEntry* entry = listed_row(row);
    if (!entry) {
        out << "Usage: open <n> (a row number from the last list or filter)\n";
        return;
    }

    std::error_code ec;
    if (entry->type == model::MediaType::Document) {
        if (!std::filesystem::exists(entry->path, ec)) {
            out << "File not found: " << entry->path.string() << "\n";
            return;
        }
        open_document(entry->path, out);
        return;
    }

    // The descriptor carries the whole rotation; the bare file is the fallback
    std::filesystem::path target;
    if (entry->source_descriptor && std::filesystem::exists(*entry->source_descriptor, ec)) {
        target = *entry->source_descriptor;
    } else if (std::filesystem::exists(entry->path, ec)) {
        target = entry->path;
    } else {
        out << "File not found: " << entry->path.string() << "\n";
        return;
    }

    session_.launch(target.string());
    out << "Playing: " << entry->name << "\n";
}

void Shell::cmd_thumb(const std::string& query, std::ostream& out) {
    const model::LibraryEntry* entry = listed_row(query);
    std::vector<model::LibraryEntry> matches;
    if (!entry && !query.empty()) {
        matches = dispatcher_.filter(query);
        if (!matches.empty()) entry = &matches.front();
    }
    if (!entry) {
        out << "No entry matches '" << query << "'.\n";
        return;
    }

    if (auto thumb = thumbnails_.obtain(entry->path, entry->type)) {
        out << entry->name << ": " << thumb->string() << "\n";
    } else {
        out << entry->name << ": no thumbnail available\n";
    }
}

const model::LibraryEntry* Shell::listed_row(const std::string& text) const {
    size_t row = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), row);
    if (ec != std::errc() || ptr != text.data() + text.size()) return nullptr;
    if (row == 0 || row > last_listing_.size()) return nullptr;
    return &last_listing_[row - 1];
}

void Shell::cmd_config(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() >= 3 && args[1] == "autoscan") {
        if (args[2] != "on" && args[2] != "off") {
            out << "Usage: config autoscan on|off\n";
            return;
        }
        config_.auto_scan_enabled = args[2] == "on";
        backend::ConfigLoader::save_config(config_, config_file_);
        out << "Auto-scan " << (config_.auto_scan_enabled ? "enabled" : "disabled") << ".\n";
        return;
    }
    if (args.size() >= 2 && args[1] == "save") {
        backend::ConfigLoader::save_config(config_, config_file_);
        out << "Saved " << config_file_.string() << "\n";
        return;
    }

    auto folders = [&out](const char* label, const std::vector<std::filesystem::path>& list) {
        out << std::format("  {:<6}", label);
        if (list.empty()) out << " (none)";
        for (const auto& folder : list) out << " " << folder.string();
        out << "\n";
    };

    out << "Config file: " << config_file_.string() << "\n";
    out << "Auto-scan: " << (config_.auto_scan_enabled ? "on" : "off") << "\n";
    out << "Folders:\n";
    folders("mkv", config_.mkv_folders);
    folders("mp4", config_.mp4_folders);
    folders("pdf", config_.pdf_folders);
    folders("music", config_.music_folders);
    out << "Player: " << config_.player_executable << " (rc " << config_.rc_host << ":" << config_.rc_port << ")\n";
    out << "Library: " << config_.library_directory.string() << "\n";
    out << "Thumbnails: " << config_.thumbnail_directory.string() << "\n";
}

void Shell::cmd_help(std::ostream& out) const {
    out << "Commands:\n"
           "  scan mkv|mp4|music|pdf <folder>   create descriptors and history from a folder\n"
           "  autoscan                          scan the configured folders\n"
           "  refresh                           reload the library\n"
           "  list [name|type|path] [desc]      show the library\n"
           "  filter <query>                    term | album, artist | song, album, artist\n"
           "  play <query>                      play or open the best match\n"
           "  open <n>                          play or open row n of the last list/filter\n"
           "  random audio|video|pdf|opened|search\n"
           "  pause | resume | next | prev      control the player\n"
           "  status                            player and library state\n"
           "  thumb <n>|<query>                 thumbnail for a listed row or the first match\n"
           "  config [save | autoscan on|off]   show or change settings\n"
           "  quit\n";
}

void Shell::launch_player(const std::filesystem::path& target, std::ostream& out) {
    session_.launch(target.string());
    out << "Playing: " << target.filename().string() << "\n";
}

void Shell::open_document(const std::filesystem::path& document, std::ostream& out) {
    if (!opener_ || !opener_(document)) {
        out << "Could not open " << document.string() << "\n";
        return;
    }
    backend::DescriptorStore::append_history(store_.paths().opened_documents, document, false);
    out << "Opening: " << document.filename().string() << "\n";
}

void Shell::print_report(const backend::ScanReport& report, std::ostream& out) const {
    out << "Scanned " << report.folders_scanned << " folder(s): "
        << report.descriptors_written << " descriptors, "
        << report.history_appended << " new history entries\n";
    for (const auto& folder : report.skipped_folders) {
        out << "  skipped " << folder.string() << "\n";
    }
    for (const auto& error : report.errors) {
        out << "  error: " << error << "\n";
    }
}

void Shell::print_entries(const std::vector<model::LibraryEntry>& entries, std::ostream& out) {
    size_t row = 0;
    for (const auto& entry : entries) {
        out << std::format("{:>4}  {:<9} {:<5} {}", ++row, model::to_string(entry.type), entry.format, entry.name);
        if (entry.artist && entry.album) {
            out << "  [" << *entry.artist << " / " << *entry.album << "]";
        }
        out << "\n";
    }
    out << entries.size() << " entries\n";
}

}  // namespace reel::ui
