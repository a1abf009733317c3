#include "../framework/SimpleTest.hpp"
#include "../framework/TempDir.hpp"
#include "backend/Config.hpp"
#include "backend/DescriptorStore.hpp"
#include "backend/Dispatcher.hpp"
#include "backend/LibraryIndex.hpp"
#include "backend/MediaScanner.hpp"
#include "backend/PlayerSession.hpp"
#include "ui/Shell.hpp"
#include "util/PathCodec.hpp"
#include <memory>
#include <sstream>
#include <vector>

using namespace reel::backend;
using reel::test::TempDir;

namespace {

// Records launches without starting anything
class RecordingLauncher : public reel::util::ProcessLauncher {
public:
    class Handle : public reel::util::ProcessHandle {
    public:
        explicit Handle(pid_t pid, std::shared_ptr<bool> running) : pid_(pid), running_(std::move(running)) {}
        pid_t pid() const override { return pid_; }
        bool is_running() override { return *running_; }
        void terminate() override { *running_ = false; }

    private:
        pid_t pid_;
        std::shared_ptr<bool> running_;
    };

    std::unique_ptr<reel::util::ProcessHandle> launch(const std::vector<std::string>& argv) override {
        launches.push_back(argv);
        auto running = std::make_shared<bool>(true);
        alive.push_back(running);
        return std::make_unique<Handle>(4000 + static_cast<pid_t>(launches.size()), running);
    }

    std::vector<std::vector<std::string>> launches;
    std::vector<std::shared_ptr<bool>> alive;
};

// A media tree with movies, one album and a couple of documents
void build_media_tree(const TempDir& dir) {
    dir.write("media/films/Inception.mkv", "x");
    dir.write("media/films/The Matrix.mkv", "x");
    dir.write("media/films/Blade Runner.mp4", "x");
    dir.write("media/music/The Beatles/Abbey Road/01 Come Together.aiff", "x");
    dir.write("media/music/The Beatles/Abbey Road/02 Something.aiff", "x");
    dir.write("media/docs/Owners Manual.pdf", "%PDF");
    dir.write("media/docs/Tax Return 2024.pdf", "%PDF");
}

Config config_for(const TempDir& dir) {
    Config cfg;
    cfg.mkv_folders = {dir / "media/films"};
    cfg.mp4_folders = {dir / "media/films"};
    cfg.music_folders = {dir / "media/music"};
    cfg.pdf_folders = {dir / "media/docs"};
    cfg.library_directory = dir / "library";
    cfg.thumbnail_directory = dir / "thumbs";
    // Nothing listens here; the session stays in Launching
    cfg.rc_host = "127.0.0.1";
    cfg.rc_port = 9;
    return cfg;
}

}  // namespace

TEST_CASE(test_scan_refresh_filter_resolve) {
    TempDir dir;
    build_media_tree(dir);
    Config cfg = config_for(dir);

    DescriptorStore store(cfg.library_paths());
    MediaScanner scanner(store);
    auto report = scanner.run_auto_scan(cfg);
    ASSERT_TRUE(report.skipped_folders.empty());
    ASSERT_TRUE(report.errors.empty());
    // 2 mkv, 1 mp4, 2 songs, 1 album, 1 artist
    ASSERT_EQ(report.descriptors_written, 7u);

    LibraryIndex index(store);
    auto result = index.refresh();
    ASSERT_TRUE(result.warnings.empty());
    // Descriptors plus the two documents
    ASSERT_EQ(result.entries->size(), 9u);

    std::vector<std::string> opened;
    Dispatcher dispatcher(index, store, [&opened](const std::filesystem::path& p) {
        opened.push_back(p.string());
        return true;
    });

    auto by_album = dispatcher.filter("abbey road, beatles");
    ASSERT_FALSE(by_album.empty());
    for (const auto& entry : by_album) {
        ASSERT_EQ(entry.album, std::optional<std::string>("Abbey Road"));
    }

    auto resolution = dispatcher.resolve("incepton");
    auto* hit = std::get_if<reel::model::DispatchResult>(&resolution);
    ASSERT_TRUE(hit != nullptr);
    ASSERT_EQ(hit->title, "Inception");
    ASSERT_TRUE(hit->kind == reel::model::DispatchResult::Kind::Media);
    ASSERT_EQ(hit->resolved_path, std::filesystem::absolute(dir / "media/films/Inception.mkv"));

    auto doc = dispatcher.resolve("owners manual");
    auto* doc_hit = std::get_if<reel::model::DispatchResult>(&doc);
    ASSERT_TRUE(doc_hit != nullptr);
    ASSERT_TRUE(doc_hit->kind == reel::model::DispatchResult::Kind::Document);

    // Both successful lookups end up in the query history
    auto queries = DescriptorStore::read_lines(store.paths().query_history);
    ASSERT_EQ(queries.size(), 2u);
    ASSERT_EQ(queries[0], "Inception");
}

TEST_CASE(test_dispatch_launches_player_on_descriptor) {
    TempDir dir;
    build_media_tree(dir);
    Config cfg = config_for(dir);

    DescriptorStore store(cfg.library_paths());
    MediaScanner scanner(store);
    scanner.run_auto_scan(cfg);
    LibraryIndex index(store);
    index.refresh();
    Dispatcher dispatcher(index, store, {});

    RecordingLauncher launcher;
    PlayerSettings settings = PlayerSettings::from_config(cfg);
    settings.connect_timeout = std::chrono::milliseconds(200);
    PlayerSession session(settings, launcher);

    auto first = dispatcher.dispatch("the matrix", session);
    ASSERT_TRUE(std::holds_alternative<reel::model::DispatchResult>(first));
    ASSERT_EQ(launcher.launches.size(), 1u);
    ASSERT_EQ(launcher.launches[0].back(), (cfg.library_directory / "The Matrix.m3u").string());

    dispatcher.dispatch("blade runner", session);
    ASSERT_EQ(launcher.launches.size(), 2u);
    // The first player is replaced, not left running
    ASSERT_FALSE(*launcher.alive[0]);
    ASSERT_TRUE(*launcher.alive[1]);

    auto miss = dispatcher.dispatch("zzzzzzzz", session);
    ASSERT_TRUE(std::holds_alternative<reel::model::NoMatch>(miss));
    ASSERT_EQ(launcher.launches.size(), 2u);
}

TEST_CASE(test_shell_session) {
    TempDir dir;
    build_media_tree(dir);
    Config cfg = config_for(dir);
    cfg.mkv_folders.clear();
    cfg.mp4_folders.clear();
    cfg.music_folders.clear();
    cfg.pdf_folders.clear();

    RecordingLauncher launcher;
    std::vector<std::filesystem::path> opened;
    reel::ui::Shell shell(cfg, dir / "config.json", launcher, [&opened](const std::filesystem::path& p) {
        opened.push_back(p);
        return true;
    });

    std::ostringstream out;
    shell.startup(out);
    ASSERT_EQ(shell.index().size(), 0u);

    ASSERT_TRUE(shell.execute("scan mkv " + (dir / "media/films").string(), out));
    ASSERT_TRUE(shell.execute("scan pdf " + (dir / "media/docs").string(), out));
    ASSERT_EQ(shell.index().size(), 4u);

    out.str("");
    ASSERT_TRUE(shell.execute("play inception", out));
    ASSERT_TRUE(out.str().find("Playing: Inception") != std::string::npos);
    ASSERT_EQ(launcher.launches.size(), 1u);

    out.str("");
    ASSERT_TRUE(shell.execute("play tax return 2024", out));
    ASSERT_TRUE(out.str().find("Opening: Tax Return 2024") != std::string::npos);
    ASSERT_EQ(opened.size(), 1u);

    out.str("");
    ASSERT_TRUE(shell.execute("play qqqqqqqqqqqq", out));
    ASSERT_TRUE(out.str().find("No match found") != std::string::npos);

    out.str("");
    ASSERT_TRUE(shell.execute("scan mkv " + (dir / "missing").string(), out));
    ASSERT_TRUE(out.str().find("Error:") != std::string::npos);

    out.str("");
    ASSERT_TRUE(shell.execute("bogus", out));
    ASSERT_TRUE(out.str().find("Unknown command") != std::string::npos);

    out.str("");
    ASSERT_TRUE(shell.execute("config autoscan on", out));
    ASSERT_TRUE(shell.config().auto_scan_enabled);
    auto reloaded = ConfigLoader::load_from_file(dir / "config.json");
    ASSERT_TRUE(reloaded.auto_scan_enabled);

    ASSERT_FALSE(shell.execute("quit", out));
    shell.session().close();
}

TEST_CASE(test_shell_open_listed_rows) {
    TempDir dir;
    build_media_tree(dir);
    Config cfg = config_for(dir);

    RecordingLauncher launcher;
    std::vector<std::filesystem::path> opened;
    reel::ui::Shell shell(cfg, dir / "config.json", launcher, [&opened](const std::filesystem::path& p) {
        opened.push_back(p);
        return true;
    });

    std::ostringstream out;
    ASSERT_TRUE(shell.execute("scan mkv " + (dir / "media/films").string(), out));
    ASSERT_TRUE(shell.execute("scan pdf " + (dir / "media/docs").string(), out));

    // Nothing listed yet
    out.str("");
    ASSERT_TRUE(shell.execute("open 1", out));
    ASSERT_TRUE(out.str().find("Usage: open") != std::string::npos);
    ASSERT_TRUE(launcher.launches.empty());

    out.str("");
    ASSERT_TRUE(shell.execute("filter matrix", out));
    ASSERT_TRUE(out.str().find("   1  Video") != std::string::npos);

    out.str("");
    ASSERT_TRUE(shell.execute("open 1", out));
    ASSERT_TRUE(out.str().find("Playing: The Matrix") != std::string::npos);
    ASSERT_EQ(launcher.launches.size(), 1u);
    ASSERT_EQ(launcher.launches[0].back(), (cfg.library_directory / "The Matrix.m3u").string());

    // Name order: Inception, Owners Manual, Tax Return 2024, The Matrix
    out.str("");
    ASSERT_TRUE(shell.execute("list name", out));
    ASSERT_TRUE(out.str().find("   2  Document") != std::string::npos);

    out.str("");
    ASSERT_TRUE(shell.execute("open 2", out));
    ASSERT_EQ(opened.size(), 1u);
    ASSERT_EQ(opened[0].filename().string(), "Owners Manual.pdf");
    ASSERT_EQ(DescriptorStore::read_history(cfg.library_paths().opened_documents).size(), 1u);

    // Descriptor gone: the referenced file is played directly
    std::filesystem::remove(cfg.library_directory / "Inception.m3u");
    out.str("");
    ASSERT_TRUE(shell.execute("open 1", out));
    ASSERT_EQ(launcher.launches.size(), 2u);
    ASSERT_EQ(launcher.launches[1].back(), (dir / "media/films/Inception.mkv").string());
    ASSERT_FALSE(*launcher.alive[0]);

    // Document removed from disk after listing
    std::filesystem::remove(dir / "media/docs/Tax Return 2024.pdf");
    out.str("");
    ASSERT_TRUE(shell.execute("open 3", out));
    ASSERT_TRUE(out.str().find("File not found") != std::string::npos);
    ASSERT_EQ(opened.size(), 1u);

    for (const char* bad : {"open 0", "open 9", "open two", "open"}) {
        out.str("");
        ASSERT_TRUE(shell.execute(bad, out));
        ASSERT_TRUE(out.str().find("Usage: open") != std::string::npos);
    }

    shell.session().close();
}

int main() {
    return reel::test::TestRunner::instance().run_all();
}
