#include "../framework/SimpleTest.hpp"
#include "../framework/TempDir.hpp"
#include "backend/Config.hpp"
#include "backend/DescriptorStore.hpp"
#include "backend/Errors.hpp"
#include "util/ContentHasher.hpp"
#include "util/PathCodec.hpp"
#include <vector>

using namespace reel::backend;
using reel::test::TempDir;

static DescriptorStore make_store(const TempDir& dir) {
    return DescriptorStore(LibraryPaths::under(dir / "playlists"));
}

// ---- sanitize_name ----

TEST_CASE(test_sanitize_strips_invalid_characters) {
    ASSERT_EQ(DescriptorStore::sanitize_name("Movie: Part 2?"), "Movie Part 2");
    ASSERT_EQ(DescriptorStore::sanitize_name("  (Live) A-B_C.v2  "), "(Live) A-B_C.v2");
}

TEST_CASE(test_sanitize_drops_non_ascii) {
    ASSERT_EQ(DescriptorStore::sanitize_name("Bj\xC3\xB6rk"), "Bjrk");
    ASSERT_EQ(DescriptorStore::sanitize_name("\xE6\x97\xA5\xE6\x9C\xAC"), "");
}

TEST_CASE(test_sanitize_truncates_to_budget) {
    std::string long_name(400, 'a');
    auto safe = DescriptorStore::sanitize_name(long_name);
    ASSERT_EQ(safe.size(), DescriptorStore::MAX_FILENAME_LENGTH - DescriptorStore::DESCRIPTOR_EXTENSION.size());
    ASSERT_EQ(safe.size(), 211u);
}

// ---- write_media_descriptor ----

TEST_CASE(test_write_descriptor_contents) {
    TempDir dir;
    auto store = make_store(dir);

    auto descriptor = store.write_media_descriptor("Inception", {"/films/Inception 2010.mkv"}, "Movie");
    ASSERT_EQ(descriptor, dir / "playlists" / "Inception.m3u");
    ASSERT_EQ(TempDir::read(descriptor), "# Movie: Inception\nfile:///films/Inception%202010.mkv\n");
}

TEST_CASE(test_write_descriptor_keeps_order) {
    TempDir dir;
    auto store = make_store(dir);

    auto descriptor = store.write_media_descriptor("Song", {"/m/b.aiff", "/m/c.aiff", "/m/a.aiff"}, "Song");
    ASSERT_EQ(TempDir::read(descriptor),
              "# Song: Song\nfile:///m/b.aiff\nfile:///m/c.aiff\nfile:///m/a.aiff\n");
}

TEST_CASE(test_write_descriptor_sanitized_name_and_header) {
    TempDir dir;
    auto store = make_store(dir);

    auto descriptor = store.write_media_descriptor("Movie: Part 2?", {"/v/p2.mkv"}, "Movie");
    ASSERT_EQ(descriptor.filename().string(), "Movie Part 2.m3u");
    // Header keeps the display name as given
    ASSERT_TRUE(TempDir::read(descriptor).starts_with("# Movie: Movie: Part 2?\n"));
}

TEST_CASE(test_write_descriptor_empty_name_uses_hash) {
    TempDir dir;
    auto store = make_store(dir);

    std::string name = "\xE6\x97\xA5\xE6\x9C\xAC";
    auto descriptor = store.write_media_descriptor(name, {"/a.aiff"}, "Song");
    ASSERT_EQ(descriptor.filename().string(), "playlist_" + reel::util::ContentHasher::short_hex(name) + ".m3u");
}

TEST_CASE(test_write_descriptor_last_write_wins) {
    TempDir dir;
    auto store = make_store(dir);

    store.write_media_descriptor("Same?", {"/first.mkv"}, "Movie");
    auto descriptor = store.write_media_descriptor("Same", {"/second.mkv"}, "Movie");
    ASSERT_EQ(TempDir::read(descriptor), "# Movie: Same\nfile:///second.mkv\n");
    ASSERT_FALSE(std::filesystem::exists(dir / "playlists" / "Same.m3u.tmp"));
}

TEST_CASE(test_write_descriptor_unwritable_directory_throws) {
    TempDir dir;
    dir.write("playlists", "not a directory");
    auto store = make_store(dir);
    ASSERT_THROWS(store.write_media_descriptor("X", {"/x.mkv"}, "Movie"), IOError);
}

// ---- history logs ----

TEST_CASE(test_append_history_idempotent) {
    TempDir dir;
    auto log = dir / "playlists" / "history.m3u";

    ASSERT_TRUE(DescriptorStore::append_history(log, "/music/a b.aiff", true));
    ASSERT_FALSE(DescriptorStore::append_history(log, "/music/a b.aiff", true));
    ASSERT_EQ(TempDir::read(log), "file:///music/a%20b.aiff\n");
}

TEST_CASE(test_append_history_normalized_membership) {
    TempDir dir;
    auto log = dir / "pdf_opened_history.txt";

    ASSERT_TRUE(DescriptorStore::append_history(log, "/Docs/Manual.PDF", false));
    ASSERT_FALSE(DescriptorStore::append_history(log, "/docs/manual.pdf", false));
    // Encoded and raw forms of one path are the same entry
    ASSERT_FALSE(DescriptorStore::append_history(log, "/Docs/Manual.PDF", true));
    ASSERT_EQ(DescriptorStore::read_lines(log).size(), 1u);
}

TEST_CASE(test_append_history_raw_form) {
    TempDir dir;
    auto log = dir / "pdf_history.txt";
    DescriptorStore::append_history(log, "/docs/a b.pdf", false);
    ASSERT_EQ(TempDir::read(log), "/docs/a b.pdf\n");
}

TEST_CASE(test_append_history_ignores_comments_when_reading_keys) {
    TempDir dir;
    auto log = dir.write("history2.m3u", "# header\n\nfile:///v/a.mkv\n");
    ASSERT_FALSE(DescriptorStore::append_history(log, "/v/a.mkv", true));
    ASSERT_TRUE(DescriptorStore::append_history(log, "/v/b.mkv", true));
}

TEST_CASE(test_append_history_repairs_missing_newline) {
    TempDir dir;
    auto log = dir.write("history.m3u", "file:///a.aiff");
    ASSERT_TRUE(DescriptorStore::append_history(log, "/b.aiff", true));

    auto entries = DescriptorStore::read_history(log);
    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(entries[0], std::filesystem::path("/a.aiff"));
    ASSERT_EQ(entries[1], std::filesystem::path("/b.aiff"));
}

TEST_CASE(test_append_history_batch) {
    TempDir dir;
    auto log = dir / "history2.m3u";
    DescriptorStore::append_history(log, "/v/a.mkv", true);

    size_t added = DescriptorStore::append_history_batch(
        log, {"/v/a.mkv", "/v/b.mkv", "/V/B.MKV", "/v/c.avi"}, true);
    ASSERT_EQ(added, 2u);
    ASSERT_EQ(DescriptorStore::read_history(log).size(), 3u);

    ASSERT_EQ(DescriptorStore::append_history_batch(log, {"/v/c.avi"}, true), 0u);
}

TEST_CASE(test_append_line_does_not_dedupe) {
    TempDir dir;
    auto log = dir / "search_history.txt";
    DescriptorStore::append_line(log, "Inception");
    DescriptorStore::append_line(log, "Inception");
    ASSERT_EQ(DescriptorStore::read_lines(log).size(), 2u);
}

TEST_CASE(test_read_history_missing_file_is_empty) {
    TempDir dir;
    ASSERT_TRUE(DescriptorStore::read_history(dir / "nope.m3u").empty());
}

// ---- listing and scanning ----

TEST_CASE(test_list_descriptors_excludes_history_logs) {
    TempDir dir;
    dir.write("playlists/b.m3u", "# Movie: b\nfile:///b.mkv\n");
    dir.write("playlists/a.M3U", "# Movie: a\nfile:///a.mkv\n");
    dir.write("playlists/history.m3u", "file:///x.aiff\n");
    dir.write("playlists/history2.m3u", "file:///x.mkv\n");
    dir.write("playlists/pdf_history.txt", "/x.pdf\n");

    auto store = make_store(dir);
    auto descriptors = store.list_descriptors();
    ASSERT_EQ(descriptors.size(), 2u);
    ASSERT_EQ(descriptors[0].filename().string(), "a.M3U");
    ASSERT_EQ(descriptors[1].filename().string(), "b.m3u");
}

TEST_CASE(test_list_descriptors_missing_directory) {
    TempDir dir;
    auto store = make_store(dir);
    ASSERT_TRUE(store.list_descriptors().empty());
}

TEST_CASE(test_scan_tree_recursive_and_case_insensitive) {
    TempDir dir;
    dir.write("films/A.MKV", "x");
    dir.write("films/sub/B.mkv", "x");
    dir.write("films/sub/c.mp4", "x");

    auto files = DescriptorStore::scan_tree(dir / "films", {".mkv"});
    ASSERT_EQ(files.size(), 2u);
    for (const auto& f : files) {
        ASSERT_TRUE(f.is_absolute());
    }
}

TEST_CASE(test_scan_tree_unreadable_root_throws) {
    TempDir dir;
    ASSERT_THROWS(DescriptorStore::scan_tree(dir / "missing", {".mkv"}), IOError);
    auto file = dir.write("plain.txt", "x");
    ASSERT_THROWS(DescriptorStore::scan_tree(file, {".mkv"}), IOError);
}

// ---- Config ----

TEST_CASE(test_config_defaults) {
    auto cfg = ConfigLoader::create_default_config();
    ASSERT_FALSE(cfg.auto_scan_enabled);
    ASSERT_EQ(cfg.player_executable, "vlc");
    ASSERT_EQ(cfg.rc_host, "localhost");
    ASSERT_EQ(cfg.rc_port, 42123);
    ASSERT_EQ(cfg.library_directory.filename().string(), "playlists");
}

TEST_CASE(test_config_parse_all_sections) {
    TempDir dir;
    auto file = dir.write("config.json", R"({
  "auto_scan_enabled": true,
  "scan_folders": {
    "mkv": ["/films", "/more films"],
    "mp4": [],
    "pdf": ["/docs", "/papers"],
    "music": ["/music"]
  },
  "player": {
    "executable": "/usr/bin/vlc",
    "rc_host": "127.0.0.1",
    "rc_port": 4212
  },
  "paths": {
    "library_directory": "/data/lists",
    "thumbnail_directory": "/data/thumbs"
  }
})");

    auto cfg = ConfigLoader::load_from_file(file);
    ASSERT_TRUE(cfg.auto_scan_enabled);
    ASSERT_EQ(cfg.mkv_folders.size(), 2u);
    ASSERT_EQ(cfg.mkv_folders[1], std::filesystem::path("/more films"));
    ASSERT_TRUE(cfg.mp4_folders.empty());
    ASSERT_EQ(cfg.pdf_folders.size(), 2u);
    ASSERT_EQ(cfg.pdf_folders[1], std::filesystem::path("/papers"));
    ASSERT_EQ(cfg.music_folders.size(), 1u);
    ASSERT_EQ(cfg.player_executable, "/usr/bin/vlc");
    ASSERT_EQ(cfg.rc_host, "127.0.0.1");
    ASSERT_EQ(cfg.rc_port, 4212);
    ASSERT_EQ(cfg.library_directory, std::filesystem::path("/data/lists"));
    ASSERT_EQ(cfg.library_paths().video_history, std::filesystem::path("/data/lists/history2.m3u"));
}

TEST_CASE(test_config_reads_minimal_scan_file) {
    // Only the scan keys; everything else stays at its default
    TempDir dir;
    auto file = dir.write("config.json", R"({
  "auto_scan_enabled": false,
  "scan_folders": {"mkv": ["/films"], "mp4": [], "pdf": [], "music": []}
})");

    auto cfg = ConfigLoader::load_from_file(file);
    ASSERT_FALSE(cfg.auto_scan_enabled);
    ASSERT_EQ(cfg.mkv_folders.size(), 1u);
    ASSERT_EQ(cfg.player_executable, "vlc");
    ASSERT_EQ(cfg.rc_port, 42123);
    ASSERT_EQ(cfg.library_directory.filename().string(), "playlists");
}

TEST_CASE(test_config_invalid_values_keep_defaults) {
    TempDir dir;
    auto file = dir.write("config.json", R"({
  "auto_scan_enabled": "maybe",
  "player": {"rc_port": 99999},
  "scan_folders": {"mkv": "not-an-array", "pdf": ["/docs", 3]}
})");

    auto cfg = ConfigLoader::load_from_file(file);
    ASSERT_FALSE(cfg.auto_scan_enabled);
    ASSERT_EQ(cfg.rc_port, 42123);
    ASSERT_TRUE(cfg.mkv_folders.empty());
    ASSERT_TRUE(cfg.pdf_folders.empty());
}

TEST_CASE(test_config_malformed_file_uses_defaults) {
    TempDir dir;
    auto file = dir.write("config.json", "{ \"auto_scan_enabled\": true,");

    auto cfg = ConfigLoader::load_from_file(file);
    ASSERT_FALSE(cfg.auto_scan_enabled);
    ASSERT_EQ(cfg.player_executable, "vlc");
}

TEST_CASE(test_config_save_and_reload) {
    TempDir dir;
    Config cfg = ConfigLoader::create_default_config();
    cfg.auto_scan_enabled = true;
    cfg.music_folders = {"/music/with \"quotes\"", "/music/two"};
    cfg.rc_port = 5000;
    cfg.library_directory = dir / "lists";

    auto file = dir / "conf" / "config.json";
    ConfigLoader::save_config(cfg, file);
    auto loaded = ConfigLoader::load_from_file(file);

    ASSERT_TRUE(loaded.auto_scan_enabled);
    ASSERT_EQ(loaded.music_folders, cfg.music_folders);
    ASSERT_EQ(loaded.rc_port, 5000);
    ASSERT_EQ(loaded.library_directory, cfg.library_directory);

    // Written with the scan keys at the top level
    auto text = TempDir::read(file);
    ASSERT_TRUE(text.find("\"auto_scan_enabled\": true") != std::string::npos);
    ASSERT_TRUE(text.find("\"scan_folders\"") != std::string::npos);
}

TEST_CASE(test_library_paths_history_logs) {
    auto paths = LibraryPaths::under("/lib");
    ASSERT_TRUE(paths.is_history_log("/lib/history.m3u"));
    ASSERT_TRUE(paths.is_history_log("/lib/HISTORY2.m3u"));
    ASSERT_FALSE(paths.is_history_log("/lib/Inception.m3u"));
}

int main() {
    return reel::test::TestRunner::instance().run_all();
}
