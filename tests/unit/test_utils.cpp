#include "../framework/SimpleTest.hpp"
#include "../framework/TempDir.hpp"
#include "util/ContentHasher.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/FuzzyMatch.hpp"
#include "util/PathCodec.hpp"
#include "util/Platform.hpp"
#include "util/Subprocess.hpp"
#include <algorithm>
#include <system_error>
#include <vector>

using namespace reel::util;
using reel::test::TempDir;

// ---- PathCodec ----

TEST_CASE(test_path_codec_encode_spaces) {
    ASSERT_EQ(PathCodec::encode("/media/My Movies/a b.mkv"), "file:///media/My%20Movies/a%20b.mkv");
}

TEST_CASE(test_path_codec_encode_keeps_unreserved) {
    ASSERT_EQ(PathCodec::encode("/a-b_c.d~e/f"), "file:///a-b_c.d~e/f");
    ASSERT_EQ(PathCodec::encode("/x/(1)?"), "file:///x/%281%29%3F");
}

TEST_CASE(test_path_codec_encode_multibyte_upper_hex) {
    // é is C3 A9 in UTF-8
    ASSERT_EQ(PathCodec::encode("/Am\xC3\xA9lie.mkv"), "file:///Am%C3%A9lie.mkv");
}

TEST_CASE(test_path_codec_round_trip_spaces_and_non_ascii) {
    std::vector<std::filesystem::path> paths = {
        "/home/user/My Movies/Am\xC3\xA9lie (2001).mkv",
        "/music/Bj\xC3\xB6rk/Homogenic/01 Hunter.aiff",
        "/docs/100% sure & done #1.pdf",
    };
    for (const auto& p : paths) {
        ASSERT_EQ(PathCodec::decode(PathCodec::encode(p)), p);
    }
}

TEST_CASE(test_path_codec_decode_plain_line_unchanged) {
    ASSERT_EQ(PathCodec::decode("/plain/path with space.pdf"), std::filesystem::path("/plain/path with space.pdf"));
}

TEST_CASE(test_path_codec_decode_collapses_leading_slashes) {
    ASSERT_EQ(PathCodec::decode("file:////abs/movie.mkv"), std::filesystem::path("/abs/movie.mkv"));
}

TEST_CASE(test_path_codec_decode_drive_letter) {
    ASSERT_EQ(PathCodec::decode("file:///C:/Music/x.mp3"), std::filesystem::path("C:/Music/x.mp3"));
}

TEST_CASE(test_path_codec_decode_scheme_case_insensitive) {
    ASSERT_TRUE(PathCodec::is_encoded("FILE:///x"));
    ASSERT_EQ(PathCodec::decode("File:///a%20b"), std::filesystem::path("/a b"));
}

TEST_CASE(test_path_codec_malformed_escape_kept) {
    ASSERT_EQ(PathCodec::percent_decode("100%zz"), "100%zz");
    ASSERT_EQ(PathCodec::percent_decode("tail%4"), "tail%4");
}

TEST_CASE(test_path_codec_normalize_windows_and_case) {
    ASSERT_EQ(PathCodec::normalize_for_compare("C:\\a\\B.mp3"), PathCodec::normalize_for_compare("c:/a/b.mp3"));
}

TEST_CASE(test_path_codec_encoded_equals_plain) {
    ASSERT_TRUE(PathCodec::same_path("file:///Media/A%20B.MKV", "/media/a b.mkv"));
    ASSERT_FALSE(PathCodec::same_path("/media/a.mkv", "/media/b.mkv"));
}

// ---- ContentHasher ----

TEST_CASE(test_content_hasher_sha256_known_vector) {
    ASSERT_EQ(ContentHasher::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE(test_content_hasher_short_hex) {
    ASSERT_EQ(ContentHasher::short_hex("abc"), "ba7816bf");
    ASSERT_EQ(ContentHasher::short_hex("abc", 4), "ba78");
}

// ---- FuzzyMatch ----

TEST_CASE(test_fuzzy_lcs_length) {
    ASSERT_EQ(FuzzyMatch::lcs_length("kitten", "sitting"), 4u);
    ASSERT_EQ(FuzzyMatch::lcs_length("", "abc"), 0u);
    ASSERT_EQ(FuzzyMatch::lcs_length("same", "same"), 4u);
}

TEST_CASE(test_fuzzy_lcs_counts_code_points) {
    // é is two bytes but one code point
    ASSERT_EQ(FuzzyMatch::lcs_length("caf\xC3\xA9", "cafe"), 3u);
}

TEST_CASE(test_fuzzy_normalize) {
    ASSERT_EQ(FuzzyMatch::normalize("  The Beatles "), "the beatles");
    ASSERT_EQ(FuzzyMatch::normalize("Bj\xC3\xB6rk"), "bjork");
}

TEST_CASE(test_fuzzy_similarity_case_and_diacritics) {
    ASSERT_EQ(FuzzyMatch::similarity("ABBEY ROAD", "abbey road"), 100);
    ASSERT_EQ(FuzzyMatch::similarity("bjork", "Bj\xC3\xB6rk"), 100);
}

TEST_CASE(test_fuzzy_similarity_ratio) {
    // 2 * 7 common / 18
    ASSERT_EQ(FuzzyMatch::similarity("beatles", "The Beatles"), 78);
    // 2 * 4 / 13
    ASSERT_EQ(FuzzyMatch::similarity("kitten", "sitting"), 62);
    ASSERT_EQ(FuzzyMatch::similarity("incepton", "inception"), 94);
    // An article is an ordinary difference
    ASSERT_TRUE(FuzzyMatch::similarity("doors", "The Doors") < 100);
}

TEST_CASE(test_fuzzy_best_match_word_order) {
    ASSERT_EQ(FuzzyMatch::best_match_score("road abbey", "Abbey Road"), 95);
    ASSERT_TRUE(FuzzyMatch::similarity("road abbey", "Abbey Road") < 60);
}

TEST_CASE(test_fuzzy_partial_similarity) {
    ASSERT_EQ(FuzzyMatch::partial_similarity("inception", "Inception (2010) 1080p BluRay"), 100);
    ASSERT_EQ(FuzzyMatch::partial_similarity("Inception (2010) 1080p BluRay", "inception"), 100);
    ASSERT_EQ(FuzzyMatch::partial_similarity("", "x"), 0);
}

TEST_CASE(test_fuzzy_best_match_long_titles) {
    // Short query inside a long title: partial alignment scaled by 0.9
    ASSERT_EQ(FuzzyMatch::best_match_score("inception", "Inception (2010) 1080p BluRay"), 90);
    ASSERT_EQ(FuzzyMatch::best_match_score("dark side of the moon", "Pink Floyd - The Dark Side of the Moon"), 90);
    ASSERT_TRUE(FuzzyMatch::similarity("inception", "Inception (2010) 1080p BluRay") < 60);
    // Nothing shared stays low
    ASSERT_TRUE(FuzzyMatch::best_match_score("xyz123", "Inception (2010) 1080p BluRay") < 60);
    ASSERT_EQ(FuzzyMatch::best_match_score("", "Inception"), 0);
}

TEST_CASE(test_fuzzy_sort_words) {
    ASSERT_EQ(FuzzyMatch::sort_words("  zeta  alpha mid "), "alpha mid zeta");
}

// ---- DirectoryScanner ----

TEST_CASE(test_directory_scanner_filters_extensions) {
    TempDir dir;
    dir.write("a/one.MKV", "x");
    dir.write("a/b/two.mp4", "x");
    dir.write("a/b/notes.txt", "x");
    dir.write("three.mkv", "x");

    auto result = DirectoryScanner::scan_directory(dir.path(), {".mkv"});
    ASSERT_TRUE(result.root_readable);
    ASSERT_EQ(result.files.size(), 2u);
    for (const auto& f : result.files) {
        ASSERT_TRUE(std::filesystem::path(f).is_absolute());
    }
}

TEST_CASE(test_directory_scanner_empty_set_accepts_all) {
    TempDir dir;
    dir.write("x.txt", "x");
    dir.write("sub/y.bin", "x");
    auto result = DirectoryScanner::scan_directory(dir.path(), {});
    ASSERT_EQ(result.files.size(), 2u);
}

TEST_CASE(test_directory_scanner_missing_root) {
    TempDir dir;
    auto result = DirectoryScanner::scan_directory(dir / "does-not-exist", {".mkv"});
    ASSERT_FALSE(result.root_readable);
    ASSERT_TRUE(result.files.empty());
}

TEST_CASE(test_directory_scanner_has_extension) {
    ASSERT_TRUE(DirectoryScanner::has_extension("Song.AIFF", {".aiff"}));
    ASSERT_FALSE(DirectoryScanner::has_extension("aiff", {".aiff"}));
    ASSERT_FALSE(DirectoryScanner::has_extension(".aiff", {".aiff"}));
}

// ---- Platform ----

TEST_CASE(test_platform_classify) {
    using reel::model::MediaType;
    ASSERT_TRUE(Platform::classify("/a/b.MKV") == MediaType::Video);
    ASSERT_TRUE(Platform::classify("/a/b.aif") == MediaType::Audio);
    ASSERT_TRUE(Platform::classify("/a/b.pdf") == MediaType::Document);
    ASSERT_TRUE(Platform::classify("/a/b.txt") == MediaType::Unknown);
    ASSERT_TRUE(Platform::classify("/a/b") == MediaType::Unknown);
}

TEST_CASE(test_platform_media_format) {
    ASSERT_EQ(Platform::get_media_format("/a/Song.aiff"), "AIFF");
    ASSERT_EQ(Platform::get_media_format("/a/noext"), "");
}

// ---- Subprocess ----

TEST_CASE(test_subprocess_run_exit_code) {
    ASSERT_EQ(Subprocess::run({"sh", "-c", "exit 3"}, std::chrono::seconds(5)), std::optional<int>(3));
    ASSERT_EQ(Subprocess::run({"true"}, std::chrono::seconds(5)), std::optional<int>(0));
}

TEST_CASE(test_subprocess_run_timeout_kills) {
    auto start = std::chrono::steady_clock::now();
    auto code = Subprocess::run({"sleep", "10"}, std::chrono::milliseconds(200));
    ASSERT_FALSE(code.has_value());
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE(test_subprocess_spawn_missing_program_throws) {
    ASSERT_THROWS(Subprocess::spawn({"reel-no-such-program-xyz"}), std::system_error);
}

TEST_CASE(test_subprocess_terminate) {
    auto child = Subprocess::spawn({"sleep", "30"});
    ASSERT_TRUE(child->is_running());
    child->terminate();
    ASSERT_FALSE(child->is_running());
}

int main() {
    return reel::test::TestRunner::instance().run_all();
}
