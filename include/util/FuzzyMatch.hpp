#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unicode/umachine.h>

namespace reel::util {

/**
 * Edit similarity on a 0-100 scale.
 *
 * Both sides are normalized first: diacritics folded to ASCII, lower-cased
 * and trimmed. similarity() is the insert/delete ratio 2 * LCS / (|a| + |b|)
 * counted in code points, so "beatles" against "The Beatles" scores 78.
 */
class FuzzyMatch {
public:
    [[nodiscard]] static std::string normalize(const std::string& text);

    // Longest common subsequence over code points, no normalization
    [[nodiscard]] static size_t lcs_length(const std::string& a, const std::string& b);

    [[nodiscard]] static int similarity(const std::string& a, const std::string& b);

    /**
     * Weighted best-match score for picking one title:
     *   - similarity() of the whole strings
     *   - 0.95 x similarity of the word-sorted forms ("road abbey")
     *   - when one side is 1.5x longer or more, the best alignment of the
     *     shorter side against windows of the longer, scaled by 0.9
     *     (0.6 past 8x), so "inception" finds "Inception (2010) 1080p"
     */
    [[nodiscard]] static int best_match_score(const std::string& query, const std::string& title);

    // Best similarity of the shorter string against same-length windows of the longer
    [[nodiscard]] static int partial_similarity(const std::string& a, const std::string& b);

    // Whitespace-separated words, sorted and joined by single spaces
    [[nodiscard]] static std::string sort_words(const std::string& text);

private:
    using CodePoints = std::vector<UChar32>;

    static CodePoints code_points(const std::string& text);
    static size_t lcs(const UChar32* a, size_t a_len, const UChar32* b, size_t b_len);
    static double ratio(const CodePoints& a, const CodePoints& b);
    static double partial_ratio(const CodePoints& a, const CodePoints& b);
};

}  // namespace reel::util
