#include "util/FuzzyMatch.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unicode/unistr.h>

namespace reel::util {

namespace {

constexpr double TOKEN_SORT_WEIGHT = 0.95;
constexpr double PARTIAL_WEIGHT = 0.9;
constexpr double PARTIAL_WEIGHT_FAR = 0.6;
constexpr double PARTIAL_LENGTH_RATIO = 1.5;
constexpr double FAR_LENGTH_RATIO = 8.0;

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

int to_score(double value) {
    return std::clamp(static_cast<int>(std::lround(value)), 0, 100);
}

}  // namespace

std::string FuzzyMatch::normalize(const std::string& text) {
    return trim(normalize_for_search(text));
}

FuzzyMatch::CodePoints FuzzyMatch::code_points(const std::string& text) {
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    CodePoints result;
    result.reserve(static_cast<size_t>(unicode_text.length()));
    for (int32_t i = 0; i < unicode_text.length(); i = unicode_text.moveIndex32(i, 1)) {
        result.push_back(unicode_text.char32At(i));
    }
    return result;
}

size_t FuzzyMatch::lcs(const UChar32* a, size_t a_len, const UChar32* b, size_t b_len) {
    if (a_len == 0 || b_len == 0) return 0;

    // Two rolling rows of the LCS table
    std::vector<size_t> previous(b_len + 1, 0);
    std::vector<size_t> current(b_len + 1, 0);
    for (size_t i = 1; i <= a_len; ++i) {
        current[0] = 0;
        for (size_t j = 1; j <= b_len; ++j) {
            current[j] = a[i - 1] == b[j - 1]
                ? previous[j - 1] + 1
                : std::max(previous[j], current[j - 1]);
        }
        std::swap(previous, current);
    }
    return previous[b_len];
}

size_t FuzzyMatch::lcs_length(const std::string& a, const std::string& b) {
    auto s1 = code_points(a);
    auto s2 = code_points(b);
    return lcs(s1.data(), s1.size(), s2.data(), s2.size());
}

double FuzzyMatch::ratio(const CodePoints& a, const CodePoints& b) {
    size_t total = a.size() + b.size();
    if (total == 0) return 100.0;
    return 200.0 * static_cast<double>(lcs(a.data(), a.size(), b.data(), b.size())) / static_cast<double>(total);
}

double FuzzyMatch::partial_ratio(const CodePoints& a, const CodePoints& b) {
    const CodePoints& shorter = a.size() <= b.size() ? a : b;
    const CodePoints& longer = a.size() <= b.size() ? b : a;
    if (shorter.empty()) return longer.empty() ? 100.0 : 0.0;

    const size_t window = shorter.size();
    double best = 0.0;
    for (size_t start = 0; start + window <= longer.size(); ++start) {
        size_t common = lcs(shorter.data(), window, longer.data() + start, window);
        best = std::max(best, 100.0 * static_cast<double>(common) / static_cast<double>(window));
        if (common == window) break;
    }
    return best;
}

int FuzzyMatch::similarity(const std::string& a, const std::string& b) {
    return to_score(ratio(code_points(normalize(a)), code_points(normalize(b))));
}

int FuzzyMatch::partial_similarity(const std::string& a, const std::string& b) {
    return to_score(partial_ratio(code_points(normalize(a)), code_points(normalize(b))));
}

int FuzzyMatch::best_match_score(const std::string& query, const std::string& title) {
    std::string q = normalize(query);
    std::string t = normalize(title);
    auto q_points = code_points(q);
    auto t_points = code_points(t);
    if (q_points.empty() || t_points.empty()) return 0;

    double direct = ratio(q_points, t_points);
    auto q_sorted = code_points(sort_words(q));
    auto t_sorted = code_points(sort_words(t));

    double length_ratio = static_cast<double>(std::max(q_points.size(), t_points.size())) /
                          static_cast<double>(std::min(q_points.size(), t_points.size()));
    if (length_ratio < PARTIAL_LENGTH_RATIO) {
        return to_score(std::max(direct, TOKEN_SORT_WEIGHT * ratio(q_sorted, t_sorted)));
    }

    double scale = length_ratio > FAR_LENGTH_RATIO ? PARTIAL_WEIGHT_FAR : PARTIAL_WEIGHT;
    double partial = scale * partial_ratio(q_points, t_points);
    double partial_sorted = TOKEN_SORT_WEIGHT * scale * partial_ratio(q_sorted, t_sorted);
    return to_score(std::max({direct, partial, partial_sorted}));
}

std::string FuzzyMatch::sort_words(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    std::sort(words.begin(), words.end());

    std::string result;
    for (const auto& w : words) {
        if (!result.empty()) result += ' ';
        result += w;
    }
    return result;
}

}  // namespace reel::util
