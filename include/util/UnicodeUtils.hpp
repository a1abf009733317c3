#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>
#include <unicode/normlzr.h>

namespace reel::util {

/// Normalize text for Unicode-aware case-insensitive matching
/// Transliterates diacritics to ASCII equivalents (Björk → bjork, José → jose)
/// and converts to lowercase
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // NFD splits ö into o + combining diaeresis, the marks are removed,
    // NFC recomposes and Latin-ASCII folds what is left to plain ASCII.
    // One transliterator per thread: creation is far more expensive than use
    // and the library scores every entry of a refresh through here.
    thread_local UErrorCode status = U_ZERO_ERROR;
    thread_local std::unique_ptr<icu::Transliterator> trans(
        icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        )
    );

    if (U_FAILURE(status) || !trans) {
        // Fallback: just lowercase without transliteration
        std::string result;
        unicode_text.toLower().toUTF8String(result);
        return result;
    }

    trans->transliterate(unicode_text);

    std::string result;
    unicode_text.toLower().toUTF8String(result);
    return result;
}

/// Full Unicode case folding, used for equality keys (paths, titles)
/// Unlike normalize_for_search this keeps diacritics: "café" and "cafe" stay distinct
inline std::string fold_case(const std::string& text) {
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    unicode_text.foldCase();

    std::string result;
    unicode_text.toUTF8String(result);
    return result;
}

/// Case-insensitive string comparison using ICU
/// Returns: <0 if a < b, 0 if a == b, >0 if a > b (like strcmp)
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    ua.foldCase();
    ub.foldCase();

    return ua.compare(ub);
}

} // namespace reel::util
