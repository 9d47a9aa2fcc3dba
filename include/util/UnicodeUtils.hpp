#pragma once

#include <memory>
#include <string>
#include <unicode/translit.h>
#include <unicode/unistr.h>

namespace lyricflow::util {

/// Normalize text for matching provider results against local metadata.
/// Transliterates diacritics to ASCII equivalents (Björk → bjork, José → jose),
/// lowercases, and trims surrounding whitespace. CJK text passes through unchanged
/// apart from case folding.
inline std::string normalize_for_match(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // NFD splits ö into o + combining diaeresis, the mark is dropped, Latin-ASCII folds the rest
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> trans(
        icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        )
    );

    if (U_SUCCESS(status) && trans) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.toLower().trim().toUTF8String(result);
    return result;
}

}  // namespace lyricflow::util
