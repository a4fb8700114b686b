#include "AnswerNormalizer.hpp"
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace {

// Letters, numbers and '_' make up words; everything else but whitespace goes.
bool isWordChar(UChar32 c) {
    return c == '_' || u_isalpha(c) || (U_GET_GC_MASK(c) & U_GC_N_MASK) != 0;
}

} // namespace

/**
 * @brief Folds a chat answer to the form accepted answers are stored in.
 *
 * Works on code points: "ÉGYPTE" and "égypte" compare equal, and curly
 * quotes or guillemets are dropped like their ASCII counterparts.
 * Malformed UTF-8 decodes to U+FFFD, which is a symbol and is dropped.
 */
std::string answer::normalize(const std::string& text) {
    icu::UnicodeString lowered = icu::UnicodeString::fromUTF8(text);
    lowered.toLower(icu::Locale::getRoot());

    icu::UnicodeString folded;
    bool pending_space = false;
    for (int32_t i = 0; i < lowered.length(); i = lowered.moveIndex32(i, 1)) {
        UChar32 c = lowered.char32At(i);

        if (u_isspace(c)) {
            pending_space = !folded.isEmpty(); // leading whitespace is dropped
            continue;
        }
        if (!isWordChar(c)) continue;

        if (pending_space) {
            folded.append(static_cast<UChar>(' '));
            pending_space = false;
        }
        folded.append(c);
    }

    std::string result;
    folded.toUTF8String(result);
    return result;
}
