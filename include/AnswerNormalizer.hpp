#pragma once
#include <string>

namespace answer {
    // Lower-case, strip punctuation and symbols, collapse and trim whitespace.
    // Input is UTF-8 and is handled per code point, not per byte.
    std::string normalize(const std::string& text);
}
