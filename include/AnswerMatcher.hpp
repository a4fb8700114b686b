#pragma once
#include <string>
#include <set>

namespace answer {
    // Exact membership only, no fuzzy or substring matching.
    bool isCorrect(const std::string& normalized_submission, const std::set<std::string>& accepted_answers);
}
