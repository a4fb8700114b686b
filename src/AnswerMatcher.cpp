#include "AnswerMatcher.hpp"

bool answer::isCorrect(const std::string& normalized_submission, const std::set<std::string>& accepted_answers) {
    if (normalized_submission.empty()) return false;
    return accepted_answers.count(normalized_submission) > 0;
}
