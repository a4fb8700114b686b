#pragma once
#include <istream>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "TriviaTypes.hpp"

using json = nlohmann::json;

namespace question_bank {
    // Picks the format from the extension (.json, otherwise CSV).
    // Errors are logged and give an empty list.
    std::vector<Question> loadQuestions(const std::string& filename);

    // CSV with a header row naming "question" and "answers" columns.
    std::vector<Question> parseCsv(std::istream& in);

    // [{"question": "...", "answers": ["a", "b"] or "a|b"}, ...]
    std::vector<Question> parseJson(const json& data);

    // "Paris|paris| " -> {"paris"}
    std::set<std::string> splitAnswers(const std::string& raw);
}
