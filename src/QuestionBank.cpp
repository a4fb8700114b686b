#include "QuestionBank.hpp"
#include "AnswerNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// One CSV record; quoted fields may span lines. False at end of input.
bool readCsvRecord(std::istream& in, std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool in_quotes = false;
    bool any = false;
    char c;

    while (in.get(c)) {
        any = true;
        if (in_quotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get(c);
                    field.push_back('"');
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r') {
            // CRLF line endings
        } else if (c == '\n') {
            fields.push_back(field);
            return true;
        } else {
            field.push_back(c);
        }
    }
    if (!any) return false;
    fields.push_back(field);
    return true;
}

} // namespace

std::set<std::string> question_bank::splitAnswers(const std::string& raw) {
    std::set<std::string> answers;
    std::size_t start = 0;
    while (start <= raw.size()) {
        std::size_t bar = raw.find('|', start);
        if (bar == std::string::npos) bar = raw.size();
        std::string normalized = answer::normalize(raw.substr(start, bar - start));
        if (!normalized.empty()) {
            answers.insert(normalized);
        }
        start = bar + 1;
    }
    return answers;
}

std::vector<Question> question_bank::parseCsv(std::istream& in) {
    std::vector<Question> questions;
    std::vector<std::string> fields;

    if (!readCsvRecord(in, fields)) {
        std::cerr << "QuestionBank: empty CSV" << std::endl;
        return questions;
    }

    int question_col = -1;
    int answers_col = -1;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        std::string name = lower(trim(fields[i]));
        if (i == 0 && name.size() >= 3 && name.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            name = name.substr(3); // UTF-8 BOM
        }
        if (name == "question") question_col = static_cast<int>(i);
        if (name == "answers") answers_col = static_cast<int>(i);
    }
    if (question_col < 0 || answers_col < 0) {
        std::cerr << "QuestionBank: CSV header must contain 'question' and 'answers'" << std::endl;
        return questions;
    }

    int line = 1;
    while (readCsvRecord(in, fields)) {
        ++line;
        if (fields.size() == 1 && trim(fields[0]).empty()) continue; // blank line

        std::size_t needed = static_cast<std::size_t>(std::max(question_col, answers_col)) + 1;
        if (fields.size() < needed) fields.resize(needed);

        Question q;
        q.text = trim(fields[question_col]);
        if (q.text.empty()) {
            std::cerr << "QuestionBank: record " << line << " has no question, skipped" << std::endl;
            continue;
        }
        q.accepted_answers = splitAnswers(fields[answers_col]);
        if (q.accepted_answers.empty()) {
            std::cerr << "QuestionBank: '" << q.text << "' has no accepted answers" << std::endl;
        }
        questions.push_back(q);
    }
    return questions;
}

std::vector<Question> question_bank::parseJson(const json& data) {
    std::vector<Question> questions;
    if (!data.is_array()) {
        std::cerr << "QuestionBank: JSON question file must be an array" << std::endl;
        return questions;
    }

    for (const auto& item : data) {
        try {
            Question q;
            q.text = trim(item.at("question").get<std::string>());
            if (q.text.empty()) continue;

            const json& answers = item.at("answers");
            if (answers.is_string()) {
                q.accepted_answers = splitAnswers(answers.get<std::string>());
            } else {
                for (const auto& a : answers) {
                    std::string normalized = answer::normalize(a.get<std::string>());
                    if (!normalized.empty()) q.accepted_answers.insert(normalized);
                }
            }
            if (q.accepted_answers.empty()) {
                std::cerr << "QuestionBank: '" << q.text << "' has no accepted answers" << std::endl;
            }
            questions.push_back(q);
        } catch (json::exception& e) {
            std::cerr << "QuestionBank: skipping malformed entry: " << e.what() << std::endl;
        }
    }
    return questions;
}

/**
 * @brief Loads the question file, choosing CSV or JSON by extension.
 */
std::vector<Question> question_bank::loadQuestions(const std::string& filename) {
    std::ifstream f(filename);
    if (!f.is_open()) {
        std::cerr << "QuestionBank: cannot open question file: " << filename << std::endl;
        return {};
    }

    std::vector<Question> questions;
    bool is_json = filename.size() >= 5 && lower(filename.substr(filename.size() - 5)) == ".json";
    if (is_json) {
        try {
            questions = parseJson(json::parse(f));
        } catch (json::parse_error& e) {
            std::cerr << "QuestionBank: failed to parse questions file: " << e.what() << std::endl;
            return {};
        }
    } else {
        questions = parseCsv(f);
    }

    std::cout << "QuestionBank loaded " << questions.size() << " questions from " << filename << std::endl;
    return questions;
}
