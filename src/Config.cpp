#include "Config.hpp"
#include <fstream>
#include <iostream>

namespace {

bool readSeconds(const json& obj, const char* key, double& out, bool allow_zero) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_number()) {
        std::cerr << "Config: '" << key << "' must be a number" << std::endl;
        return false;
    }
    double value = v.get<double>();
    if (value < 0.0 || (!allow_zero && value == 0.0)) {
        std::cerr << "Config: '" << key << "' out of range: " << value << std::endl;
        return false;
    }
    out = value;
    return true;
}

bool readString(const json& obj, const char* key, std::string& out) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_string()) {
        std::cerr << "Config: '" << key << "' must be a string" << std::endl;
        return false;
    }
    out = v.get<std::string>();
    return true;
}

} // namespace

bool applyConfig(const json& j, AppConfig& config) {
    if (!j.is_object()) {
        std::cerr << "Config: top level must be an object" << std::endl;
        return false;
    }
    bool ok = true;

    if (j.contains("port")) {
        const json& v = j.at("port");
        if (v.is_number_integer() && v.get<int>() > 0 && v.get<int>() <= 65535) {
            config.port = v.get<int>();
        } else {
            std::cerr << "Config: 'port' must be an integer in 1..65535" << std::endl;
            ok = false;
        }
    }

    ok = readString(j, "questions_path", config.questions_path) && ok;
    ok = readString(j, "leaderboard_csv", config.leaderboard_csv) && ok;
    ok = readString(j, "leaderboard_json", config.leaderboard_json) && ok;
    ok = readString(j, "bot_name", config.bot_name) && ok;
    ok = readString(j, "operator_name", config.operator_name) && ok;
    ok = readSeconds(j, "auto_start_delay_seconds", config.auto_start_delay_seconds, true) && ok;

    if (j.contains("game")) {
        const json& game = j.at("game");
        if (!game.is_object()) {
            std::cerr << "Config: 'game' must be an object" << std::endl;
            return false;
        }
        PhaseDurations& d = config.game.durations;
        ok = readSeconds(game, "open_duration_seconds", d.open_seconds, false) && ok;
        ok = readSeconds(game, "reveal_delay_seconds", d.reveal_delay_seconds, true) && ok;
        ok = readSeconds(game, "advance_delay_seconds", d.advance_delay_seconds, true) && ok;

        if (game.contains("max_winners_per_round")) {
            const json& v = game.at("max_winners_per_round");
            if (v.is_number_integer() && v.get<long long>() >= 1) {
                config.game.max_winners_per_round = v.get<std::size_t>();
            } else {
                std::cerr << "Config: 'max_winners_per_round' must be a positive integer" << std::endl;
                ok = false;
            }
        }
    }
    return ok;
}

/**
 * @brief Reads a JSON config file and overlays it on `config`.
 */
bool loadConfig(const std::string& filename, AppConfig& config) {
    std::ifstream f(filename);
    if (!f.is_open()) {
        std::cerr << "Config: cannot open " << filename << std::endl;
        return false;
    }
    try {
        json data = json::parse(f);
        return applyConfig(data, config);
    } catch (json::parse_error& e) {
        std::cerr << "Config: failed to parse " << filename << ": " << e.what() << std::endl;
        return false;
    }
}
