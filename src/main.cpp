#include "Config.hpp"
#include "LeaderboardAggregator.hpp"
#include "LeaderboardExporter.hpp"
#include "QuestionBank.hpp"
#include "RoundManager.hpp"
#include "protocol.hpp"
#include "server.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

#define DEFAULT_CONFIG "../data/config.json"

int main(int argc, char* argv[]) {
    AppConfig config;
    std::string config_path = DEFAULT_CONFIG;
    if (argc > 1) {
        config_path = argv[1];
    }
    if (!loadConfig(config_path, config)) {
        std::cerr << "Using default settings where " << config_path << " did not provide valid ones." << std::endl;
    }
    if (argc > 2) {
        config.port = std::atoi(argv[2]);
    }

    std::vector<Question> questions = question_bank::loadQuestions(config.questions_path);
    if (questions.empty()) {
        std::cerr << "No questions loaded!" << std::endl;
        return 1;
    }

    ChatServer server(config.port, config.bot_name, config.operator_name);
    LeaderboardAggregator leaderboard;
    RoundManager manager(&server, leaderboard, config.game);

    server.setMessageHandler([&manager](const MessageEvent& event) {
        manager.onMessage(event);
    });
    server.setControlHandler([&manager, &questions](const std::string& signal) {
        if (signal == protocol::SIGNAL_START) {
            manager.start(questions);
        } else if (signal == protocol::SIGNAL_STOP) {
            manager.stop();
        } else if (signal == protocol::SIGNAL_REP) {
            manager.reveal();
        } else if (signal == protocol::SIGNAL_NEXT) {
            manager.advance();
        } else {
            std::cerr << "Unknown control signal: " << signal << std::endl;
        }
    });

    if (!server.start()) {
        std::cerr << "Failed to start the server." << std::endl;
        return 1;
    }
    std::thread acceptThread([&server]() {
        try {
            server.run();
        } catch (const std::exception& e) {
            std::cerr << "Server runtime error: " << e.what() << std::endl;
        }
    });

    std::cout << "Loaded " << questions.size() << " questions" << std::endl;
    if (config.operator_name.empty()) {
        std::cout << "Starting trivia game in " << config.auto_start_delay_seconds << "s..." << std::endl;
        std::this_thread::sleep_for(std::chrono::duration<double>(config.auto_start_delay_seconds));
        manager.start(questions);
    } else {
        std::cout << "Waiting for " << config.operator_name << " to send START..." << std::endl;
    }

    manager.waitUntilFinished();

    leaderboard.print(std::cout);
    std::vector<LeaderboardEntry> results = leaderboard.snapshot();
    if (!config.leaderboard_csv.empty()) {
        exporter::saveCsv(results, config.leaderboard_csv, config.game.max_winners_per_round);
    }
    if (!config.leaderboard_json.empty()) {
        exporter::saveJson(leaderboard.toJson(), config.leaderboard_json);
    }
    server.broadcastLeaderboard(leaderboard.toJson());

    server.stop();
    acceptThread.join();
    std::cout << "Bot stopped." << std::endl;
    return 0;
}
