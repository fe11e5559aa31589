/**
 * @file CrowdPulseApp.cpp
 * @brief Implementation of the CrowdPulseApp class.
 */

#include "app/CrowdPulseApp.hpp"
#include "application/SummaryJson.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DatasetLoader.hpp"
#include "infrastructure/ObservationIndex.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace crowdpulse::app {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

int ParseIntArg(const std::string& value, const char* name) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw UsageError(std::string("Invalid ") + name + ": " + value);
    }
}

} // namespace

std::vector<domain::ConversationTurn> LoadHistory(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw infrastructure::ConfigError("Cannot open history file " + path);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw infrastructure::ConfigError("Error reading " + path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw domain::ValidationError("History must be a JSON array");
    }

    std::vector<domain::ConversationTurn> history;
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("role") || !item["role"].is_string() ||
            !item.contains("content") || !item["content"].is_string()) {
            throw domain::ValidationError("History entries need string 'role' and 'content'");
        }
        auto role = domain::ChatMessage::RoleFromString(item["role"].get<std::string>());
        if (!role) {
            throw domain::ValidationError("Unknown history role: " + item["role"].get<std::string>());
        }

        domain::ConversationTurn turn;
        turn.role = *role;
        turn.content = item["content"].get<std::string>();
        if (item.contains("timestamp") && item["timestamp"].is_number_integer()) {
            turn.timestampMs = item["timestamp"].get<long long>();
        }
        history.push_back(std::move(turn));
    }
    return history;
}

int CrowdPulseApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath = "settings.json";
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    try {
        if (!Init(configPath)) {
            return kExitFailure;
        }
        return Dispatch(args);
    } catch (const UsageError& e) {
        std::cerr << "[CrowdPulseApp] " << e.what() << std::endl;
        PrintUsage();
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "[CrowdPulseApp] Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

bool CrowdPulseApp::Init(const std::string& configPath) {
    m_config = infrastructure::ConfigLoader::Load(configPath);

    auto loaded = infrastructure::DatasetLoader::LoadFile(m_config.dataPath);
    auto index = std::make_shared<infrastructure::ObservationIndex>(std::move(loaded.rows));
    std::cout << "[CrowdPulseApp] Dataset ready: " << index->rowCount() << " rows in "
              << index->keyCount() << " partitions" << std::endl;

    infrastructure::OllamaClient client(m_config.ollamaHost, m_config.ollamaPort,
                                        m_config.chatTimeoutSeconds, m_config.probeTimeoutSeconds);
    auto engine = std::make_shared<infrastructure::OllamaAdapter>(
        std::move(client), infrastructure::ParseReplyShape(m_config.replyShape));
    std::cout << "[CrowdPulseApp] Inference engine " << engine->endpoint()
              << " with model " << m_config.ollamaModel << std::endl;

    m_services = application::BuildAppServices(std::move(index), std::move(engine), m_config.ollamaModel);
    return true;
}

int CrowdPulseApp::Dispatch(const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "health") {
        return CmdHealth();
    }

    if (args.size() < 4) {
        throw UsageError("Command '" + command + "' needs <month> <hour> <day_type>");
    }
    auto key = domain::FilterKey::Make(ParseIntArg(args[1], "month"), ParseIntArg(args[2], "hour"), args[3]);

    if (command == "summary") return CmdSummary(key);
    if (command == "export") return CmdExport(key);
    if (command == "prompt") return CmdPrompt(key);
    if (command == "chat") {
        if (args.size() < 5) {
            throw UsageError("chat needs a message");
        }
        return CmdChat(key, args[4], args.size() >= 6 ? args[5] : "");
    }
    throw UsageError("Unknown command: " + command);
}

int CrowdPulseApp::CmdSummary(const domain::FilterKey& key) {
    auto summary = m_services.aggregationEngine->aggregate(key);
    std::cout << application::SummaryToJson(summary).dump(2) << std::endl;
    return kExitOk;
}

int CrowdPulseApp::CmdExport(const domain::FilterKey& key) {
    auto snapshot = m_services.contextInspector->inspect(key);
    std::cout << snapshot.toJson().dump(2) << std::endl;
    return kExitOk;
}

int CrowdPulseApp::CmdPrompt(const domain::FilterKey& key) {
    auto summary = m_services.aggregationEngine->aggregate(key);
    std::cout << m_services.promptBuilder->build(summary, key) << std::endl;
    return kExitOk;
}

int CrowdPulseApp::CmdChat(const domain::FilterKey& key, const std::string& message, const std::string& historyPath) {
    application::ChatRequest request;
    request.message = message;
    request.context = key;
    if (!historyPath.empty()) {
        request.history = LoadHistory(historyPath);
    }

    auto outcome = m_services.chatGateway->send(request);
    if (const auto* failure = std::get_if<application::Failure>(&outcome)) {
        nlohmann::ordered_json j = {
            {"error", application::FailureKindToString(failure->kind)},
            {"detail", failure->cause}
        };
        std::cout << j.dump(2) << std::endl;
        return kExitFailure;
    }

    const auto& response = std::get<application::ChatResponse>(outcome);
    nlohmann::ordered_json j = {
        {"response", response.response},
        {"timestamp", response.timestampMs},
        {"model", response.model},
        {"tokens_used", response.tokensUsed}
    };
    std::cout << j.dump(2) << std::endl;
    return kExitOk;
}

int CrowdPulseApp::CmdHealth() {
    auto report = m_services.healthProbe->probeHealth();
    std::cout << report.toJson().dump(2) << std::endl;
    return report.status == application::EngineStatus::Connected ? kExitOk : kExitFailure;
}

void CrowdPulseApp::PrintUsage() {
    std::cerr << "Usage: crowdpulse [--config settings.json] <command>\n"
              << "  summary <month> <hour> <day_type>\n"
              << "  export  <month> <hour> <day_type>\n"
              << "  prompt  <month> <hour> <day_type>\n"
              << "  chat    <month> <hour> <day_type> <message> [history.json]\n"
              << "  health\n"
              << "day_type: 平日 | 假日 | weekday | weekend" << std::endl;
}

} // namespace crowdpulse::app
