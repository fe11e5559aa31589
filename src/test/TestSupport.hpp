/**
 * @file TestSupport.hpp
 * @brief Row builders and an in-process inference engine for the test executables.
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/Errors.hpp"
#include "domain/InferenceEngine.hpp"
#include "domain/ObservationRow.hpp"

namespace crowdpulse::test {

inline bool Near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

/**
 * @brief Row with 30/50/20 % dwell split, 50/50 gender and 10 % per age bucket.
 */
inline domain::ObservationRow MakeRow(const domain::FilterKey& key, int gx, int gy, double totalUsers) {
    domain::ObservationRow row;
    row.month = key.month;
    row.hour = key.hour;
    row.dayType = key.dayType;
    row.gridX = gx;
    row.gridY = gy;
    row.lat = 25.0 + gx * 0.001;
    row.lng = 121.5 + gy * 0.001;
    row.totalUsers = totalUsers;
    row.usersUnder10Min = totalUsers * 0.3;
    row.users10To30Min = totalUsers * 0.5;
    row.usersOver30Min = totalUsers * 0.2;
    row.sex1 = 50.0;
    row.sex2 = 50.0;
    row.ages.fill(10.0);
    return row;
}

/**
 * @class FakeInferenceEngine
 * @brief Records every call and answers with a canned reply or a canned failure.
 */
class FakeInferenceEngine : public domain::InferenceEngine {
public:
    std::vector<std::string> models = {"qwen2.5:7b"};
    bool manifestFails = false;
    bool chatFails = false;
    bool chatThrowsForeign = false;
    domain::EngineReply reply = domain::StructuredReply{"fake answer", "qwen2.5:7b", 12, 30};

    int listCalls = 0;
    int chatCalls = 0;
    std::string lastModel;
    std::vector<domain::ChatMessage> lastMessages;

    std::vector<std::string> listModels() override {
        ++listCalls;
        if (manifestFails) {
            throw domain::InferenceError("connection refused");
        }
        return models;
    }

    domain::EngineReply chat(const std::string& model, const std::vector<domain::ChatMessage>& messages) override {
        ++chatCalls;
        lastModel = model;
        lastMessages = messages;
        if (chatFails) {
            throw domain::InferenceError("Cannot reach Ollama at " + endpoint() + ": connection refused");
        }
        if (chatThrowsForeign) {
            throw std::runtime_error("socket closed");
        }
        return reply;
    }

    std::string endpoint() const override { return "http://fake-engine:11434"; }
};

} // namespace crowdpulse::test
