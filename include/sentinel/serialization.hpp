#pragma once

#include "metrics.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

namespace sentinel {

void to_json(nlohmann::json& j, const Position& position);
void to_json(nlohmann::json& j, const Candidate& candidate);
void from_json(const nlohmann::json& j, Candidate& candidate);
void to_json(nlohmann::json& j, const AccountCycleResult& slot);
void to_json(nlohmann::json& j, const CycleResult& cycle);
void to_json(nlohmann::json& j, const OrderRecord& order);
void to_json(nlohmann::json& j, const BreakerEvent& event);
void to_json(nlohmann::json& j, const BacktestReport& report);
void to_json(nlohmann::json& j, const DailyAccountSummary& summary);
void to_json(nlohmann::json& j, const DailyReport& report);
void to_json(nlohmann::json& j, const AccountMetrics& metrics);
void to_json(nlohmann::json& j, const MetricsSnapshot& snapshot);
void to_json(nlohmann::json& j, const HealthReport& report);

} // namespace sentinel
