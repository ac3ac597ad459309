#pragma once

#include "clock.hpp"
#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sentinel {

struct TradingConfig {
    double max_total_exposure = 0.75;
    double stop_loss_pct = 0.05;
    double take_profit_pct = 0.10;
    int max_day_trades = 3;
    int max_trades_per_cycle = 2;
    double min_order_quantity = 1.0;
};

struct RiskManagementConfig {
    double max_daily_loss = 0.03;
    bool kelly_enabled = true;
    bool account_isolation = true;
};

struct EmergencyConfig {
    int max_consecutive_losses = 5;
    double daily_loss_limit = 0.03;
    bool circuit_breaker_enabled = true;
    int max_failed_cycles = 3;
    bool liquidate_on_emergency_stop = true;
};

struct SchedulerConfig {
    std::chrono::seconds trading_interval{300};
    std::chrono::seconds backtest_interval{1800};
    std::chrono::seconds cycle_budget{120};
    std::chrono::milliseconds adapter_timeout{10000};
    int retry_max_attempts = 3;
    std::chrono::milliseconds retry_initial_backoff{250};
    std::chrono::milliseconds retry_max_backoff{4000};
    std::size_t backtest_top_n = 5;
    std::vector<std::string> backtest_strategies{"PPO", "V9B_MOMENTUM", "MEAN_REVERSION"};
};

struct MonitoringConfig {
    std::chrono::seconds health_check_interval{60};
    std::chrono::seconds notification_cooldown{900};
    bool enable_http_endpoint = true;
    std::string http_host = "0.0.0.0";
    int http_port = 8080;
    std::size_t metrics_window = 256;
};

struct MarketSessionConfig {
    int open_minute = 9 * 60 + 30;
    int close_minute = 16 * 60;
    int utc_offset_std = -5;
    bool observe_us_dst = true;
    std::vector<CivilDate> holidays;
    std::map<CivilDate, int> early_closes;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    std::size_t max_file_size_mb = 10;
    std::size_t max_files = 5;
};

struct StrategyConfig {
    double min_score = 70.0;
    double min_confidence = 8.0;
    double exit_score = 60.0;
};

struct AccountConfig {
    std::string id;
    double starting_equity = 0.0;
    double max_position_size = 0.15;
    bool aggressive_sizing_enabled = false;
    double risk_multiplier = 1.0;
    std::optional<double> daily_loss_limit;
    std::string api_key_env;
    std::string api_secret_env;
};

// Validated, immutable process configuration. Loaded once at startup.
struct Config {
    TradingConfig trading;
    RiskManagementConfig risk_management;
    EmergencyConfig emergency;
    SchedulerConfig scheduler;
    MonitoringConfig monitoring;
    MarketSessionConfig market_session;
    LoggingConfig logging;
    StrategyConfig strategy;
    std::vector<AccountConfig> accounts;
};

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

// Throws ConfigError on unreadable files, unknown keys, missing required
// keys, wrong types or out-of-range values.
Config load_config(const std::string& path);
Config parse_config(const nlohmann::json& root);
void validate_config(const Config& config);

// Reads each account's credential environment variables. Throws ConfigError
// when any is unset or empty.
std::map<std::string, Credentials> resolve_credentials(const Config& config);

RiskLimits limits_for(const Config& config, const AccountConfig& account);

// Effective configuration for read-only display. Never contains secrets.
nlohmann::json effective_config(const Config& config);

} // namespace sentinel
