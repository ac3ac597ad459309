#include "sentinel/config.hpp"
#include "sentinel/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <set>

namespace sentinel {

namespace {

using nlohmann::json;

void check_keys(const json& obj, std::initializer_list<const char*> allowed, const std::string& where) {
    if (!obj.is_object()) {
        throw ConfigError(where + " must be an object");
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool known = std::any_of(allowed.begin(), allowed.end(),
                                 [&](const char* key) { return it.key() == key; });
        if (!known) {
            throw ConfigError("unknown key '" + it.key() + "' in " + where);
        }
    }
}

template <typename T>
void read(const json& obj, const char* key, T& out, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    try {
        out = it->template get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

template <typename T>
void require(const json& obj, const char* key, T& out, const std::string& where) {
    if (!obj.contains(key)) {
        throw ConfigError("missing required key " + where + "." + key);
    }
    read(obj, key, out, where);
}

template <typename Duration>
void read_duration(const json& obj, const char* key, Duration& out, const std::string& where) {
    long long count = out.count();
    read(obj, key, count, where);
    out = Duration(count);
}

// Unsigned fields are read signed so a negative value is reported instead
// of wrapping.
void read_count(const json& obj, const char* key, std::size_t& out, const std::string& where) {
    long long count = static_cast<long long>(out);
    read(obj, key, count, where);
    if (count < 0) {
        throw ConfigError(where + "." + key + " must not be negative");
    }
    out = static_cast<std::size_t>(count);
}

int read_time_of_day(const json& obj, const char* key, int fallback, const std::string& where) {
    std::string text;
    read(obj, key, text, where);
    if (text.empty()) {
        return fallback;
    }
    auto minutes = parse_time_of_day(text);
    if (!minutes) {
        throw ConfigError(where + "." + key + ": expected HH:MM, got '" + text + "'");
    }
    return *minutes;
}

CivilDate to_date(const std::string& text, const std::string& where) {
    auto date = parse_date(text);
    if (!date) {
        throw ConfigError(where + ": expected YYYY-MM-DD, got '" + text + "'");
    }
    return *date;
}

std::string format_minutes(int minutes) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

void parse_trading(const json& obj, TradingConfig& cfg) {
    const std::string where = "trading";
    check_keys(obj, {"max_total_exposure", "stop_loss_pct", "take_profit_pct", "max_day_trades",
                     "max_trades_per_cycle", "min_order_quantity"}, where);
    read(obj, "max_total_exposure", cfg.max_total_exposure, where);
    read(obj, "stop_loss_pct", cfg.stop_loss_pct, where);
    read(obj, "take_profit_pct", cfg.take_profit_pct, where);
    read(obj, "max_day_trades", cfg.max_day_trades, where);
    read(obj, "max_trades_per_cycle", cfg.max_trades_per_cycle, where);
    read(obj, "min_order_quantity", cfg.min_order_quantity, where);
}

void parse_risk_management(const json& obj, RiskManagementConfig& cfg) {
    const std::string where = "risk_management";
    check_keys(obj, {"max_daily_loss", "kelly_enabled", "account_isolation"}, where);
    read(obj, "max_daily_loss", cfg.max_daily_loss, where);
    read(obj, "kelly_enabled", cfg.kelly_enabled, where);
    read(obj, "account_isolation", cfg.account_isolation, where);
}

void parse_emergency(const json& obj, EmergencyConfig& cfg) {
    const std::string where = "emergency_conditions";
    check_keys(obj, {"max_consecutive_losses", "daily_loss_limit", "circuit_breaker_enabled",
                     "max_failed_cycles", "liquidate_on_emergency_stop"}, where);
    read(obj, "max_consecutive_losses", cfg.max_consecutive_losses, where);
    read(obj, "daily_loss_limit", cfg.daily_loss_limit, where);
    read(obj, "circuit_breaker_enabled", cfg.circuit_breaker_enabled, where);
    read(obj, "max_failed_cycles", cfg.max_failed_cycles, where);
    read(obj, "liquidate_on_emergency_stop", cfg.liquidate_on_emergency_stop, where);
}

void parse_scheduler(const json& obj, SchedulerConfig& cfg) {
    const std::string where = "scheduler";
    check_keys(obj, {"trading_interval_sec", "backtest_interval_sec", "cycle_budget_sec",
                     "adapter_timeout_ms", "retry_max_attempts", "retry_initial_backoff_ms",
                     "retry_max_backoff_ms", "backtest_top_n", "backtest_strategies"}, where);
    read_duration(obj, "trading_interval_sec", cfg.trading_interval, where);
    read_duration(obj, "backtest_interval_sec", cfg.backtest_interval, where);
    read_duration(obj, "cycle_budget_sec", cfg.cycle_budget, where);
    read_duration(obj, "adapter_timeout_ms", cfg.adapter_timeout, where);
    read(obj, "retry_max_attempts", cfg.retry_max_attempts, where);
    read_duration(obj, "retry_initial_backoff_ms", cfg.retry_initial_backoff, where);
    read_duration(obj, "retry_max_backoff_ms", cfg.retry_max_backoff, where);
    read_count(obj, "backtest_top_n", cfg.backtest_top_n, where);
    read(obj, "backtest_strategies", cfg.backtest_strategies, where);
}

void parse_monitoring(const json& obj, MonitoringConfig& cfg) {
    const std::string where = "monitoring";
    check_keys(obj, {"health_check_interval_sec", "notification_cooldown_sec", "enable_http_endpoint",
                     "http_host", "http_port", "metrics_window"}, where);
    read_duration(obj, "health_check_interval_sec", cfg.health_check_interval, where);
    read_duration(obj, "notification_cooldown_sec", cfg.notification_cooldown, where);
    read(obj, "enable_http_endpoint", cfg.enable_http_endpoint, where);
    read(obj, "http_host", cfg.http_host, where);
    read(obj, "http_port", cfg.http_port, where);
    read_count(obj, "metrics_window", cfg.metrics_window, where);
}

void parse_market_session(const json& obj, MarketSessionConfig& cfg) {
    const std::string where = "market_session";
    check_keys(obj, {"open", "close", "utc_offset_std", "observe_us_dst", "holidays", "early_closes"}, where);
    cfg.open_minute = read_time_of_day(obj, "open", cfg.open_minute, where);
    cfg.close_minute = read_time_of_day(obj, "close", cfg.close_minute, where);
    read(obj, "utc_offset_std", cfg.utc_offset_std, where);
    read(obj, "observe_us_dst", cfg.observe_us_dst, where);

    std::vector<std::string> holidays;
    read(obj, "holidays", holidays, where);
    for (const auto& text : holidays) {
        cfg.holidays.push_back(to_date(text, where + ".holidays"));
    }

    std::map<std::string, std::string> early;
    read(obj, "early_closes", early, where);
    for (const auto& [date_text, time_text] : early) {
        auto minutes = parse_time_of_day(time_text);
        if (!minutes) {
            throw ConfigError(where + ".early_closes." + date_text + ": expected HH:MM");
        }
        cfg.early_closes[to_date(date_text, where + ".early_closes")] = *minutes;
    }
}

void parse_logging(const json& obj, LoggingConfig& cfg) {
    const std::string where = "logging";
    check_keys(obj, {"level", "file", "max_file_size_mb", "max_files"}, where);
    read(obj, "level", cfg.level, where);
    read(obj, "file", cfg.file, where);
    read_count(obj, "max_file_size_mb", cfg.max_file_size_mb, where);
    read_count(obj, "max_files", cfg.max_files, where);
}

void parse_strategy(const json& obj, StrategyConfig& cfg) {
    const std::string where = "strategy";
    check_keys(obj, {"min_score", "min_confidence", "exit_score"}, where);
    read(obj, "min_score", cfg.min_score, where);
    read(obj, "min_confidence", cfg.min_confidence, where);
    read(obj, "exit_score", cfg.exit_score, where);
}

AccountConfig parse_account(const json& obj, std::size_t index) {
    const std::string where = "accounts[" + std::to_string(index) + "]";
    check_keys(obj, {"id", "starting_equity", "max_position_size", "aggressive_sizing_enabled",
                     "risk_multiplier", "daily_loss_limit", "api_key_env", "api_secret_env"}, where);
    AccountConfig account;
    require(obj, "id", account.id, where);
    require(obj, "starting_equity", account.starting_equity, where);
    require(obj, "api_key_env", account.api_key_env, where);
    require(obj, "api_secret_env", account.api_secret_env, where);
    read(obj, "max_position_size", account.max_position_size, where);
    read(obj, "aggressive_sizing_enabled", account.aggressive_sizing_enabled, where);
    read(obj, "risk_multiplier", account.risk_multiplier, where);
    if (obj.contains("daily_loss_limit")) {
        double limit = 0.0;
        read(obj, "daily_loss_limit", limit, where);
        account.daily_loss_limit = limit;
    }
    return account;
}

void check_fraction(double value, const std::string& name) {
    if (!(value > 0.0 && value <= 1.0)) {
        throw ConfigError(name + " must be in (0, 1], got " + std::to_string(value));
    }
}

void check_positive(long long value, const std::string& name) {
    if (value <= 0) {
        throw ConfigError(name + " must be positive");
    }
}

} // namespace

Config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }
    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        throw ConfigError("malformed JSON in " + path + ": " + e.what());
    }
    return parse_config(root);
}

Config parse_config(const json& root) {
    check_keys(root, {"trading", "risk_management", "emergency_conditions", "scheduler", "monitoring",
                      "market_session", "logging", "strategy", "accounts"}, "root");
    Config config;
    if (root.contains("trading")) parse_trading(root.at("trading"), config.trading);
    if (root.contains("risk_management")) parse_risk_management(root.at("risk_management"), config.risk_management);
    if (root.contains("emergency_conditions")) parse_emergency(root.at("emergency_conditions"), config.emergency);
    if (root.contains("scheduler")) parse_scheduler(root.at("scheduler"), config.scheduler);
    if (root.contains("monitoring")) parse_monitoring(root.at("monitoring"), config.monitoring);
    if (root.contains("market_session")) parse_market_session(root.at("market_session"), config.market_session);
    if (root.contains("logging")) parse_logging(root.at("logging"), config.logging);
    if (root.contains("strategy")) parse_strategy(root.at("strategy"), config.strategy);

    if (!root.contains("accounts")) {
        throw ConfigError("missing required key accounts");
    }
    const auto& accounts = root.at("accounts");
    if (!accounts.is_array()) {
        throw ConfigError("accounts must be an array");
    }
    for (std::size_t i = 0; i < accounts.size(); ++i) {
        config.accounts.push_back(parse_account(accounts.at(i), i));
    }

    validate_config(config);
    return config;
}

void validate_config(const Config& config) {
    check_fraction(config.trading.max_total_exposure, "trading.max_total_exposure");
    check_fraction(config.trading.stop_loss_pct, "trading.stop_loss_pct");
    check_fraction(config.trading.take_profit_pct, "trading.take_profit_pct");
    if (config.trading.max_day_trades < 0) {
        throw ConfigError("trading.max_day_trades must not be negative");
    }
    check_positive(config.trading.max_trades_per_cycle, "trading.max_trades_per_cycle");
    if (!(config.trading.min_order_quantity > 0.0)) {
        throw ConfigError("trading.min_order_quantity must be positive");
    }

    check_fraction(config.risk_management.max_daily_loss, "risk_management.max_daily_loss");
    check_fraction(config.emergency.daily_loss_limit, "emergency_conditions.daily_loss_limit");
    check_positive(config.emergency.max_consecutive_losses, "emergency_conditions.max_consecutive_losses");
    check_positive(config.emergency.max_failed_cycles, "emergency_conditions.max_failed_cycles");

    const auto& sched = config.scheduler;
    check_positive(sched.trading_interval.count(), "scheduler.trading_interval_sec");
    check_positive(sched.backtest_interval.count(), "scheduler.backtest_interval_sec");
    check_positive(sched.cycle_budget.count(), "scheduler.cycle_budget_sec");
    check_positive(sched.adapter_timeout.count(), "scheduler.adapter_timeout_ms");
    check_positive(sched.retry_max_attempts, "scheduler.retry_max_attempts");
    check_positive(sched.retry_initial_backoff.count(), "scheduler.retry_initial_backoff_ms");
    if (sched.retry_max_backoff < sched.retry_initial_backoff) {
        throw ConfigError("scheduler.retry_max_backoff_ms must be >= retry_initial_backoff_ms");
    }

    const auto& mon = config.monitoring;
    check_positive(mon.health_check_interval.count(), "monitoring.health_check_interval_sec");
    if (mon.notification_cooldown.count() < 0) {
        throw ConfigError("monitoring.notification_cooldown_sec must not be negative");
    }
    if (mon.http_port < 1 || mon.http_port > 65535) {
        throw ConfigError("monitoring.http_port out of range");
    }
    if (mon.metrics_window < 2) {
        throw ConfigError("monitoring.metrics_window must be at least 2");
    }

    const auto& session = config.market_session;
    if (session.open_minute >= session.close_minute) {
        throw ConfigError("market_session.open must be before market_session.close");
    }
    if (session.utc_offset_std < -12 || session.utc_offset_std > 14) {
        throw ConfigError("market_session.utc_offset_std out of range");
    }
    for (const auto& [date, minute] : session.early_closes) {
        if (minute <= session.open_minute || minute > session.close_minute) {
            throw ConfigError("market_session.early_closes." + date.to_string() + " outside regular hours");
        }
    }

    static const std::set<std::string> levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (levels.count(config.logging.level) == 0) {
        throw ConfigError("logging.level '" + config.logging.level + "' is not a known level");
    }

    if (config.accounts.empty()) {
        throw ConfigError("accounts must not be empty");
    }
    std::set<std::string> ids;
    for (const auto& account : config.accounts) {
        const std::string where = "account '" + account.id + "'";
        if (account.id.empty()) {
            throw ConfigError("account id must not be empty");
        }
        if (!ids.insert(account.id).second) {
            throw ConfigError("duplicate account id '" + account.id + "'");
        }
        if (!(account.starting_equity > 0.0)) {
            throw ConfigError(where + " starting_equity must be positive");
        }
        check_fraction(account.max_position_size, where + " max_position_size");
        if (!(account.risk_multiplier > 0.0)) {
            throw ConfigError(where + " risk_multiplier must be positive");
        }
        if (account.daily_loss_limit) {
            check_fraction(*account.daily_loss_limit, where + " daily_loss_limit");
        }
        if (account.api_key_env.empty() || account.api_secret_env.empty()) {
            throw ConfigError(where + " credential variable names must not be empty");
        }
    }
}

std::map<std::string, Credentials> resolve_credentials(const Config& config) {
    std::map<std::string, Credentials> resolved;
    for (const auto& account : config.accounts) {
        const char* key = std::getenv(account.api_key_env.c_str());
        const char* secret = std::getenv(account.api_secret_env.c_str());
        if (key == nullptr || *key == '\0') {
            throw ConfigError("missing credentials for account '" + account.id + "': " +
                              account.api_key_env + " is not set");
        }
        if (secret == nullptr || *secret == '\0') {
            throw ConfigError("missing credentials for account '" + account.id + "': " +
                              account.api_secret_env + " is not set");
        }
        resolved[account.id] = Credentials{key, secret};
    }
    return resolved;
}

RiskLimits limits_for(const Config& config, const AccountConfig& account) {
    RiskLimits limits;
    limits.max_position_size = account.max_position_size;
    limits.max_total_exposure = config.trading.max_total_exposure;
    limits.stop_loss_pct = config.trading.stop_loss_pct;
    limits.take_profit_pct = config.trading.take_profit_pct;
    limits.max_day_trades = config.trading.max_day_trades;
    limits.daily_loss_limit = std::min(account.daily_loss_limit.value_or(config.emergency.daily_loss_limit),
                                       config.risk_management.max_daily_loss);
    limits.risk_multiplier = account.risk_multiplier;
    limits.aggressive_sizing_enabled = account.aggressive_sizing_enabled;
    limits.kelly_enabled = config.risk_management.kelly_enabled;
    limits.circuit_breaker_enabled = config.emergency.circuit_breaker_enabled;
    limits.max_consecutive_losses = config.emergency.max_consecutive_losses;
    limits.max_trades_per_cycle = config.trading.max_trades_per_cycle;
    limits.min_order_quantity = config.trading.min_order_quantity;
    return limits;
}

json effective_config(const Config& config) {
    json holidays = json::array();
    for (const auto& date : config.market_session.holidays) {
        holidays.push_back(date.to_string());
    }
    json early = json::object();
    for (const auto& [date, minute] : config.market_session.early_closes) {
        early[date.to_string()] = format_minutes(minute);
    }

    json accounts = json::array();
    for (const auto& account : config.accounts) {
        auto limits = limits_for(config, account);
        accounts.push_back({
            {"id", account.id},
            {"starting_equity", account.starting_equity},
            {"max_position_size", account.max_position_size},
            {"aggressive_sizing_enabled", account.aggressive_sizing_enabled},
            {"risk_multiplier", account.risk_multiplier},
            {"daily_loss_limit", limits.daily_loss_limit},
            {"api_key_env", account.api_key_env},
            {"api_secret_env", account.api_secret_env}
        });
    }

    return json{
        {"trading", {
            {"max_total_exposure", config.trading.max_total_exposure},
            {"stop_loss_pct", config.trading.stop_loss_pct},
            {"take_profit_pct", config.trading.take_profit_pct},
            {"max_day_trades", config.trading.max_day_trades},
            {"max_trades_per_cycle", config.trading.max_trades_per_cycle},
            {"min_order_quantity", config.trading.min_order_quantity}
        }},
        {"risk_management", {
            {"max_daily_loss", config.risk_management.max_daily_loss},
            {"kelly_enabled", config.risk_management.kelly_enabled},
            {"account_isolation", config.risk_management.account_isolation}
        }},
        {"emergency_conditions", {
            {"max_consecutive_losses", config.emergency.max_consecutive_losses},
            {"daily_loss_limit", config.emergency.daily_loss_limit},
            {"circuit_breaker_enabled", config.emergency.circuit_breaker_enabled},
            {"max_failed_cycles", config.emergency.max_failed_cycles},
            {"liquidate_on_emergency_stop", config.emergency.liquidate_on_emergency_stop}
        }},
        {"scheduler", {
            {"trading_interval_sec", config.scheduler.trading_interval.count()},
            {"backtest_interval_sec", config.scheduler.backtest_interval.count()},
            {"cycle_budget_sec", config.scheduler.cycle_budget.count()},
            {"adapter_timeout_ms", config.scheduler.adapter_timeout.count()},
            {"retry_max_attempts", config.scheduler.retry_max_attempts},
            {"retry_initial_backoff_ms", config.scheduler.retry_initial_backoff.count()},
            {"retry_max_backoff_ms", config.scheduler.retry_max_backoff.count()},
            {"backtest_top_n", config.scheduler.backtest_top_n},
            {"backtest_strategies", config.scheduler.backtest_strategies}
        }},
        {"monitoring", {
            {"health_check_interval_sec", config.monitoring.health_check_interval.count()},
            {"notification_cooldown_sec", config.monitoring.notification_cooldown.count()},
            {"enable_http_endpoint", config.monitoring.enable_http_endpoint},
            {"http_host", config.monitoring.http_host},
            {"http_port", config.monitoring.http_port},
            {"metrics_window", config.monitoring.metrics_window}
        }},
        {"market_session", {
            {"open", format_minutes(config.market_session.open_minute)},
            {"close", format_minutes(config.market_session.close_minute)},
            {"utc_offset_std", config.market_session.utc_offset_std},
            {"observe_us_dst", config.market_session.observe_us_dst},
            {"holidays", holidays},
            {"early_closes", early}
        }},
        {"logging", {
            {"level", config.logging.level},
            {"file", config.logging.file},
            {"max_file_size_mb", config.logging.max_file_size_mb},
            {"max_files", config.logging.max_files}
        }},
        {"strategy", {
            {"min_score", config.strategy.min_score},
            {"min_confidence", config.strategy.min_confidence},
            {"exit_score", config.strategy.exit_score}
        }},
        {"accounts", accounts}
    };
}

} // namespace sentinel
