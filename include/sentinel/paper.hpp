#pragma once

#include "adapters.hpp"
#include "config.hpp"

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sentinel {

// Last known prices shared between the candidate file and the paper broker.
class PriceBook {
public:
    void update(const std::string& symbol, double price);
    std::optional<double> get(const std::string& symbol) const;

private:
    mutable std::mutex mutex_;
    PriceMap prices_;
};

// In-memory broker that fills market orders immediately at the last known
// price (paper mode).
class PaperBroker : public BrokerAdapter {
public:
    PaperBroker(std::shared_ptr<PriceBook> prices, const Config& config);

    BrokerAccount get_account(const std::string& account_id, const CallContext& ctx) override;
    std::vector<Position> get_positions(const std::string& account_id, const CallContext& ctx) override;
    PriceMap get_prices(const std::vector<std::string>& symbols, const CallContext& ctx) override;
    std::string submit_order(const OrderRequest& order, const CallContext& ctx) override;
    void cancel_order(const std::string& account_id, const std::string& client_order_id,
                      const CallContext& ctx) override;
    void ping(const CallContext& ctx) override;

private:
    struct PaperAccount {
        double cash = 0.0;
        std::map<std::string, Position> positions;
    };

    std::shared_ptr<PriceBook> prices_;
    std::map<std::string, PaperAccount> accounts_;
    std::map<std::string, std::string> filled_;     // client order id -> order id
    std::uint64_t next_order_id_ = 1;
    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;

    PaperAccount& account(const std::string& account_id);
    double mark(const Position& position) const;
};

// Reads the scorer's JSON array of {symbol, score, confidence, last_price}
// on every call.
class FileCandidateSource : public CandidateSource {
public:
    FileCandidateSource(std::string path, std::shared_ptr<PriceBook> prices);

    std::vector<Candidate> get_qualified_candidates(const CallContext& ctx) override;
    void ping(const CallContext& ctx) override;

private:
    std::string path_;
    std::shared_ptr<PriceBook> prices_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Appends one JSON object per line: {"type": ..., "data": ...}.
class JsonlPersistence : public PersistenceAdapter {
public:
    explicit JsonlPersistence(const std::string& path);

    void record_cycle(const CycleResult& cycle, const CallContext& ctx) override;
    void record_order(const OrderRecord& order, const CallContext& ctx) override;
    void record_circuit_breaker_event(const BreakerEvent& event, const CallContext& ctx) override;
    void record_backtest(const BacktestReport& report, const CallContext& ctx) override;
    void record_daily_report(const DailyReport& report, const CallContext& ctx) override;
    void ping(const CallContext& ctx) override;

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;

    // Nothing is written once the deadline has passed, so a timed-out entry
    // is never duplicated when the audit trail writes it again.
    void write(const char* type, const nlohmann::json& data, const CallContext& ctx);
};

class LogNotifier : public NotificationAdapter {
public:
    LogNotifier();

    void notify(Severity severity, const std::string& title, const std::string& message,
                const CallContext& ctx) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

// Opens long positions in strong candidates and closes holdings whose
// signal has weakened or disappeared.
class ThresholdStrategy : public Strategy {
public:
    explicit ThresholdStrategy(StrategyConfig config);

    std::vector<CandidateAction> propose(const Account& account,
                                         const std::vector<Candidate>& candidates) override;

private:
    StrategyConfig config_;
};

} // namespace sentinel
