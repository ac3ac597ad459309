#include "sentinel/paper.hpp"
#include "sentinel/errors.hpp"
#include "sentinel/logging.hpp"
#include "sentinel/serialization.hpp"

namespace sentinel {

FileCandidateSource::FileCandidateSource(std::string path, std::shared_ptr<PriceBook> prices)
    : path_(std::move(path)),
      prices_(std::move(prices)),
      logger_(make_logger("candidates")) {}

std::vector<Candidate> FileCandidateSource::get_qualified_candidates(const CallContext&) {
    std::ifstream in(path_);
    if (!in) {
        throw TransientError("candidate file " + path_ + " not available");
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        // The scorer may be rewriting the file.
        throw TransientError("candidate file " + path_ + " unreadable: " + e.what());
    }
    if (!doc.is_array()) {
        throw AdapterError("candidate file " + path_ + " must hold a JSON array");
    }

    std::vector<Candidate> candidates;
    try {
        candidates = doc.get<std::vector<Candidate>>();
    } catch (const nlohmann::json::exception& e) {
        throw AdapterError("candidate file " + path_ + ": " + e.what());
    }
    for (const auto& candidate : candidates) {
        if (candidate.last_price && *candidate.last_price > 0.0) {
            prices_->update(candidate.symbol, *candidate.last_price);
        }
    }
    logger_->debug("Loaded {} qualified candidates from {}", candidates.size(), path_);
    return candidates;
}

void FileCandidateSource::ping(const CallContext&) {
    std::ifstream in(path_);
    if (!in) {
        throw TransientError("candidate file " + path_ + " not available");
    }
}

JsonlPersistence::JsonlPersistence(const std::string& path)
    : path_(path),
      out_(path, std::ios::app) {
    if (!out_) {
        throw ConfigError("cannot open audit log " + path);
    }
}

void JsonlPersistence::write(const char* type, const nlohmann::json& data, const CallContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx.expired()) {
        throw TimeoutError(std::string("deadline passed before writing ") + type + " to " + path_);
    }
    out_ << nlohmann::json{{"type", type}, {"data", data}}.dump() << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw TransientError("write to " + path_ + " failed");
    }
}

void JsonlPersistence::record_cycle(const CycleResult& cycle, const CallContext& ctx) {
    write("cycle", cycle, ctx);
}

void JsonlPersistence::record_order(const OrderRecord& order, const CallContext& ctx) {
    write("order", order, ctx);
}

void JsonlPersistence::record_circuit_breaker_event(const BreakerEvent& event, const CallContext& ctx) {
    write("circuit_breaker", event, ctx);
}

void JsonlPersistence::record_backtest(const BacktestReport& report, const CallContext& ctx) {
    write("backtest", report, ctx);
}

void JsonlPersistence::record_daily_report(const DailyReport& report, const CallContext& ctx) {
    write("daily_report", report, ctx);
}

void JsonlPersistence::ping(const CallContext&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.good()) {
        throw TransientError("audit log " + path_ + " is not writable");
    }
}

LogNotifier::LogNotifier() : logger_(make_logger("notifications")) {}

void LogNotifier::notify(Severity severity, const std::string& title, const std::string& message,
                         const CallContext& ctx) {
    if (ctx.expired()) {
        throw TimeoutError("deadline passed before delivering '" + title + "'");
    }
    switch (severity) {
        case Severity::Info:
            logger_->info("{}: {}", title, message);
            break;
        case Severity::Warning:
            logger_->warn("{}: {}", title, message);
            break;
        case Severity::Critical:
            logger_->critical("{}: {}", title, message);
            break;
    }
}

} // namespace sentinel
