#include "sentinel/paper.hpp"
#include "sentinel/errors.hpp"
#include "sentinel/logging.hpp"

#include <chrono>
#include <cmath>

namespace sentinel {

void PriceBook::update(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[symbol] = price;
}

std::optional<double> PriceBook::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PaperBroker::PaperBroker(std::shared_ptr<PriceBook> prices, const Config& config)
    : prices_(std::move(prices)),
      logger_(make_logger("paper_broker")) {
    for (const auto& cfg : config.accounts) {
        accounts_[cfg.id].cash = cfg.starting_equity;
    }
    logger_->info("Paper broker initialized with {} accounts", accounts_.size());
}

PaperBroker::PaperAccount& PaperBroker::account(const std::string& account_id) {
    auto it = accounts_.find(account_id);
    if (it == accounts_.end()) {
        throw AdapterError("unknown account " + account_id);
    }
    return it->second;
}

double PaperBroker::mark(const Position& position) const {
    return prices_->get(position.symbol).value_or(position.current_price);
}

BrokerAccount PaperBroker::get_account(const std::string& account_id, const CallContext&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& acct = account(account_id);
    BrokerAccount result;
    result.cash = acct.cash;
    result.equity = acct.cash;
    for (const auto& [symbol, pos] : acct.positions) {
        result.equity += pos.quantity * mark(pos);
    }
    return result;
}

std::vector<Position> PaperBroker::get_positions(const std::string& account_id, const CallContext&) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    for (const auto& [symbol, pos] : account(account_id).positions) {
        Position marked = pos;
        marked.current_price = mark(pos);
        result.push_back(marked);
    }
    return result;
}

PriceMap PaperBroker::get_prices(const std::vector<std::string>& symbols, const CallContext&) {
    PriceMap result;
    for (const auto& symbol : symbols) {
        if (auto price = prices_->get(symbol)) {
            result[symbol] = *price;
        }
    }
    return result;
}

std::string PaperBroker::submit_order(const OrderRequest& order, const CallContext&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& acct = account(order.account_id);

    auto price = order.type == OrderType::Limit && order.limit_price ? order.limit_price : prices_->get(order.symbol);
    if (!price || *price <= 0.0) {
        throw AdapterError("no price for " + order.symbol);
    }
    if (order.quantity <= 0.0) {
        throw AdapterError("invalid quantity");
    }

    double order_value = order.quantity * *price;
    auto it = acct.positions.find(order.symbol);
    if (order.side == Side::Buy && order_value > acct.cash) {
        throw AdapterError("insufficient cash: need " + std::to_string(order_value) + ", have " +
                           std::to_string(acct.cash));
    }
    if (order.side == Side::Sell && (it == acct.positions.end() || it->second.quantity < order.quantity)) {
        throw AdapterError("insufficient shares of " + order.symbol);
    }

    if (order.side == Side::Buy) {
        acct.cash -= order_value;
        if (it == acct.positions.end()) {
            acct.positions[order.symbol] =
                Position{order.symbol, order.quantity, *price, *price, std::chrono::system_clock::now()};
        } else {
            // Weighted average price
            double total = it->second.quantity + order.quantity;
            it->second.entry_price = (it->second.entry_price * it->second.quantity + order_value) / total;
            it->second.quantity = total;
            it->second.current_price = *price;
        }
    } else {
        acct.cash += order_value;
        it->second.quantity -= order.quantity;
        if (std::abs(it->second.quantity) < 1e-9) {
            acct.positions.erase(it);
        }
    }

    std::string order_id = "paper-" + std::to_string(next_order_id_++);
    filled_[order.client_order_id] = order_id;
    logger_->info("Market order executed: {} {} {} shares at ${:.2f}", to_string(order.side), order.quantity,
                  order.symbol, *price);
    return order_id;
}

void PaperBroker::cancel_order(const std::string& account_id, const std::string& client_order_id,
                               const CallContext&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (filled_.count(client_order_id) > 0) {
        throw AdapterError("order " + client_order_id + " already filled");
    }
    logger_->info("No open order {} for account {}", client_order_id, account_id);
}

void PaperBroker::ping(const CallContext&) {}

} // namespace sentinel
