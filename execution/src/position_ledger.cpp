#include "position_ledger.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace execution {

bool PositionLedger::isTighter(const core::Position& position, double new_stop) {
    return position.isLong() ? new_stop > position.stop_loss : new_stop < position.stop_loss;
}

bool PositionLedger::add(const core::Position& position) {
    auto logger = core::logging::getLogger();
    if (position.quantity <= 0) {
        logger->warn("Ledger: refusing position for {} with quantity {}", position.instrument_key, position.quantity);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = positions_.emplace(position.instrument_key, position);
    if (!inserted.second) {
        logger->warn("Ledger: {} already has an open position, add ignored.", position.instrument_key);
        return false;
    }
    logger->info("Position opened: {} {} x{} @ {:.2f} SL {:.2f} TGT {:.2f} (order {})",
                 position.instrument_key, core::directionToString(position.direction), position.quantity,
                 position.entry_price, position.stop_loss, position.target, position.order_id);
    return true;
}

std::optional<core::Position> PositionLedger::remove(const std::string& instrument_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end()) return std::nullopt;
    core::Position removed = it->second;
    positions_.erase(it);
    return removed;
}

std::optional<core::Position> PositionLedger::removeIfIdle(const std::string& instrument_key, core::Timestamp opened_before) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end()) return std::nullopt;
    if (it->second.exit_pending || it->second.opened_at > opened_before) {
        core::logging::getLogger()->debug("Ledger: {} changed since the snapshot, not removed.", instrument_key);
        return std::nullopt;
    }
    core::Position removed = it->second;
    positions_.erase(it);
    return removed;
}

std::optional<core::Trade> PositionLedger::close(const std::string& instrument_key, double exit_price,
                                                 core::Timestamp exit_time, const std::string& exit_reason)
{
    return recordExitFill(instrument_key, std::numeric_limits<long long>::max(), exit_price, exit_time, exit_reason);
}

std::optional<core::Trade> PositionLedger::recordExitFill(const std::string& instrument_key, long long filled_quantity,
                                                          double exit_price, core::Timestamp exit_time,
                                                          const std::string& exit_reason)
{
    auto logger = core::logging::getLogger();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end()) {
        logger->warn("Ledger: exit fill for {} but no open position.", instrument_key);
        return std::nullopt;
    }
    if (filled_quantity <= 0) {
        logger->warn("Ledger: exit fill for {} without quantity ignored.", instrument_key);
        return std::nullopt;
    }
    core::Position& position = it->second;
    long long quantity = std::min(filled_quantity, position.quantity);

    double entry_value = position.entry_price * quantity;
    double exit_value = exit_price * quantity;

    core::Trade trade;
    trade.instrument_key = instrument_key;
    trade.direction = position.direction;
    trade.strategy_id = position.strategy_id;
    trade.entry_time = position.opened_at;
    trade.exit_time = exit_time;
    trade.quantity = quantity;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.pnl = position.isLong() ? exit_value - entry_value : entry_value - exit_value;
    trade.return_pct = entry_value != 0.0 ? trade.pnl / std::abs(entry_value) : 0.0;
    trade.exit_reason = exit_reason;
    trade_log_.push_back(trade);

    if (quantity < position.quantity) {
        position.quantity -= quantity;
        position.exit_pending = false;
        position.exit_reason.reset();
        position.exit_client_order_id.clear(); // The remainder goes out as a new order
        logger->warn("Position reduced: {} {} x{} @ {:.2f}, {} still open [{}]", instrument_key,
                     core::directionToString(trade.direction), quantity, exit_price, position.quantity, exit_reason);
        return trade;
    }
    positions_.erase(it);

    logger->info("Position closed: {} {} x{} {:.2f} -> {:.2f} PnL {:.2f} ({:.2f}%) [{}] at {}",
                 trade.instrument_key, core::directionToString(trade.direction), trade.quantity,
                 trade.entry_price, trade.exit_price, trade.pnl, trade.return_pct * 100.0, exit_reason,
                 core::utils::timestampToString(exit_time));
    return trade;
}

std::optional<core::Position> PositionLedger::get(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<core::Position> PositionLedger::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::Position> result;
    result.reserve(positions_.size());
    for (const auto& pair : positions_) {
        result.push_back(pair.second);
    }
    return result;
}

bool PositionLedger::has(const std::string& instrument_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(instrument_key) > 0;
}

std::size_t PositionLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

bool PositionLedger::updateStop(const std::string& instrument_key, double new_stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end()) return false;
    if (!isTighter(it->second, new_stop)) {
        core::logging::getLogger()->debug("Ledger: stop {:.2f} -> {:.2f} for {} would loosen, rejected.",
                                          it->second.stop_loss, new_stop, instrument_key);
        return false;
    }
    it->second.stop_loss = new_stop;
    return true;
}

bool PositionLedger::updatePeak(const std::string& instrument_key, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end()) return false;
    core::Position& position = it->second;
    bool better = position.isLong() ? price > position.peak_favorable_price : price < position.peak_favorable_price;
    if (!better) return false;
    position.peak_favorable_price = price;
    return true;
}

bool PositionLedger::moveToBreakeven(const std::string& instrument_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end() || it->second.breakeven_moved) return false;
    core::Position& position = it->second;
    position.breakeven_moved = true;
    if (isTighter(position, position.entry_price)) {
        position.stop_loss = position.entry_price;
    }
    return true;
}

bool PositionLedger::markExitPending(const std::string& instrument_key, core::ExitReason reason,
                                     const std::string& client_order_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end() || it->second.exit_pending) return false;
    it->second.exit_pending = true;
    it->second.exit_reason = reason;
    if (it->second.exit_client_order_id.empty()) {
        it->second.exit_client_order_id = client_order_id;
    }
    return true;
}

bool PositionLedger::clearExitPending(const std::string& instrument_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(instrument_key);
    if (it == positions_.end() || !it->second.exit_pending) return false;
    it->second.exit_pending = false;
    it->second.exit_reason.reset();
    return true;
}

std::vector<core::Trade> PositionLedger::tradeLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trade_log_;
}

double PositionLedger::realizedPnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& trade : trade_log_) total += trade.pnl;
    return total;
}

} // namespace execution
