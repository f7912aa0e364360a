#include "replay_market_feed.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <sstream>

namespace market_data {

    ReplayMarketFeed::ReplayMarketFeed(std::string csv_path, std::chrono::milliseconds tick_interval)
        : csv_path_(std::move(csv_path)), tick_interval_(tick_interval)
    {
    }

    ReplayMarketFeed::~ReplayMarketFeed() {
        disconnect();
    }

    std::vector<core::Tick> ReplayMarketFeed::loadTicks(const std::string& csv_path) {
        auto logger = core::logging::getLogger();
        std::ifstream ifs(csv_path);
        if (!ifs.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open tick replay file: {}", csv_path));
        }

        std::vector<core::Tick> ticks;
        std::string line;
        int line_no = 0;
        while (std::getline(ifs, line)) {
            ++line_no;
            if (line.empty() || line[0] == '#') {
                continue;
            }
            std::stringstream ss(line);
            std::string key, epoch_ms, price, size;
            std::getline(ss, key, ',');
            std::getline(ss, epoch_ms, ',');
            std::getline(ss, price, ',');
            std::getline(ss, size, ',');
            try {
                core::Tick tick;
                tick.instrument_key = key;
                tick.timestamp = core::utils::fromEpochMillis(std::stoll(epoch_ms));
                tick.price = std::stod(price);
                if (!size.empty()) {
                    tick.size = std::stoll(size);
                }
                ticks.push_back(tick);
            } catch (const std::exception& e) {
                logger->warn("Skipping malformed replay line {} in {}: {}", line_no, csv_path, e.what());
            }
        }
        logger->info("Loaded {} ticks from replay file {}", ticks.size(), csv_path);
        return ticks;
    }

    void ReplayMarketFeed::connect() {
        if (connected_.load()) {
            return;
        }
        std::vector<core::Tick> loaded;
        try {
            loaded = loadTicks(csv_path_);
        } catch (const core::DataLoadException& e) {
            throw core::DisconnectedException(e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (ticks_.empty()) {
                ticks_ = std::move(loaded);
            }
        }
        connected_.store(true);
        worker_ = std::thread(&ReplayMarketFeed::replayLoop, this);
    }

    void ReplayMarketFeed::subscribe(const std::vector<std::string>& instrument_keys) {
        if (!connected_.load()) {
            throw core::DisconnectedException("Cannot subscribe: replay feed not connected");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        subscribed_.insert(instrument_keys.begin(), instrument_keys.end());
    }

    bool ReplayMarketFeed::isConnected() const {
        return connected_.load();
    }

    void ReplayMarketFeed::disconnect() {
        connected_.store(false);
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void ReplayMarketFeed::setTickHandler(TickHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    std::size_t ReplayMarketFeed::loadedTickCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ticks_.size();
    }

    void ReplayMarketFeed::replayLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (connected_.load() && cursor_ < ticks_.size()) {
            cv_.wait_for(lock, tick_interval_, [this]() { return !connected_.load(); });
            if (!connected_.load()) {
                break;
            }
            core::Tick tick = ticks_[cursor_++];
            if (subscribed_.count(tick.instrument_key) == 0 || !handler_) {
                continue;
            }
            TickHandler handler = handler_;
            lock.unlock();
            handler(tick);
            lock.lock();
        }
        if (cursor_ >= ticks_.size() && !finished_.exchange(true)) {
            core::logging::getLogger()->info("Replay feed exhausted after {} ticks", ticks_.size());
        }
    }

} // namespace market_data
