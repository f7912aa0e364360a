#pragma once

#include "market_feed.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace market_data {

    // Paper-trading feed that replays recorded ticks from a CSV file
    // ("instrument_key,epoch_ms,price[,size]", '#' starts a comment line).
    class ReplayMarketFeed : public MarketFeed {
    public:
        ReplayMarketFeed(std::string csv_path, std::chrono::milliseconds tick_interval);
        ~ReplayMarketFeed() override;

        void connect() override;
        void subscribe(const std::vector<std::string>& instrument_keys) override;
        bool isConnected() const override;
        void disconnect() override;
        void setTickHandler(TickHandler handler) override;

        std::size_t loadedTickCount() const;
        bool finished() const { return finished_.load(); }

        // Parses the replay file. Throws core::DataLoadException on unreadable files.
        static std::vector<core::Tick> loadTicks(const std::string& csv_path);

    private:
        void replayLoop();

        const std::string csv_path_;
        const std::chrono::milliseconds tick_interval_;

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        TickHandler handler_;
        std::set<std::string> subscribed_;
        std::vector<core::Tick> ticks_;
        std::size_t cursor_ = 0; // Survives reconnects so replay resumes where it stopped

        std::atomic<bool> connected_{false};
        std::atomic<bool> finished_{false};
        std::thread worker_;
    };

} // namespace market_data
