#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "screening_level.hpp"
#include "audit_event.hpp"
#include "engine_config.hpp"
#include "indicators.hpp"

namespace screening {

    // Ordered chain of validators every candidate signal must pass.
    //
    // Critical levels run first and always; their failure or internal error
    // blocks regardless of the fail policy. Advisory levels run in insertion
    // order; a failure or internal error is logged and passed under fail-open,
    // and blocks (ending the chain) under fail-closed.
    class ScreeningPipeline {
    public:
        explicit ScreeningPipeline(bool fail_open, audit::IAuditPublisher* publisher = nullptr);

        // fail_open overrides the global policy for this level only
        void addLevel(std::unique_ptr<IScreeningLevel> level, bool enabled = true,
                      std::optional<bool> fail_open = std::nullopt);

        // Returns false for an unknown level name
        bool setEnabled(const std::string& name, bool enabled);
        bool isEnabled(const std::string& name) const;
        std::vector<std::string> levelNames() const;
        std::vector<std::string> enabledLevelNames() const;

        core::ScreeningVerdict validate(const core::Signal& signal,
                                        const MarketState& state,
                                        const std::vector<core::Position>& open_positions) const;

        bool failOpen() const { return fail_open_; }

    private:
        struct Entry {
            std::unique_ptr<IScreeningLevel> level;
            bool enabled = true;
            std::optional<bool> fail_open;
        };

        // Runs one level, records the outcome and returns true when it blocks
        bool runLevel(const Entry& entry, const core::Signal& signal, const MarketState& state,
                      const std::vector<core::Position>& open_positions, core::ScreeningVerdict& verdict) const;

        void publish(const core::Signal& signal, const core::ScreeningVerdict& verdict, const core::Timestamp& now) const;

        const bool fail_open_;
        audit::IAuditPublisher* publisher_;

        mutable std::mutex mutex_;
        std::vector<Entry> levels_;
    };

    // Level names in their default evaluation order
    const std::vector<std::string>& knownLevelNames();

    // Levels a preset ("relaxed", "medium", "strict") enables. Throws core::ConfigException for unknown presets.
    std::vector<std::string> presetLevels(const std::string& preset);

    // Builds the configured pipeline: preset selection, per-level enable/fail-open overrides and params.
    // Throws core::ConfigException on unknown levels or bad parameters.
    std::unique_ptr<ScreeningPipeline> buildPipeline(const core::ScreeningConfig& config,
                                                     const core::RiskConfig& risk,
                                                     const indicators::IIndicatorLibrary& indicators,
                                                     audit::IAuditPublisher* publisher);

} // namespace screening
