#include "config_manager.hpp"
#include <fstream>
#include "logger.hpp"
#include "../core/exceptions.hpp"

namespace etfarb {

namespace {
constexpr size_t kMinSizingTiers = 4;
}

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        ETFARB_LOG_ERROR("Failed to open config file: " + file_path);
        return false;
    }
    try {
        file >> config_data_;
    } catch (const nlohmann::json::exception& e) {
        ETFARB_LOG_ERROR("Error parsing config file: " + std::string(e.what()));
        return false;
    }
    return apply(config_data_);
}

bool ConfigManager::load_from_string(const std::string& content) {
    try {
        config_data_ = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        ETFARB_LOG_ERROR("Error parsing config: " + std::string(e.what()));
        return false;
    }
    return apply(config_data_);
}

bool ConfigManager::apply(const nlohmann::json& data) {
    EngineConfig parsed;
    try {
        data.get_to(parsed);
    } catch (const nlohmann::json::exception& e) {
        ETFARB_LOG_ERROR("Config has wrong value types: " + std::string(e.what()));
        return false;
    }

    std::string env_key = get_env_var("RIT_API_KEY");
    if (!env_key.empty()) {
        parsed.exchange.api_key = env_key;
    }

    validate(parsed);
    config_ = parsed;
    return true;
}

void ConfigManager::validate(const EngineConfig& config) {
    const auto& limits = config.limits;
    if (limits.gross_ceiling <= 0 || limits.net_ceiling <= 0) {
        throw ConfigurationError("limits.gross_ceiling and limits.net_ceiling must be positive");
    }
    if (limits.enable_cash_check && (limits.cash_ceiling <= 0.0 || limits.net_cash_ceiling <= 0.0)) {
        throw ConfigurationError("limits cash ceilings must be positive when the cash check is enabled");
    }

    const auto& sizing = config.sizing;
    if (sizing.tiers.size() < kMinSizingTiers) {
        throw ConfigurationError("sizing.tiers needs at least " + std::to_string(kMinSizingTiers) +
                                 " entries, got " + std::to_string(sizing.tiers.size()));
    }
    for (size_t i = 0; i < sizing.tiers.size(); ++i) {
        const auto& tier = sizing.tiers[i];
        if (tier.threshold <= 0.0 || tier.quantity <= 0) {
            throw ConfigurationError("sizing.tiers[" + std::to_string(i) + "] must have positive threshold and quantity");
        }
        if (i > 0) {
            const auto& prev = sizing.tiers[i - 1];
            if (tier.threshold >= prev.threshold) {
                throw ConfigurationError("sizing.tiers must be ordered by strictly decreasing threshold");
            }
            if (tier.quantity > prev.quantity) {
                throw ConfigurationError("sizing.tiers quantity must not grow as threshold decreases");
            }
        }
    }
    if (sizing.max_order_size <= 0 || sizing.max_currency_order_size <= 0) {
        throw ConfigurationError("sizing per-order ceilings must be positive");
    }

    if (config.currency.drift_tolerance <= 0.0) {
        throw ConfigurationError("currency.drift_tolerance must be non-zero");
    }
    if (config.unwind.trigger <= 0.0 || config.unwind.trigger > 1.0) {
        throw ConfigurationError("unwind.trigger must be in (0, 1]");
    }
    if (config.unwind.chunk_size <= 0 || config.unwind.chunk_size > sizing.max_order_size) {
        throw ConfigurationError("unwind.chunk_size must be positive and within sizing.max_order_size");
    }
    if (config.hedge.max_attempts < 1) {
        throw ConfigurationError("hedge.max_attempts must be at least 1");
    }
    if (config.hedge.initial_backoff_ms < 0 || config.hedge.backoff_multiplier < 1.0) {
        throw ConfigurationError("hedge backoff must be non-negative and non-shrinking");
    }
    if (config.tender.allow_liquidation && config.tender.liquidation_margin < config.tender.margin) {
        throw ConfigurationError("tender.liquidation_margin must not be below tender.margin");
    }
    if (config.converter.enabled &&
        (config.converter.block_size <= 0 || config.converter.check_every_ticks <= 0)) {
        throw ConfigurationError("converter.block_size and converter.check_every_ticks must be positive");
    }
    if (config.scheduler.interval_ms < 0) {
        throw ConfigurationError("scheduler.interval_ms must not be negative");
    }
    if (config.exchange.timeout_ms <= 0) {
        throw ConfigurationError("exchange.timeout_ms must be positive");
    }
}

EngineConfig& ConfigManager::get_config() {
    return config_;
}

const EngineConfig& ConfigManager::get_config() const {
    return config_;
}

} // namespace etfarb
