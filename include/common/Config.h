#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "backtest/BacktestEngine.h"
#include "backtest/SyntheticMarket.h"

namespace daypick {

// Missing or mistyped configuration key. Fatal, never retried.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

class Config {
public:
    static Config& getInstance();

    // Throws ConfigError; on failure the previous state is kept
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    bool isLoaded() const { return loaded_; }

    // Validates every required key of the selection engine
    static engine::EngineConfig parseEngineConfig(const nlohmann::json& j);

    const engine::EngineConfig& getEngineConfig() const { return engine_config_; }
    const backtest::SyntheticMarketConfig& getDemoConfig() const { return demo_config_; }
    const backtest::BacktestConfig& getBacktestConfig() const { return backtest_config_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getSourcePath() const { return source_path_; }

private:
    Config() = default;

    engine::EngineConfig engine_config_;
    backtest::SyntheticMarketConfig demo_config_;
    backtest::BacktestConfig backtest_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string source_path_;
    bool loaded_ = false;
};

} // namespace daypick
