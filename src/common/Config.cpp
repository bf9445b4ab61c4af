#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>

namespace daypick {

namespace {
using nlohmann::json;

std::string joinPath(const std::string& parent, const char* key) {
    return parent.empty() ? std::string(key) : parent + "." + key;
}

const json& requireObject(const json& parent, const char* key, const std::string& path) {
    const std::string full = joinPath(path, key);
    if (!parent.contains(key)) {
        throw ConfigError("missing required section '" + full + "'");
    }
    const json& node = parent.at(key);
    if (!node.is_object()) {
        throw ConfigError("section '" + full + "' must be an object");
    }
    return node;
}

double requireNumber(const json& parent, const char* key, const std::string& path) {
    const std::string full = joinPath(path, key);
    if (!parent.contains(key)) {
        throw ConfigError("missing required key '" + full + "'");
    }
    const json& node = parent.at(key);
    if (!node.is_number()) {
        throw ConfigError("key '" + full + "' must be a number");
    }
    return node.get<double>();
}

int requireInt(const json& parent, const char* key, const std::string& path) {
    const std::string full = joinPath(path, key);
    if (!parent.contains(key)) {
        throw ConfigError("missing required key '" + full + "'");
    }
    const json& node = parent.at(key);
    if (!node.is_number_integer()) {
        throw ConfigError("key '" + full + "' must be an integer");
    }
    return node.get<int>();
}

std::optional<double> optionalNumber(const json& parent, const char* key, const std::string& path) {
    if (!parent.contains(key) || parent.at(key).is_null()) {
        return std::nullopt;
    }
    const json& node = parent.at(key);
    if (!node.is_number()) {
        throw ConfigError("key '" + joinPath(path, key) + "' must be a number");
    }
    return node.get<double>();
}

template<typename T>
T valueOr(const json& parent, const char* key, T fallback, const std::string& path) {
    try {
        return parent.value(key, fallback);
    } catch (const json::exception&) {
        throw ConfigError("key '" + joinPath(path, key) + "' has the wrong type");
    }
}

void parseSector(const json& root, strategy::SectorConfig& out) {
    const json& s = requireObject(root, "sector", "");
    out.mtm_lookback = requireInt(s, "mtm_lookback", "sector");
    out.thresh_avg_pct = requireNumber(s, "thresh_avg_pct", "sector");
    out.thresh_up_ratio = requireNumber(s, "thresh_up_ratio", "sector");
    out.thresh_mtm_z = requireNumber(s, "thresh_mtm_z", "sector");
    out.fallback_top_k = valueOr(s, "fallback_top_k", 3, "sector");

    const json& w = requireObject(s, "weights", "sector");
    out.weights.avg_pct_change_z = requireNumber(w, "avg_pct_change_z", "sector.weights");
    out.weights.sector_mtm_z = requireNumber(w, "sector_mtm_z", "sector.weights");
    out.weights.up_ratio = requireNumber(w, "up_ratio", "sector.weights");

    if (out.mtm_lookback < 1) {
        throw ConfigError("sector.mtm_lookback must be >= 1");
    }
    if (out.fallback_top_k < 1) {
        throw ConfigError("sector.fallback_top_k must be >= 1");
    }
}

void parseLeader(const json& root, strategy::LeaderConfig& out) {
    const json& l = requireObject(root, "leader", "");
    out.thresh_leader_pct = requireNumber(l, "thresh_leader_pct", "leader");
    out.thresh_leader_vol_ratio = requireNumber(l, "thresh_leader_vol_ratio", "leader");
    out.thresh_leader_pos = requireNumber(l, "thresh_leader_pos", "leader");
    out.top_n_per_sector = requireInt(l, "top_n_per_sector", "leader");
    out.top_pct_in_sector = optionalNumber(l, "top_pct_in_sector", "leader");

    const json& w = requireObject(l, "weights", "leader");
    out.weights.pct_change_z = requireNumber(w, "pct_change_z", "leader.weights");
    out.weights.vol_ratio_z = requireNumber(w, "vol_ratio_z", "leader.weights");
    out.weights.pos_in_day = requireNumber(w, "pos_in_day", "leader.weights");

    if (out.top_n_per_sector < 1) {
        throw ConfigError("leader.top_n_per_sector must be >= 1");
    }
    if (out.top_pct_in_sector && (*out.top_pct_in_sector <= 0.0 || *out.top_pct_in_sector > 1.0)) {
        throw ConfigError("leader.top_pct_in_sector must be in (0, 1]");
    }
}

void parseFollower(const json& root, strategy::FollowerConfig& out) {
    const json& f = requireObject(root, "follower", "");
    out.pct_change_min = requireNumber(f, "pct_change_min", "follower");
    out.pct_change_max = requireNumber(f, "pct_change_max", "follower");
    out.vol_ratio_min = requireNumber(f, "vol_ratio_min", "follower");
    out.vol_ratio_max = requireNumber(f, "vol_ratio_max", "follower");
    out.thresh_dist_20d_high = requireNumber(f, "thresh_dist_20d_high", "follower");

    const json& w = requireObject(f, "weights", "follower");
    out.weights.pct_change_z = requireNumber(w, "pct_change_z", "follower.weights");
    out.weights.vol_ratio_z = requireNumber(w, "vol_ratio_z", "follower.weights");
    out.weights.one_minus_dist_20d_high = requireNumber(w, "one_minus_dist_20d_high", "follower.weights");
    out.weights.pos_in_day = requireNumber(w, "pos_in_day", "follower.weights");

    if (out.pct_change_min > out.pct_change_max) {
        throw ConfigError("follower.pct_change_min must be <= follower.pct_change_max");
    }
    if (out.vol_ratio_min > out.vol_ratio_max) {
        throw ConfigError("follower.vol_ratio_min must be <= follower.vol_ratio_max");
    }
}

void parsePositionSizing(const json& root, engine::PositionSizingConfig& out) {
    const json& p = requireObject(root, "position_sizing", "");
    out.capital = requireNumber(p, "capital", "position_sizing");
    out.risk_per_trade = requireNumber(p, "risk_per_trade", "position_sizing");
    out.max_position_pct = requireNumber(p, "max_position_pct", "position_sizing");
    out.stop_buffer_pct = requireNumber(p, "stop_buffer_pct", "position_sizing");
    out.lot_size = valueOr(p, "lot_size", 1000LL, "position_sizing");

    if (out.capital <= 0.0) {
        throw ConfigError("position_sizing.capital must be > 0");
    }
    if (out.lot_size < 1) {
        throw ConfigError("position_sizing.lot_size must be >= 1");
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

engine::EngineConfig Config::parseEngineConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    engine::EngineConfig cfg;

    if (j.contains("universe")) {
        const json& u = requireObject(j, "universe", "");
        cfg.universe.min_turnover = optionalNumber(u, "min_turnover", "universe");
        cfg.universe.min_price = optionalNumber(u, "min_price", "universe");
        cfg.universe.max_price = optionalNumber(u, "max_price", "universe");
    }

    parseSector(j, cfg.sector);
    parseLeader(j, cfg.leader);
    parseFollower(j, cfg.follower);

    const json& tw = requireObject(j, "total_score_weights", "");
    cfg.total_score_weights.score_sector = requireNumber(tw, "score_sector", "total_score_weights");
    cfg.total_score_weights.score_leader = requireNumber(tw, "score_leader", "total_score_weights");
    cfg.total_score_weights.score_follow = requireNumber(tw, "score_follow", "total_score_weights");

    parsePositionSizing(j, cfg.position_sizing);

    if (j.contains("fallback")) {
        const json& fb = requireObject(j, "fallback", "");
        const std::string mode = valueOr(fb, "mode", std::string("strict"), "fallback");
        auto parsed = strategy::parseFallbackMode(mode);
        if (!parsed) {
            throw ConfigError("fallback.mode must be one of strict|percentile|permissive, got '" + mode + "'");
        }
        cfg.fallback_mode = *parsed;
    }

    if (cfg.fallback_mode == strategy::FallbackMode::PERCENTILE && !cfg.leader.top_pct_in_sector) {
        throw ConfigError("fallback.mode=percentile requires leader.top_pct_in_sector");
    }

    return cfg;
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig engine_cfg = parseEngineConfig(j);

    backtest::SyntheticMarketConfig demo;
    if (j.contains("demo")) {
        const json& d = requireObject(j, "demo", "");
        demo.num_stocks = valueOr(d, "num_stocks", demo.num_stocks, "demo");
        demo.num_sectors = valueOr(d, "num_sectors", demo.num_sectors, "demo");
        demo.history_days = valueOr(d, "history_days", demo.history_days, "demo");
        demo.seed = valueOr(d, "seed", demo.seed, "demo");
        if (demo.num_stocks < 1 || demo.num_sectors < 1 || demo.history_days < 1) {
            throw ConfigError("demo.num_stocks, demo.num_sectors and demo.history_days must be >= 1");
        }
    }

    backtest::BacktestConfig bt;
    if (j.contains("backtest")) {
        const json& b = requireObject(j, "backtest", "");
        bt.max_positions = valueOr(b, "max_positions", bt.max_positions, "backtest");
        bt.hold_days = valueOr(b, "hold_days", bt.hold_days, "backtest");
        if (bt.max_positions < 1 || bt.hold_days < 0) {
            throw ConfigError("backtest.max_positions must be >= 1 and backtest.hold_days >= 0");
        }
    }

    std::string level = log_level_;
    std::string dir = log_dir_;
    if (j.contains("logging")) {
        const json& lg = requireObject(j, "logging", "");
        level = valueOr(lg, "level", level, "logging");
        dir = valueOr(lg, "dir", dir, "logging");
    }

    engine_config_ = engine_cfg;
    demo_config_ = demo;
    backtest_config_ = bt;
    log_level_ = level;
    log_dir_ = dir;
    loaded_ = true;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (!std::filesystem::exists(config_path)) {
        throw ConfigError("config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("config parse error in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    source_path_ = config_path.string();

    LOG_INFO("Config loaded: {} (fallback={}, capital={:.0f})",
             source_path_, strategy::toString(engine_config_.fallback_mode),
             engine_config_.position_sizing.capital);
}

} // namespace daypick
