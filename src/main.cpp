#include "common/Logger.h"
#include "common/Config.h"
#include "common/TradeCalendar.h"
#include "engine/SelectionEngine.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/SyntheticMarket.h"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace daypick;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void printUsage() {
    std::cout
        << "usage: daypick <demo|run|backtest> [options]\n"
        << "  common:   --config PATH (default config/config.json)\n"
        << "            --fallback strict|percentile|permissive (demo: permissive)\n"
        << "  demo:     --date YYYY-MM-DD\n"
        << "  run:      --date YYYY-MM-DD --market-dir DIR\n"
        << "            [--themes CSV | --meta CSV --sector-col industry|themes]\n"
        << "            [--risk-flags CSV] [--history-days 60] [--out results]\n"
        << "  backtest: --start YYYY-MM-DD --end YYYY-MM-DD\n"
        << "            [--market-dir DIR (+ run options) | synthetic market]\n";
}

// --key value 형식만 허용
bool parseOptions(int argc, char* argv[], std::map<std::string, std::string>& options) {
    for (int i = 2; i < argc; ++i) {
        const std::string key = argv[i];
        if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
            std::cerr << "invalid option: " << key << "\n";
            return false;
        }
        options[key.substr(2)] = argv[++i];
    }
    return true;
}

std::string optionOr(const std::map<std::string, std::string>& options,
                     const std::string& key, const std::string& fallback) {
    auto it = options.find(key);
    return (it != options.end()) ? it->second : fallback;
}

bool requireDate(const std::map<std::string, std::string>& options, const std::string& key, TradeDate& out) {
    out = optionOr(options, key, "");
    if (!utils::TradeCalendar::isValid(out)) {
        std::cerr << "--" << key << " YYYY-MM-DD is required\n";
        return false;
    }
    return true;
}

void printCandidates(const std::vector<CandidateRow>& rows,
                     const std::vector<StockMeta>& stock_meta,
                     size_t limit) {
    std::map<StockId, const StockMeta*> meta;
    for (const auto& m : stock_meta) {
        meta[m.stock_id] = &m;
    }
    
    std::cout << std::left
              << std::setw(12) << "trade_date" << std::setw(9) << "stock_id"
              << std::setw(12) << "stock_name" << std::setw(10) << "sector"
              << std::setw(9) << "leader" << std::right
              << std::setw(10) << "total" << std::setw(10) << "sector"
              << std::setw(10) << "leader" << std::setw(10) << "follow"
              << std::setw(10) << "entry" << std::setw(10) << "stop"
              << std::setw(8) << "shares" << std::setw(6) << "lots" << "\n";
    
    const size_t n = std::min(limit, rows.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& r = rows[i];
        auto it = meta.find(r.stock_id);
        const std::string name = (it != meta.end()) ? it->second->stock_name : "";
        std::cout << std::left
                  << std::setw(12) << r.trade_date << std::setw(9) << r.stock_id
                  << std::setw(12) << name << std::setw(10) << r.sector_id
                  << std::setw(9) << r.leader_id << std::right << std::fixed << std::setprecision(3)
                  << std::setw(10) << r.score_total << std::setw(10) << r.score_sector
                  << std::setw(10) << r.score_leader << std::setw(10) << r.score_follow
                  << std::setprecision(2)
                  << std::setw(10) << (r.suggest_entry ? *r.suggest_entry : 0.0)
                  << std::setw(10) << (r.suggest_stop ? *r.suggest_stop : 0.0)
                  << std::setw(8) << (r.shares ? std::to_string(*r.shares) : "-")
                  << std::setw(6) << (r.lots ? std::to_string(*r.lots) : "-") << "\n";
    }
    if (rows.empty()) {
        std::cout << "(no candidates)\n";
    }
}

// --fallback 지정 시 설정 파일의 모드를 덮어씀
engine::EngineConfig engineConfigFor(const Config& config,
                                     const std::map<std::string, std::string>& options,
                                     strategy::FallbackMode default_mode) {
    engine::EngineConfig cfg = config.getEngineConfig();
    cfg.fallback_mode = default_mode;
    auto it = options.find("fallback");
    if (it != options.end()) {
        auto mode = strategy::parseFallbackMode(it->second);
        if (!mode) {
            throw std::invalid_argument("unknown fallback mode '" + it->second + "'");
        }
        cfg.fallback_mode = *mode;
    }
    if (cfg.fallback_mode == strategy::FallbackMode::PERCENTILE && !cfg.leader.top_pct_in_sector) {
        throw std::invalid_argument("percentile fallback requires leader.top_pct_in_sector");
    }
    return cfg;
}

// run/backtest 공통: 파일 기반 입력 구성
engine::MarketInputs loadInputs(const std::map<std::string, std::string>& options,
                                const TradeDate& end_date,
                                int history_days) {
    auto history = backtest::DataHistory::loadMarketHistory(
        optionOr(options, "market-dir", ""), end_date, history_days);
    
    engine::MarketInputs inputs;
    inputs.history = std::move(history.daily_price);
    
    if (options.count("meta")) {
        inputs.stock_meta = backtest::DataHistory::loadStockMeta(
            options.at("meta"), optionOr(options, "sector-col", "industry"));
    } else {
        inputs.stock_meta = std::move(history.stock_meta);
        if (options.count("themes")) {
            const auto mapping = backtest::DataHistory::loadThemesMapping(options.at("themes"));
            backtest::DataHistory::applySectorMapping(inputs.stock_meta, mapping);
        } else {
            LOG_WARN("No --themes or --meta given, every stock is in sector {}", UNKNOWN_SECTOR);
        }
    }
    
    if (options.count("risk-flags")) {
        inputs.risk_flags = backtest::DataHistory::loadRiskFlags(options.at("risk-flags"));
    }
    return inputs;
}

int runDemo(const Config& config, const std::map<std::string, std::string>& options) {
    TradeDate trade_date;
    if (!requireDate(options, "date", trade_date)) {
        return EXIT_USAGE;
    }
    
    const auto market = backtest::SyntheticMarketGenerator::generate(trade_date, config.getDemoConfig());
    engine::MarketInputs inputs;
    inputs.history = market.daily_price;
    inputs.stock_meta = market.stock_meta;
    
    // 주말 입력 시 마지막 영업일로 평가
    TradeDate eval_date = trade_date;
    if (!inputs.history.empty()) {
        eval_date = inputs.history.back().trade_date;
    }
    
    const engine::SelectionEngine selector(
        engineConfigFor(config, options, strategy::FallbackMode::PERMISSIVE));
    const auto result = selector.run(eval_date, inputs);
    printCandidates(result.candidates, inputs.stock_meta, 10);
    return EXIT_OK;
}

int runReal(const Config& config, const std::map<std::string, std::string>& options) {
    TradeDate trade_date;
    if (!requireDate(options, "date", trade_date)) {
        return EXIT_USAGE;
    }
    if (!options.count("market-dir")) {
        std::cerr << "--market-dir is required\n";
        return EXIT_USAGE;
    }
    
    const int history_days = std::stoi(optionOr(options, "history-days", "60"));
    const auto inputs = loadInputs(options, trade_date, history_days);
    
    const engine::SelectionEngine selector(
        engineConfigFor(config, options, config.getEngineConfig().fallback_mode));
    const auto result = selector.run(trade_date, inputs);
    
    for (const auto& row : result.candidates) {
        Logger::getInstance().logCandidate(row);
    }
    
    const std::filesystem::path out_dir = optionOr(options, "out", "results");
    backtest::DataHistory::writeCandidatesCSV(
        (out_dir / ("strategyC_candidates_" + trade_date + ".csv")).string(),
        result.candidates, inputs.stock_meta);
    backtest::DataHistory::writeStrongSectorsCSV(
        (out_dir / ("strong_sectors_" + trade_date + ".csv")).string(),
        result.strong_sectors);
    
    printCandidates(result.candidates, inputs.stock_meta, 10);
    return EXIT_OK;
}

int runBacktest(const Config& config, const std::map<std::string, std::string>& options) {
    TradeDate start_date;
    TradeDate end_date;
    if (!requireDate(options, "start", start_date) || !requireDate(options, "end", end_date)) {
        return EXIT_USAGE;
    }
    if (start_date > end_date) {
        std::cerr << "--start must not be after --end\n";
        return EXIT_USAGE;
    }
    
    engine::MarketInputs inputs;
    if (options.count("market-dir")) {
        inputs = loadInputs(options, end_date, std::stoi(optionOr(options, "history-days", "0")));
    } else {
        const auto market = backtest::SyntheticMarketGenerator::generate(end_date, config.getDemoConfig());
        inputs.history = market.daily_price;
        inputs.stock_meta = market.stock_meta;
    }
    
    const backtest::BacktestEngine bt(
        engineConfigFor(config, options, config.getEngineConfig().fallback_mode),
        config.getBacktestConfig());
    const auto result = bt.run(start_date, end_date, inputs);
    
    std::cout << "trade_date,equity,num_trades,pnl\n";
    for (const auto& p : result.curve) {
        std::cout << p.trade_date << "," << std::fixed << std::setprecision(2)
                  << p.equity << "," << p.num_trades << "," << p.pnl << "\n";
    }
    std::cout << "final_equity=" << result.final_equity
              << " total_trades=" << result.total_trades
              << " max_drawdown=" << std::setprecision(4) << result.max_drawdown << "\n";
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return EXIT_USAGE;
    }
    
    const std::string command = argv[1];
    std::map<std::string, std::string> options;
    if (!parseOptions(argc, argv, options)) {
        printUsage();
        return EXIT_USAGE;
    }
    
    Config& config = Config::getInstance();
    try {
        config.load(optionOr(options, "config", "config/config.json"));
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const ConfigError& e) {
        std::cerr << "configuration error: " << e.what() << std::endl;
        return EXIT_RUNTIME_ERROR;
    } catch (const std::runtime_error& e) {
        std::cerr << "startup error: " << e.what() << std::endl;
        return EXIT_RUNTIME_ERROR;
    }
    
    LOG_INFO("daypick {} (config {}, fallback {})", command, config.getSourcePath(),
             strategy::toString(config.getEngineConfig().fallback_mode));
    
    try {
        if (command == "demo") {
            return runDemo(config, options);
        }
        if (command == "run") {
            return runReal(config, options);
        }
        if (command == "backtest") {
            return runBacktest(config, options);
        }
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid argument: {}", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        LOG_ERROR("{} failed: {}", command, e.what());
        return EXIT_RUNTIME_ERROR;
    }
    
    printUsage();
    return EXIT_USAGE;
}
