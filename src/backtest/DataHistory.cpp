#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include "common/TradeCalendar.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace daypick {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }
    return trim(std::move(s));
}

// Quote-aware split; "" inside quotes is an escaped quote
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(normalizeCell(cell));
            cell.clear();
        } else if (c != '\r') {
            cell.push_back(c);
        }
    }
    cells.push_back(normalizeCell(cell));
    return cells;
}

struct CsvTable {
    std::map<std::string, size_t> columns;
    std::vector<std::vector<std::string>> rows;

    bool has(const std::string& name) const { return columns.count(name) > 0; }

    std::string cell(const std::vector<std::string>& row, const std::string& name) const {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= row.size()) {
            return "";
        }
        return row[it->second];
    }
};

bool readCsv(const std::string& file_path, CsvTable& table) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    bool header_done = false;
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        auto cells = splitCsvLine(line);
        if (!header_done) {
            for (size_t i = 0; i < cells.size(); ++i) {
                table.columns[toLower(cells[i])] = i;
            }
            header_done = true;
            continue;
        }
        table.rows.push_back(std::move(cells));
    }
    return header_done;
}

Nullable parseNumber(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), ','), s.end());
    const std::string lower = toLower(s);
    if (s.empty() || lower == "na" || lower == "nan" || lower == "null" || s == "--" || s == "-") {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

NullableFlag parseFlag(const std::string& s) {
    const std::string lower = toLower(s);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "y") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "n") return false;
    return std::nullopt;
}

std::string normalizeDate(std::string s) {
    std::replace(s.begin(), s.end(), '/', '-');
    // "2026-01-05 00:00:00" → "2026-01-05"
    if (s.size() > 10 && utils::TradeCalendar::isValid(s.substr(0, 10))) {
        s = s.substr(0, 10);
    }
    return s;
}

std::string formatNullable(const Nullable& v, int precision) {
    if (!v) {
        return "";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << *v;
    return oss.str();
}

std::string csvEscape(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::ofstream openForWrite(const std::string& file_path) {
    const std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open for writing: " + file_path);
    }
    return out;
}
}

std::vector<DailyBar> DataHistory::loadDailyBarsCSV(const std::string& file_path) {
    std::vector<DailyBar> bars;
    CsvTable table;
    if (!readCsv(file_path, table)) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }
    if (!table.has("stock_id")) {
        LOG_ERROR("CSV file has no stock_id column: {}", file_path);
        return bars;
    }
    
    const std::string date_col = table.has("trade_date") ? "trade_date" : "date";
    
    for (const auto& row : table.rows) {
        DailyBar bar;
        bar.stock_id = table.cell(row, "stock_id");
        if (bar.stock_id.empty()) {
            continue;
        }
        bar.trade_date = normalizeDate(table.cell(row, date_col));
        bar.open = parseNumber(table.cell(row, "open"));
        bar.high = parseNumber(table.cell(row, "high"));
        bar.low = parseNumber(table.cell(row, "low"));
        bar.close = parseNumber(table.cell(row, "close"));
        bar.pct_change = parseNumber(table.cell(row, "pct_change"));
        bar.volume = parseNumber(table.cell(row, "volume"));
        bar.turnover = parseNumber(table.cell(row, "turnover"));
        bar.is_limit_up = parseFlag(table.cell(row, "is_limit_up")).value_or(false);
        bar.is_limit_down = parseFlag(table.cell(row, "is_limit_down")).value_or(false);
        bars.push_back(std::move(bar));
    }
    
    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

DataHistory::MarketHistory DataHistory::loadMarketHistory(const std::string& market_dir,
                                                          const TradeDate& end_date,
                                                          int history_days) {
    const std::filesystem::path dir(market_dir);
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error("market directory not found: " + market_dir);
    }
    
    // market_YYYY-MM-DD.csv
    std::vector<std::pair<TradeDate, std::filesystem::path>> dated;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        const std::string name = entry.path().filename().string();
        if (name.size() != 21 || name.rfind("market_", 0) != 0 || name.substr(17) != ".csv") {
            continue;
        }
        const TradeDate d = name.substr(7, 10);
        if (!utils::TradeCalendar::isValid(d) || d > end_date) {
            continue;
        }
        dated.emplace_back(d, entry.path());
    }
    std::sort(dated.begin(), dated.end());
    if (history_days > 0 && dated.size() > static_cast<size_t>(history_days)) {
        dated.erase(dated.begin(), dated.end() - history_days);
    }
    if (dated.empty()) {
        throw std::runtime_error("No market_*.csv found in " + market_dir);
    }
    
    MarketHistory history;
    for (const auto& [date, path] : dated) {
        auto bars = loadDailyBarsCSV(path.string());
        for (auto& bar : bars) {
            if (bar.trade_date.empty() || !utils::TradeCalendar::isValid(bar.trade_date)) {
                bar.trade_date = date;
            }
            history.daily_price.push_back(std::move(bar));
        }
    }
    
    // 최신 파일의 종목 정보
    CsvTable latest;
    if (readCsv(dated.back().second.string(), latest) && latest.has("stock_id")) {
        std::map<StockId, bool> seen;
        const std::string name_col = latest.has("stock_name") ? "stock_name" : "name";
        for (const auto& row : latest.rows) {
            StockMeta meta;
            meta.stock_id = latest.cell(row, "stock_id");
            if (meta.stock_id.empty() || seen[meta.stock_id]) {
                continue;
            }
            seen[meta.stock_id] = true;
            meta.stock_name = latest.cell(row, name_col);
            meta.market = latest.cell(row, "market");
            history.stock_meta.push_back(std::move(meta));
        }
    }
    
    LOG_INFO("Market history: {} files ({} ~ {}), {} rows, {} stocks",
             dated.size(), dated.front().first, dated.back().first,
             history.daily_price.size(), history.stock_meta.size());
    return history;
}

std::map<StockId, SectorId> DataHistory::loadThemesMapping(const std::string& file_path) {
    CsvTable table;
    if (!readCsv(file_path, table)) {
        throw std::runtime_error("cannot open themes mapping: " + file_path);
    }
    if (!table.has("stock_id") || !table.has("themes")) {
        throw std::runtime_error("themes mapping must have columns: stock_id,themes");
    }
    
    std::map<StockId, SectorId> mapping;
    for (const auto& row : table.rows) {
        const std::string stock_id = table.cell(row, "stock_id");
        if (stock_id.empty()) continue;
        std::string themes = table.cell(row, "themes");
        const auto sep = themes.find(';');
        SectorId first = trim(themes.substr(0, sep));
        mapping[stock_id] = first.empty() ? UNKNOWN_SECTOR : first;
    }
    LOG_INFO("Themes mapping: {} stocks", mapping.size());
    return mapping;
}

void DataHistory::applySectorMapping(std::vector<StockMeta>& stock_meta,
                                     const std::map<StockId, SectorId>& mapping) {
    for (auto& meta : stock_meta) {
        auto it = mapping.find(meta.stock_id);
        meta.sector_id = (it != mapping.end()) ? it->second : UNKNOWN_SECTOR;
    }
}

std::vector<StockMeta> DataHistory::loadStockMeta(const std::string& file_path,
                                                  const std::string& sector_column) {
    CsvTable table;
    if (!readCsv(file_path, table)) {
        throw std::runtime_error("cannot open stock metadata: " + file_path);
    }
    const std::string sector_col = toLower(sector_column);
    if (!table.has("stock_id") || !table.has(sector_col)) {
        throw std::runtime_error("stock metadata must have columns stock_id and " + sector_column);
    }
    
    const std::string name_col = table.has("stock_name") ? "stock_name" : "name";
    std::vector<StockMeta> out;
    for (const auto& row : table.rows) {
        StockMeta meta;
        meta.stock_id = table.cell(row, "stock_id");
        if (meta.stock_id.empty()) continue;
        meta.stock_name = table.cell(row, name_col);
        meta.market = table.cell(row, "market");
        const std::string sector = table.cell(row, sector_col);
        meta.sector_id = sector.empty() ? UNKNOWN_SECTOR : sector;
        out.push_back(std::move(meta));
    }
    return out;
}

std::vector<RiskFlags> DataHistory::loadRiskFlags(const std::string& file_path) {
    CsvTable table;
    if (!readCsv(file_path, table)) {
        throw std::runtime_error("cannot open risk flags: " + file_path);
    }
    if (!table.has("stock_id")) {
        throw std::runtime_error("risk flags must have a stock_id column");
    }
    
    std::vector<RiskFlags> out;
    for (const auto& row : table.rows) {
        RiskFlags flags;
        flags.stock_id = table.cell(row, "stock_id");
        if (flags.stock_id.empty()) continue;
        flags.is_disposed = parseFlag(table.cell(row, "is_disposed"));
        flags.is_full_margin = parseFlag(table.cell(row, "is_full_margin"));
        flags.liquidity_score = parseNumber(table.cell(row, "liquidity_score"));
        flags.is_blacklist = parseFlag(table.cell(row, "is_blacklist"));
        out.push_back(std::move(flags));
    }
    LOG_INFO("Risk flags: {} stocks", out.size());
    return out;
}

const std::vector<std::string>& DataHistory::candidateColumns() {
    static const std::vector<std::string> columns = {
        "trade_date", "stock_id", "leader_id", "sector_id",
        "score_sector", "score_leader", "score_follow", "score_total",
        "suggest_entry", "suggest_stop", "position_value", "shares", "lots",
    };
    return columns;
}

void DataHistory::writeCandidatesCSV(const std::string& file_path,
                                     const std::vector<CandidateRow>& rows,
                                     const std::vector<StockMeta>& stock_meta) {
    std::map<StockId, const StockMeta*> meta;
    for (const auto& m : stock_meta) {
        meta[m.stock_id] = &m;
    }
    
    auto out = openForWrite(file_path);
    for (const auto& col : candidateColumns()) {
        out << col << ",";
    }
    out << "stock_name,market\n";
    
    for (const auto& r : rows) {
        out << r.trade_date << ","
            << csvEscape(r.stock_id) << ","
            << csvEscape(r.leader_id) << ","
            << csvEscape(r.sector_id) << ","
            << formatNullable(r.score_sector, 6) << ","
            << formatNullable(r.score_leader, 6) << ","
            << formatNullable(r.score_follow, 6) << ","
            << formatNullable(r.score_total, 6) << ","
            << formatNullable(r.suggest_entry, 4) << ","
            << formatNullable(r.suggest_stop, 4) << ","
            << formatNullable(r.position_value, 2) << ","
            << (r.shares ? std::to_string(*r.shares) : "") << ","
            << (r.lots ? std::to_string(*r.lots) : "") << ",";
        auto it = meta.find(r.stock_id);
        if (it != meta.end()) {
            out << csvEscape(it->second->stock_name) << "," << csvEscape(it->second->market);
        } else {
            out << ",";
        }
        out << "\n";
    }
    LOG_INFO("Wrote {} candidates to {}", rows.size(), file_path);
}

void DataHistory::writeStrongSectorsCSV(const std::string& file_path,
                                        const std::vector<SectorScore>& sectors) {
    auto out = openForWrite(file_path);
    out << "sector_id,sector_score,avg_pct_change,up_ratio,sector_mtm_z\n";
    for (const auto& s : sectors) {
        out << csvEscape(s.sector_id) << ","
            << formatNullable(s.sector_score, 6) << ","
            << formatNullable(s.avg_pct_change, 4) << ","
            << formatNullable(s.up_ratio, 4) << ","
            << formatNullable(s.sector_mtm_z, 4) << "\n";
    }
}

} // namespace backtest
} // namespace daypick
