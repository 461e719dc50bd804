#include "backtester.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "example_sma_strategy.hpp"
#include "report.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

// Default strategy parameters (overridable via CLI)
constexpr int DEFAULT_SMA_FAST = 9;
constexpr int DEFAULT_SMA_SLOW = 21;
constexpr double DEFAULT_SMA_SIZE = 0.5;

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_path = "data/sample_ohlc.csv";
    std::string strategy_name = "sma_crossover";
    std::string symbol;
    std::string reports_dir = "reports";
    double starting_equity = ledgerbt::DEFAULT_STARTING_EQUITY;
    double periods_per_year = ledgerbt::TRADING_DAYS_PER_YEAR;

    int sma_fast = DEFAULT_SMA_FAST;
    int sma_slow = DEFAULT_SMA_SLOW;
    double sma_size = DEFAULT_SMA_SIZE;
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

void printUsage(std::ostream& out) {
    out << "Usage: ledger_backtest [--data FILE] [--symbol NAME] [--strategy sma_crossover]\n"
           "                       [--cash N] [--fast N] [--slow N] [--size F]\n"
           "                       [--periods-per-year N] [--reports-dir DIR]\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing = [&]() { error_msg = "Missing value for " + arg; return false; };

        if (arg == "--data") { if (!next()) return missing(); cfg.data_path = argv[i]; }
        else if (arg == "--strategy") { if (!next()) return missing(); cfg.strategy_name = argv[i]; }
        else if (arg == "--symbol") { if (!next()) return missing(); cfg.symbol = argv[i]; }
        else if (arg == "--reports-dir") { if (!next()) return missing(); cfg.reports_dir = argv[i]; }
        else if (arg == "--cash") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.starting_equity, error_msg, "--cash")) return false; }
        else if (arg == "--periods-per-year") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.periods_per_year, error_msg, "--periods-per-year")) return false; }
        else if (arg == "--fast") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.sma_fast, error_msg, "--fast")) return false; }
        else if (arg == "--slow") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.sma_slow, error_msg, "--slow")) return false; }
        else if (arg == "--size") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.sma_size, error_msg, "--size")) return false; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (cfg.starting_equity < 0) { error_msg = "starting equity (--cash) must be >= 0"; return false; }
    if (cfg.periods_per_year <= 0) { error_msg = "--periods-per-year must be > 0"; return false; }
    if (cfg.sma_fast < 1) { error_msg = "--fast must be >= 1"; return false; }
    if (cfg.sma_slow < 1) { error_msg = "--slow must be >= 1"; return false; }
    if (cfg.sma_fast >= cfg.sma_slow) { error_msg = "--fast must be smaller than --slow"; return false; }
    if (cfg.sma_size <= 0 || cfg.sma_size > 1) { error_msg = "--size must be in (0, 1] (fraction of equity)"; return false; }
    return true;
}

//-----------------------------------------------------------------------------
// Strategy factory: one place to create strategy + params string
//-----------------------------------------------------------------------------
std::pair<std::unique_ptr<ledgerbt::IStrategy>, std::string> createStrategy(const Config& cfg) {
    using namespace ledgerbt;
    std::unique_ptr<IStrategy> strat;
    std::string params;

    if (cfg.strategy_name == "sma_crossover") {
        strat = createSmaCrossoverStrategy(cfg.sma_fast, cfg.sma_slow, cfg.sma_size);
        params = "fast=" + std::to_string(cfg.sma_fast) + " slow=" + std::to_string(cfg.sma_slow) + " size=" + std::to_string(cfg.sma_size);
    }

    return { std::move(strat), params };
}

//-----------------------------------------------------------------------------
// Run, report, write files
//-----------------------------------------------------------------------------
int runBacktest(const Config& cfg,
                std::unique_ptr<ledgerbt::IStrategy> strategy,
                const std::string& strategy_params) {
    using namespace ledgerbt;

    DataSource data(cfg.data_path);
    if (!data.load()) {
        std::cerr << "Failed to load bars (check data file: " << cfg.data_path << ")\n";
        return 1;
    }

    std::unique_ptr<Backtester> bt;
    try {
        bt = std::make_unique<Backtester>(data.takeBars(), std::move(strategy),
                                          cfg.starting_equity, cfg.symbol);
        bt->run();
    } catch (const BacktestError& e) {
        std::cerr << "Backtest aborted: " << e.what() << "\n";
        if (bt)
            std::cerr << "Ledger at abort: " << bt->ledger().size() << " positions, cash "
                      << bt->cash() << "\n";
        return 1;
    }

    if (!bt->symbol().empty()) std::cout << "Symbol: " << bt->symbol() << "\n";
    Stats stats = bt->stats(cfg.periods_per_year);
    Report report(bt->pnl(), bt->ledger(), stats, cfg.strategy_name, strategy_params);
    report.printSummary(std::cout);

    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Failed to create reports directory " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    bool ok = report.writeLedger((fs::path(cfg.reports_dir) / "trades.csv").string());
    ok = report.writePnlTable((fs::path(cfg.reports_dir) / "pnl.csv").string()) && ok;
    ok = report.writeReport((fs::path(cfg.reports_dir) / "report.txt").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data path when running from build/
    if (!(fs::exists(cfg.data_path) && fs::is_regular_file(cfg.data_path)) &&
         fs::exists("../data/sample_ohlc.csv") && fs::is_regular_file("../data/sample_ohlc.csv"))
        cfg.data_path = "../data/sample_ohlc.csv";

    auto [strategy, strategy_params] = createStrategy(cfg);
    if (!strategy) {
        std::cerr << "Unknown strategy: " << cfg.strategy_name << "\n";
        std::cerr << "Available: sma_crossover\n";
        return 1;
    }

    return runBacktest(cfg, std::move(strategy), strategy_params);
}
