#include <cstdlib>
#include <exception>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "data/consolidator.hpp"
#include "data/csv_bars.hpp"
#include "exec/position_tracker.hpp"
#include "strategy/engine.hpp"

using json = nlohmann::json;

namespace {

struct Args {
    std::string csv;
    std::string config;      // empty = defaults
    std::string trades_out;  // empty = no trade log
    int minutes{0};          // 0 = feed bars as they are
    double cash{100000.0};
    double fee{0.0};
    bool verbose{false};
};

void usage(){
    fmt::print("usage: tqbands_backtest <bars.csv> [config.json] [--minutes N] [--cash C]\n"
               "                        [--fee RATE] [--trades out.json] [--verbose]\n");
}

bool parse_args(int argc, char** argv, Args& a){
    std::vector<std::string> pos;
    for (int i=1;i<argc;++i){
        const std::string s = argv[i];
        auto next = [&](const char* name) -> std::string {
            if (i+1 >= argc) throw std::invalid_argument(std::string(name) + " needs a value");
            return argv[++i];
        };
        if (s == "--minutes")      a.minutes = std::stoi(next("--minutes"));
        else if (s == "--cash")    a.cash = std::stod(next("--cash"));
        else if (s == "--fee")     a.fee = std::stod(next("--fee"));
        else if (s == "--trades")  a.trades_out = next("--trades");
        else if (s == "--verbose" || s == "-v") a.verbose = true;
        else if (s == "--help" || s == "-h") return false;
        else pos.push_back(s);
    }
    if (pos.empty() || pos.size() > 2) return false;
    a.csv = pos[0];
    if (pos.size() == 2) a.config = pos[1];
    return true;
}

} // namespace

int main(int argc, char** argv){
    Args args;
    try {
        if (!parse_args(argc, argv, args)) { usage(); return 1; }
    } catch (const std::exception& e) {
        spdlog::error("bad arguments: {}", e.what());
        usage();
        return 1;
    }
    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    core::StrategyConfig cfg;
    std::vector<core::Bar> raw;
    try {
        if (!args.config.empty()) cfg = core::load_config(args.config);
        raw = data::load_csv_bars(args.csv);
    } catch (const core::ConfigError& e) {
        spdlog::error("config: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    if (raw.empty()) { spdlog::error("no bars in {}", args.csv); return 2; }

    std::vector<core::Bar> bars;
    if (args.minutes > 0) {
        data::Consolidator cons(args.minutes);
        for (const auto& b : raw) if (auto c = cons.push(b)) bars.push_back(*c);
        if (auto c = cons.flush()) bars.push_back(*c);
        spdlog::info("consolidated {} bars into {} x {}m", raw.size(), bars.size(), args.minutes);
        if (cons.dropped()) spdlog::warn("{} late bars dropped during consolidation", cons.dropped());
    } else {
        bars = std::move(raw);
    }

    std::unique_ptr<strategy::Engine> engine;
    try {
        engine = std::make_unique<strategy::Engine>(cfg);
    } catch (const core::ConfigError& e) {
        spdlog::error("config: {}", e.what());
        return 2;
    }
    spdlog::info("{} bars, warmup {}", bars.size(), engine->warmup_bars());

    exec::PositionTracker book(args.cash, args.fee);
    json trade_log = json::array();
    std::size_t rejected = 0;

    for (const auto& b : bars) {
        core::Intents intents;
        try {
            intents = engine->on_bar(b);
        } catch (const core::OutOfOrderBar& e) {
            spdlog::warn("skipping bar: {}", e.what());
            ++rejected;
            continue;
        }
        for (const auto& t : intents) {
            const auto f = book.apply(t, b.close);
            if (!args.trades_out.empty())
                trade_log.push_back(json{
                    {"timestamp_ms", b.timestamp_ms},
                    {"action", core::to_string(t.action)},
                    {"side", core::to_string(t.side)},
                    {"mode", core::to_string(t.mode)},
                    {"size_fraction", t.size_fraction},
                    {"qty", f.qty},
                    {"price", f.price},
                    {"realized", f.realized},
                });
        }
        book.mark(b.close);
    }

    const double last = bars.back().close;
    const auto& st = engine->state();
    spdlog::info("open counters: rev L{} S{} / brk L{} S{}",
                 st.reversion_long, st.reversion_short, st.breakout_long, st.breakout_short);
    if (rejected) spdlog::warn("{} out-of-order bars rejected", rejected);

    fmt::print("Final equity: {:.2f} | Realized: {:.2f} | Fees: {:.2f} | Trades: {} | Win: {:.1f}% | MaxDD: {:.2f}%\n",
               book.equity(last), book.realized_pnl(), book.fees_paid(), book.round_trips(),
               book.round_trips() ? 100.0*book.wins()/book.round_trips() : 0.0,
               book.max_drawdown()*100.0);

    if (!args.trades_out.empty()) {
        std::ofstream out(args.trades_out);
        if (!out.good()) { spdlog::error("cannot write {}", args.trades_out); return 3; }
        out << trade_log.dump(2) << '\n';
        spdlog::info("{} fills written to {}", trade_log.size(), args.trades_out);
    }
    return 0;
}
