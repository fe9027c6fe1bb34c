#include "tradebook/candle_source.hpp"
#include "tradebook/config.hpp"
#include "tradebook/engine.hpp"
#include "tradebook/enricher.hpp"
#include "tradebook/json.hpp"
#include "tradebook/logging.hpp"
#include "tradebook/stats.hpp"
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " FILLS_JSON [options]\n"
              << "\n"
              << "Rebuilds round-trip trades from a venue fills export.\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output FILE    Write trades JSON to FILE (default: stdout)\n"
              << "  -c, --config FILE    JSON config file\n"
              << "  --wallet ADDRESS     Account the fills belong to\n"
              << "  --enrich             Refine MAE/MFE with 1m candles from the venue\n"
              << "  --workers N          Worker threads for trade processing\n"
              << "  --log-level LEVEL    trace, debug, info, warn, error, off\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " fills.json -o trades.json\n"
              << "  " << prog << " fills.json --enrich --workers 4\n";
}

struct Options {
    std::string fills_path;
    std::string output_path;
    std::string config_path;
    std::string wallet;
    std::string log_level;
    std::size_t workers = 0;
    bool enrich = false;
};

Options parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-o" || arg == "--output") {
            options.output_path = next();
        } else if (arg == "-c" || arg == "--config") {
            options.config_path = next();
        } else if (arg == "--wallet") {
            options.wallet = next();
        } else if (arg == "--enrich") {
            options.enrich = true;
        } else if (arg == "--workers") {
            options.workers = std::stoul(next());
        } else if (arg == "--log-level") {
            options.log_level = next();
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + arg);
        } else if (options.fills_path.empty()) {
            options.fills_path = arg;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
    if (options.fills_path.empty()) {
        throw std::runtime_error("No fills file given");
    }
    return options;
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    return nlohmann::json::parse(in);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_default_logger(tradebook::get_logger("tradebook"));

    try {
        Options options = parse_args(argc, argv);

        tradebook::Config config;
        if (!options.config_path.empty()) {
            config = tradebook::load_config(options.config_path);
        }
        if (options.workers > 0) {
            config.engine_workers = options.workers;
            config.enrich_workers = options.workers;
        }
        if (!options.log_level.empty()) {
            config.log_level = options.log_level;
        }
        tradebook::set_log_level(config.log_level);

        auto fills = tradebook::fills_from_json(read_json_file(options.fills_path), options.wallet);
        spdlog::info("Loaded {} fills from {}", fills.size(), options.fills_path);

        tradebook::TradeEngine engine(config.engine_workers);
        auto trades = engine.process(fills);

        if (options.enrich && !trades.empty()) {
            tradebook::HttpCandleSource http(config.api_url, config.http_timeout_sec);
            tradebook::CandleEnricher enricher(http, config.enrich_workers);
            enricher.enrich(trades);
        }

        std::string document = tradebook::trades_to_json(trades).dump(2);
        if (options.output_path.empty()) {
            std::cout << document << std::endl;
            tradebook::print_stats(tradebook::compute_stats(trades), std::cerr);
        } else {
            std::ofstream out(options.output_path);
            if (!out) {
                throw std::runtime_error("Cannot write " + options.output_path);
            }
            out << document << std::endl;
            spdlog::info("Wrote {} trades to {}", trades.size(), options.output_path);
            tradebook::print_stats(tradebook::compute_stats(trades), std::cout);
        }

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
