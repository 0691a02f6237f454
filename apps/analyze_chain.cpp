#include <chrono>
#include <iostream>
#include <string>
#include "chain_risk/core/logger.hpp"
#include "chain_risk/core/time_utils.hpp"
#include "chain_risk/data/chain_loader.hpp"
#include "chain_risk/data/report_serializer.hpp"
#include "chain_risk/options/analysis_config.hpp"
#include "chain_risk/options/analysis_engine.hpp"

using namespace chain_risk;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <chain.json> [--expiry YYYY-MM-DD | --days N] [--config analysis.json]"
                 " [--symbol SYM] [--out report.json] [--log-level LEVEL]"
              << std::endl;
    std::cerr << "Example: " << program << " spy_chain.json --expiry 2026-12-18 --symbol SPY"
              << std::endl;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string chain_path;
        std::string expiry_date;
        std::string config_path;
        std::string symbol;
        std::string out_path;
        std::string log_level = "INFO";
        int days_to_expiry = -1;
        bool days_given = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--expiry" && has_value) {
                expiry_date = argv[++i];
            } else if (arg == "--days" && has_value) {
                try {
                    days_to_expiry = std::stoi(argv[++i]);
                    days_given = true;
                } catch (const std::exception&) {
                    std::cerr << "Invalid day count: " << argv[i] << std::endl;
                    return 1;
                }
            } else if (arg == "--config" && has_value) {
                config_path = argv[++i];
            } else if (arg == "--symbol" && has_value) {
                symbol = argv[++i];
            } else if (arg == "--out" && has_value) {
                out_path = argv[++i];
            } else if (arg == "--log-level" && has_value) {
                log_level = argv[++i];
            } else if (chain_path.empty() && arg.rfind("--", 0) != 0) {
                chain_path = arg;
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (chain_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        // Console logging would interleave with a report written to stdout
        LoggerConfig logger_config;
        auto level = level_from_string(log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << log_level << std::endl;
            return 1;
        }
        logger_config.min_level = *level;
        logger_config.destination = out_path.empty() ? LogDestination::FILE : LogDestination::BOTH;
        logger_config.log_directory = "logs";
        logger_config.filename_prefix = "analyze_chain";
        Logger::instance().initialize(logger_config);

        if (!Logger::instance().is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("analyze_chain");

        options::AnalysisConfig config;
        if (!config_path.empty()) {
            auto load_result = config.load_from_file(config_path);
            if (load_result.is_error()) {
                std::cerr << "Failed to load config: " << load_result.error()->what()
                          << std::endl;
                return 1;
            }
            INFO("Loaded analysis config from " << config_path);
        }

        auto snapshot_result = ChainLoader::load_file(chain_path, symbol);
        if (snapshot_result.is_error()) {
            std::cerr << "Failed to load option chain: " << snapshot_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        ChainSnapshot snapshot = snapshot_result.value();
        if (!expiry_date.empty()) {
            snapshot.expiry_date = expiry_date;
        }

        if (!days_given) {
            if (snapshot.expiry_date.empty()) {
                std::cerr << "No expiry date in " << chain_path
                          << "; pass --expiry or --days" << std::endl;
                return 1;
            }
            auto days_result =
                core::days_until(snapshot.expiry_date, std::chrono::system_clock::now());
            if (days_result.is_error()) {
                std::cerr << "Invalid expiry date: " << days_result.error()->what() << std::endl;
                return 1;
            }
            days_to_expiry = days_result.value();
        }

        options::AnalysisEngine engine(config);
        auto analysis_result = engine.analyze(snapshot, days_to_expiry);
        if (analysis_result.is_error()) {
            ERROR("Analysis failed: " << analysis_result.error()->to_string());
            std::cerr << "Analysis failed: " << analysis_result.error()->to_string() << std::endl;
            return 1;
        }

        if (out_path.empty()) {
            std::cout << ReportSerializer::to_json(analysis_result.value()).dump(2) << std::endl;
        } else {
            auto save_result = ReportSerializer::save_to_file(analysis_result.value(), out_path);
            if (save_result.is_error()) {
                std::cerr << "Failed to write report: " << save_result.error()->what()
                          << std::endl;
                return 1;
            }
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
