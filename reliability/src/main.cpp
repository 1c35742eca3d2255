#include "config.hpp"
#include "digest.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

void setup_logging(const std::string& log_level) {
    // stdout carries the digest, so logs go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("reportguard", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

nlohmann::json load_input(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open input file " + path);
    }
    
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

int main(int argc, char* argv[]) {
    try {
        // Logger first so configuration warnings stay off stdout
        const char* log_level = std::getenv("LOG_LEVEL");
        setup_logging(log_level ? log_level : "info");
        
        Config config = Config::from_env();
        
        spdlog::info("==============================================");
        spdlog::info("ReportGuard {} v1.0", config.service_name);
        spdlog::info("==============================================");
        
        config.validate();
        
        if (argc < 2) {
            spdlog::error("Usage: {} <agent-output.json>", argv[0]);
            return 1;
        }
        
        nlohmann::json input = load_input(argv[1]);
        if (!input.is_array()) {
            input = nlohmann::json::array({input});
        }
        
        DigestBuilder builder(config);
        nlohmann::json digests = nlohmann::json::array();
        
        for (const auto& raw_bundle : input) {
            if (!raw_bundle.is_object()) {
                spdlog::warn("Skipping non-object bundle entry");
                continue;
            }
            
            TickerBundle bundle = TickerBundle::from_json(raw_bundle);
            try {
                digests.push_back(builder.build(bundle));
            } catch (const std::exception& e) {
                // Keep going with the remaining tickers
                spdlog::error("An error occurred while processing {}: {}", bundle.ticker, e.what());
            }
        }
        
        std::cout << digests.dump(2) << std::endl;
        spdlog::info("Processed {} of {} bundles", digests.size(), input.size());
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
