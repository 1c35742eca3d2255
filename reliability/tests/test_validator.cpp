#include <catch2/catch_test_macros.hpp>
#include "../src/validator.hpp"
#include <limits>

namespace {
PriceAnalysis reliable_price_analysis() {
    PriceAnalysis pa;
    pa.total_return_percent = 15.0;
    pa.volatility = 20.0;
    pa.min_price = 100.0;
    pa.max_price = 200.0;
    pa.average_volume = 1000.0;
    pa.trend_direction = "upward";
    return pa;
}

VolatilityMetrics valid_metrics() {
    VolatilityMetrics vm;
    vm.historical_volatility = 30.0;
    vm.max_drawdown = -20.0;
    return vm;
}
}

TEST_CASE("Price analysis reliability", "[validator]") {
    SECTION("Well-formed record is reliable") {
        REQUIRE(RecordValidator::is_price_analysis_reliable(reliable_price_analysis()));
    }
    
    SECTION("Absent record or missing fields") {
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(std::nullopt));
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(PriceAnalysis{}));
        
        auto pa = reliable_price_analysis();
        pa.average_volume.reset();
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
    }
    
    SECTION("Trend label is not required") {
        auto pa = reliable_price_analysis();
        pa.trend_direction.reset();
        REQUIRE(RecordValidator::is_price_analysis_reliable(pa));
    }
    
    SECTION("Total return bound") {
        auto pa = reliable_price_analysis();
        pa.total_return_percent = -400.0;
        REQUIRE(RecordValidator::is_price_analysis_reliable(pa));
        pa.total_return_percent = 400.1;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
        pa.total_return_percent = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
    }
    
    SECTION("Volatility bounds") {
        auto pa = reliable_price_analysis();
        pa.volatility = 200.0;
        REQUIRE(RecordValidator::is_price_analysis_reliable(pa));
        pa.volatility = 200.5;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
        pa.volatility = -0.1;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
    }
    
    SECTION("Price bounds") {
        auto pa = reliable_price_analysis();
        pa.min_price = 200.0;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
        pa.min_price = 250.0;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
        pa.min_price = 0.0;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
    }
    
    SECTION("Maximum price must be positive") {
        auto pa = reliable_price_analysis();
        pa.max_price = 0.0;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
        pa.max_price = -5.0;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
    }
    
    SECTION("Average volume must be positive") {
        auto pa = reliable_price_analysis();
        pa.average_volume = 0.0;
        REQUIRE_FALSE(RecordValidator::is_price_analysis_reliable(pa));
    }
}

TEST_CASE("Volatility metrics validity", "[validator]") {
    SECTION("Well-formed metrics without advisory fields") {
        REQUIRE(RecordValidator::is_valid_volatility_metrics(valid_metrics()));
    }
    
    SECTION("Absent record") {
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(std::nullopt));
    }
    
    SECTION("Historical volatility bounds") {
        auto vm = valid_metrics();
        vm.historical_volatility = 250.0;
        REQUIRE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.historical_volatility = 251.0;
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.historical_volatility = -0.1;
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.historical_volatility.reset();
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(vm));
    }
    
    SECTION("Max drawdown bounds") {
        auto vm = valid_metrics();
        vm.max_drawdown = 0.0;
        REQUIRE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.max_drawdown = -100.0;
        REQUIRE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.max_drawdown = 0.5;
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.max_drawdown = -100.5;
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(vm));
        vm.max_drawdown.reset();
        REQUIRE_FALSE(RecordValidator::is_valid_volatility_metrics(vm));
    }
}
