/// @file test_logger.cpp
/// @brief Unit tests for uptime::core::Logger outside the init()/shutdown() span.
///
/// This executable deliberately has no custom main: the engine must run
/// before the application sets up logging.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/logger.hpp"

#include "catalog/catalog_entry.hpp"
#include "schedule/schedule_aggregator.hpp"
#include "visibility/visibility_scanner.hpp"

#include <vector>

using namespace uptime;

namespace
{

constexpr f64 kJan1Jd = 2460310.5;

const visibility::ObservationWindow kDay = {
    .start_jd     = kJan1Jd,
    .end_jd       = kJan1Jd + 1.0,
    .step_seconds = 60.0,
};

} // anonymous namespace

TEST_CASE("Loggers are usable before init")
{
    REQUIRE_FALSE(core::Logger::is_initialized());
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    REQUIRE(core::Logger::get_app_logger() != nullptr);

    UPT_CORE_WARN("dropped: {}", 1);
    UPT_INFO("dropped: {}", 2);
    core::Logger::set_level(spdlog::level::debug);
}

TEST_CASE("compute_visibility runs without logger setup")
{
    REQUIRE_FALSE(core::Logger::is_initialized());

    const std::vector<catalog::Station> stations = {catalog::Station::from_geodetic("JP35", 35.0, 138.0)};
    const std::vector<catalog::Source> sources = {
        {.id = "REF", .ra_deg = 180.0, .dec_deg = 35.0},
        {.id = "BROKEN", .ra_deg = 0.0, .dec_deg = 95.0},
    };

    const auto result = schedule::compute_visibility(stations, sources, kDay, 10.0);
    REQUIRE(result.has_value());
    CHECK(result->pairs.size() == 2);
    CHECK(result->interval_count() == 2);
    CHECK(result->error_count() == 1);

    // Global validation failures log too
    visibility::ObservationWindow zero_step = kDay;
    zero_step.step_seconds = 0.0;
    const auto bad = schedule::compute_visibility(stations, sources, zero_step, 10.0);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == core::ErrorCode::InvalidWindow);
}

TEST_CASE("Loggers fall back again after shutdown")
{
    core::Logger::init("uptime_test_logger.log");
    CHECK(core::Logger::is_initialized());
    CHECK(core::Logger::get_core_logger()->name() == "UPTIME");
    CHECK(core::Logger::get_app_logger()->name() == "APP");

    // A second init keeps the existing loggers
    const auto* before = core::Logger::get_core_logger().get();
    core::Logger::init("uptime_test_logger.log");
    CHECK(core::Logger::get_core_logger().get() == before);

    core::Logger::shutdown();
    CHECK_FALSE(core::Logger::is_initialized());
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    UPT_CORE_INFO("dropped after shutdown");

    const auto track = schedule::ScheduleAggregator::track(
        catalog::Station::from_geodetic("JP35", 35.0, 138.0),
        catalog::Source{.id = "REF", .ra_deg = 180.0, .dec_deg = 35.0},
        kDay);
    CHECK(track.has_value());
}
