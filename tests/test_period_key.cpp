/**
 * @file test_period_key.cpp
 * @brief Unit tests for PeriodKey parsing and ordering
 */

#include <catch2/catch_test_macros.hpp>
#include "schema/period_key.hpp"
#include <stdexcept>

using namespace fundmetrics::schema;

TEST_CASE("PeriodKey parses dates", "[PeriodKey]") {
    SECTION("ISO date") {
        auto key = PeriodKey::parse("2024-03-31");
        REQUIRE(key);
        REQUIRE(key->format() == PeriodFormat::DATE);
        REQUIRE(key->to_string() == "2024-03-31");
    }

    SECTION("Alternative separators and day-first forms normalise to ISO") {
        REQUIRE(PeriodKey::parse("2024/03/31")->to_string() == "2024-03-31");
        REQUIRE(PeriodKey::parse("31-03-2024")->to_string() == "2024-03-31");
        REQUIRE(PeriodKey::parse("31/03/2024")->to_string() == "2024-03-31");
    }

    SECTION("Trailing time part is ignored") {
        REQUIRE(PeriodKey::parse("2024-03-31 00:00:00")->to_string() == "2024-03-31");
        REQUIRE(PeriodKey::parse("2024-03-31T10:15")->to_string() == "2024-03-31");
    }

    SECTION("Impossible calendar dates are rejected") {
        REQUIRE_FALSE(PeriodKey::parse("2023-02-29"));
        REQUIRE(PeriodKey::parse("2024-02-29"));
        REQUIRE_FALSE(PeriodKey::parse("2024-13-01"));
    }
}

TEST_CASE("PeriodKey parses year-month codes", "[PeriodKey]") {
    auto key = PeriodKey::parse("202403");
    REQUIRE(key);
    REQUIRE(key->format() == PeriodFormat::YEAR_MONTH);
    REQUIRE(key->year() == 2024);
    REQUIRE(key->month() == 3);
    REQUIRE(key->to_string() == "202403");

    REQUIRE(PeriodKey::parse("202403.0")->to_string() == "202403");
    REQUIRE_FALSE(PeriodKey::parse("202413"));
    REQUIRE_FALSE(PeriodKey::parse("180012"));
}

TEST_CASE("PeriodKey parses fiscal years", "[PeriodKey]") {
    SECTION("Long form requires consecutive years") {
        auto key = PeriodKey::parse("2023-24");
        REQUIRE(key);
        REQUIRE(key->format() == PeriodFormat::FISCAL_YEAR);
        REQUIRE(key->year() == 2023);
        REQUIRE(key->to_string() == "2023-24");

        REQUIRE_FALSE(PeriodKey::parse("2023-25"));
        REQUIRE(PeriodKey::parse("1999-00")->to_string() == "1999-00");
    }

    SECTION("Short form names the year ending in March") {
        REQUIRE(PeriodKey::parse("FY2024")->to_string() == "2023-24");
        REQUIRE(PeriodKey::parse("FY 2024")->to_string() == "2023-24");
        REQUIRE(PeriodKey::parse("fy2024")->to_string() == "2023-24");
    }
}

TEST_CASE("PeriodKey rejects non-period text", "[PeriodKey]") {
    REQUIRE_FALSE(PeriodKey::parse(""));
    REQUIRE_FALSE(PeriodKey::parse("nan"));
    REQUIRE_FALSE(PeriodKey::parse("Company Name"));
    REQUIRE_FALSE(PeriodKey::parse("Q1 2024"));
    REQUIRE_FALSE(PeriodKey::parse("12345"));
}

TEST_CASE("PeriodKey factories validate", "[PeriodKey]") {
    REQUIRE_THROWS_AS(PeriodKey::date(2023, 2, 29), std::invalid_argument);
    REQUIRE_THROWS_AS(PeriodKey::year_month(2024, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(PeriodKey::fiscal_year(1800), std::invalid_argument);
}

TEST_CASE("PeriodKey ordering", "[PeriodKey]") {
    SECTION("Within a format, later periods compare greater") {
        REQUIRE(PeriodKey::year_month(2024, 3) > PeriodKey::year_month(2023, 12));
        REQUIRE(PeriodKey::date(2024, 3, 31) > PeriodKey::date(2024, 3, 30));
        REQUIRE(PeriodKey::fiscal_year(2023) > PeriodKey::fiscal_year(2022));
    }

    SECTION("Format orders first") {
        REQUIRE(PeriodKey::date(2030, 1, 1) < PeriodKey::year_month(1990, 1));
    }

    SECTION("Equality") {
        REQUIRE(*PeriodKey::parse("2024/03/31") == PeriodKey::date(2024, 3, 31));
        REQUIRE(PeriodKey::year_month(2024, 3) != PeriodKey::year_month(2024, 6));
    }
}

TEST_CASE("at_or_before compares across formats by month", "[PeriodKey]") {
    const auto march = PeriodKey::year_month(2024, 3);

    REQUIRE(at_or_before(PeriodKey::date(2024, 3, 31), march));
    REQUIRE(at_or_before(PeriodKey::date(2023, 12, 31), march));
    REQUIRE_FALSE(at_or_before(PeriodKey::date(2024, 4, 1), march));

    // FY 2023-24 ends in March 2024
    REQUIRE(at_or_before(PeriodKey::fiscal_year(2023), march));
    REQUIRE_FALSE(at_or_before(PeriodKey::fiscal_year(2024), march));

    REQUIRE(at_or_before(march, march));
    REQUIRE_FALSE(at_or_before(PeriodKey::year_month(2024, 6), march));
}
