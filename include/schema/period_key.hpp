/**
 * @file period_key.hpp
 * @brief Semantic time label of a time-series column
 */

#ifndef FUNDMETRICS_SCHEMA_PERIOD_KEY_HPP
#define FUNDMETRICS_SCHEMA_PERIOD_KEY_HPP

#include "schema/category.hpp"
#include <optional>
#include <string>

namespace fundmetrics {
namespace schema {

/**
 * @class PeriodKey
 * @brief Date, year-month code, or fiscal-year label
 *
 * Keys are totally ordered: first by format, then chronologically within
 * a format. Within one category every key shares one format, so the
 * format-first rule only matters when keys of different kinds are mixed
 * in one container.
 *
 * Canonical text forms:
 * - DATE:        2024-12-31
 * - YEAR_MONTH:  202412
 * - FISCAL_YEAR: 2023-24 (April 2023 to March 2024)
 */
class PeriodKey {
public:
    /**
     * @brief Calendar date
     * @throws std::invalid_argument if the date does not exist
     */
    static PeriodKey date(int year, int month, int day);

    /**
     * @brief Year-month code
     * @throws std::invalid_argument if year is outside 1900..2100 or month outside 1..12
     */
    static PeriodKey year_month(int year, int month);

    /**
     * @brief Fiscal year starting in April of start_year
     * @throws std::invalid_argument if start_year is outside 1900..2100
     */
    static PeriodKey fiscal_year(int start_year);

    /**
     * @brief Parse a header cell into a period key
     *
     * Tries, in priority order: dates (ISO, YYYY/MM/DD, DD-MM-YYYY,
     * DD/MM/YYYY, each optionally followed by a time part), six-digit
     * year-month codes, then fiscal-year labels.
     *
     * @param text Raw cell text
     * @return Parsed key, or std::nullopt if no format matches
     */
    static std::optional<PeriodKey> parse(const std::string& text);

    PeriodFormat format() const { return format_; }
    int year() const { return year_; }     ///< Calendar year, or fiscal start year
    int month() const { return month_; }   ///< 0 for fiscal years
    int day() const { return day_; }       ///< 0 unless DATE

    /**
     * @brief Months since year 0 of the last month the key covers
     *
     * Used to compare keys of different formats. A fiscal year maps to
     * March of its end year.
     */
    int month_index() const;

    /// Canonical text form
    std::string to_string() const;

    friend bool operator==(const PeriodKey& a, const PeriodKey& b);
    friend bool operator!=(const PeriodKey& a, const PeriodKey& b);
    friend bool operator<(const PeriodKey& a, const PeriodKey& b);
    friend bool operator>(const PeriodKey& a, const PeriodKey& b);
    friend bool operator<=(const PeriodKey& a, const PeriodKey& b);
    friend bool operator>=(const PeriodKey& a, const PeriodKey& b);

private:
    PeriodKey(PeriodFormat format, int year, int month, int day)
        : format_(format), year_(year), month_(month), day_(day) {}

    PeriodFormat format_;
    int year_;
    int month_;
    int day_;
};

/**
 * @brief True if key falls at or before cutoff
 *
 * Keys of the same format compare exactly; keys of different formats
 * compare at month granularity.
 */
bool at_or_before(const PeriodKey& key, const PeriodKey& cutoff);

/// True if year/month/day is a real calendar date
bool is_valid_date(int year, int month, int day);

} // namespace schema
} // namespace fundmetrics

#endif // FUNDMETRICS_SCHEMA_PERIOD_KEY_HPP
