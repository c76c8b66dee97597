/**
 * @file category.hpp
 * @brief Closed catalogue of column categories and data kinds
 *
 * The canonical category order defines export block order. Appending a
 * category is safe; reordering shifts every downstream column position.
 */

#ifndef FUNDMETRICS_SCHEMA_CATEGORY_HPP
#define FUNDMETRICS_SCHEMA_CATEGORY_HPP

#include <string>
#include <vector>

namespace fundmetrics {
namespace schema {

/**
 * @enum Category
 * @brief One financial measure family, or one of the two fixed blocks
 */
enum class Category {
    IDENTITY,
    MARKET_CAP,
    MARKET_CAP_FREE_FLOAT,
    TTM_REVENUE,
    TTM_REVENUE_FREE_FLOAT,
    TTM_PAT,
    TTM_PAT_FREE_FLOAT,
    QUARTERLY_REVENUE,
    QUARTERLY_REVENUE_FREE_FLOAT,
    QUARTERLY_PAT,
    QUARTERLY_PAT_FREE_FLOAT,
    ROCE,
    ROE,
    RETENTION,
    SHARE_PRICE,
    PRICE_TO_REVENUE,
    PRICE_TO_EARNINGS,
    IDENTIFIERS
};

/**
 * @enum DataKind
 * @brief Stored record family; each time-series category is one field of one kind
 */
enum class DataKind {
    VALUATION,   ///< Market cap snapshots, dated
    TRAILING,    ///< Trailing-twelve-month financials, year-month
    QUARTERLY,   ///< Quarterly financials, year-month
    ANNUAL,      ///< Annual ratios, fiscal year
    PRICE        ///< Share price and price ratios, dated
};

/**
 * @enum PeriodFormat
 * @brief Variant of a period key; one per data kind
 */
enum class PeriodFormat {
    DATE,
    YEAR_MONTH,
    FISCAL_YEAR
};

/**
 * @enum IdentityField
 * @brief Columns of the IDENTITY block, in block order
 */
enum class IdentityField {
    NAME,
    CODE,
    SECTOR,
    CAP,
    FREE_FLOAT
};

/**
 * @enum IdentifierField
 * @brief Columns of the IDENTIFIERS block, in block order
 */
enum class IdentifierField {
    BSE_CODE,
    NSE_CODE,
    ISIN
};

/// All categories in canonical export order
const std::vector<Category>& canonical_category_order();

/// All data kinds in a stable order
const std::vector<DataKind>& all_data_kinds();

/// True for every category except IDENTITY and IDENTIFIERS
bool is_time_series(Category category);

/**
 * @brief Data kind storing a time-series category
 * @throws std::invalid_argument for the fixed categories
 */
DataKind data_kind(Category category);

/// Time-series categories stored in a kind, in canonical order
const std::vector<Category>& categories_of(DataKind kind);

PeriodFormat period_format(DataKind kind);
PeriodFormat period_format(Category category);

/// Column labels of a fixed block (IDENTITY or IDENTIFIERS)
const std::vector<std::string>& fixed_columns(Category category);

std::string to_string(Category category);
std::string to_string(DataKind kind);
std::string to_string(PeriodFormat format);

/**
 * @brief Parse a snake-case category name
 * @throws std::invalid_argument for unknown names
 */
Category category_from_string(const std::string& name);

/**
 * @brief Parse a snake-case data kind name
 * @throws std::invalid_argument for unknown names
 */
DataKind data_kind_from_string(const std::string& name);

/// Label rendered across a block on the category row
std::string export_label(Category category);

/// Title rendered at the first column of a block; may be empty
std::string export_title(Category category);

} // namespace schema
} // namespace fundmetrics

#endif // FUNDMETRICS_SCHEMA_CATEGORY_HPP
