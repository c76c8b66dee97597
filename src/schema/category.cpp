/**
 * @file category.cpp
 * @brief Category catalogue tables
 */

#include "schema/category.hpp"
#include <stdexcept>

namespace fundmetrics {
namespace schema {

namespace {

struct CategoryInfo {
    Category category;
    const char* name;
    const char* label;
    const char* title;
};

// Canonical order. Labels and titles follow the spreadsheet house style.
const CategoryInfo kCatalogue[] = {
    {Category::IDENTITY,                     "identity",                     "",                                   ""},
    {Category::MARKET_CAP,                   "market_cap",                   "Market Cap (in crores)",             "Market Cap"},
    {Category::MARKET_CAP_FREE_FLOAT,        "market_cap_free_float",        "Market Cap- Free Float (in crores)", ""},
    {Category::TTM_REVENUE,                  "ttm_revenue",                  "TTM Revenue",                        "Net Sales"},
    {Category::TTM_REVENUE_FREE_FLOAT,       "ttm_revenue_free_float",       "TTM Revenue- Free Float",            ""},
    {Category::TTM_PAT,                      "ttm_pat",                      "TTM PAT",                            "Profit After Tax"},
    {Category::TTM_PAT_FREE_FLOAT,           "ttm_pat_free_float",           "TTM PAT- Free Float",                ""},
    {Category::QUARTERLY_REVENUE,            "quarterly_revenue",            "Quarterly- Revenue",                 "Net Sales & Other Operating Income"},
    {Category::QUARTERLY_REVENUE_FREE_FLOAT, "quarterly_revenue_free_float", "Quarterly- Revenue- Free Float",     ""},
    {Category::QUARTERLY_PAT,                "quarterly_pat",                "Quarterly- PAT",                     "Profit after tax"},
    {Category::QUARTERLY_PAT_FREE_FLOAT,     "quarterly_pat_free_float",     "Quarterly-PAT- Free Float",          ""},
    {Category::ROCE,                         "roce",                         "ROCE (%)",                           "ROCE (%)"},
    {Category::ROE,                          "roe",                          "ROE (%)",                            "ROE (%)"},
    {Category::RETENTION,                    "retention",                    "Retention (%)",                      "Retention (%)"},
    {Category::SHARE_PRICE,                  "share_price",                  "Share Price",                        "Share Price"},
    {Category::PRICE_TO_REVENUE,             "price_to_revenue",             "Price to Revenue Ratio",             "PR"},
    {Category::PRICE_TO_EARNINGS,            "price_to_earnings",            "Price to Earnings Ratio",            "PE"},
    {Category::IDENTIFIERS,                  "identifiers",                  "",                                   ""},
};

const CategoryInfo& info(Category category)
{
    for (const auto& entry : kCatalogue)
    {
        if (entry.category == category)
        {
            return entry;
        }
    }
    throw std::invalid_argument("Unknown category value");
}

} // namespace

const std::vector<Category>& canonical_category_order()
{
    static const std::vector<Category> order = []() {
        std::vector<Category> out;
        for (const auto& entry : kCatalogue)
        {
            out.push_back(entry.category);
        }
        return out;
    }();
    return order;
}

const std::vector<DataKind>& all_data_kinds()
{
    static const std::vector<DataKind> kinds = {
        DataKind::VALUATION, DataKind::TRAILING, DataKind::QUARTERLY,
        DataKind::ANNUAL, DataKind::PRICE};
    return kinds;
}

bool is_time_series(Category category)
{
    return category != Category::IDENTITY && category != Category::IDENTIFIERS;
}

DataKind data_kind(Category category)
{
    switch (category)
    {
    case Category::MARKET_CAP:
    case Category::MARKET_CAP_FREE_FLOAT:
        return DataKind::VALUATION;
    case Category::TTM_REVENUE:
    case Category::TTM_REVENUE_FREE_FLOAT:
    case Category::TTM_PAT:
    case Category::TTM_PAT_FREE_FLOAT:
        return DataKind::TRAILING;
    case Category::QUARTERLY_REVENUE:
    case Category::QUARTERLY_REVENUE_FREE_FLOAT:
    case Category::QUARTERLY_PAT:
    case Category::QUARTERLY_PAT_FREE_FLOAT:
        return DataKind::QUARTERLY;
    case Category::ROCE:
    case Category::ROE:
    case Category::RETENTION:
        return DataKind::ANNUAL;
    case Category::SHARE_PRICE:
    case Category::PRICE_TO_REVENUE:
    case Category::PRICE_TO_EARNINGS:
        return DataKind::PRICE;
    default:
        throw std::invalid_argument("Category '" + to_string(category) +
                                    "' is a fixed block and has no data kind");
    }
}

const std::vector<Category>& categories_of(DataKind kind)
{
    static const std::vector<Category> valuation = {
        Category::MARKET_CAP, Category::MARKET_CAP_FREE_FLOAT};
    static const std::vector<Category> trailing = {
        Category::TTM_REVENUE, Category::TTM_REVENUE_FREE_FLOAT,
        Category::TTM_PAT, Category::TTM_PAT_FREE_FLOAT};
    static const std::vector<Category> quarterly = {
        Category::QUARTERLY_REVENUE, Category::QUARTERLY_REVENUE_FREE_FLOAT,
        Category::QUARTERLY_PAT, Category::QUARTERLY_PAT_FREE_FLOAT};
    static const std::vector<Category> annual = {
        Category::ROCE, Category::ROE, Category::RETENTION};
    static const std::vector<Category> price = {
        Category::SHARE_PRICE, Category::PRICE_TO_REVENUE, Category::PRICE_TO_EARNINGS};

    switch (kind)
    {
    case DataKind::VALUATION: return valuation;
    case DataKind::TRAILING:  return trailing;
    case DataKind::QUARTERLY: return quarterly;
    case DataKind::ANNUAL:    return annual;
    case DataKind::PRICE:     return price;
    }
    throw std::invalid_argument("Unknown data kind value");
}

PeriodFormat period_format(DataKind kind)
{
    switch (kind)
    {
    case DataKind::VALUATION:
    case DataKind::PRICE:
        return PeriodFormat::DATE;
    case DataKind::TRAILING:
    case DataKind::QUARTERLY:
        return PeriodFormat::YEAR_MONTH;
    case DataKind::ANNUAL:
        return PeriodFormat::FISCAL_YEAR;
    }
    throw std::invalid_argument("Unknown data kind value");
}

PeriodFormat period_format(Category category)
{
    return period_format(data_kind(category));
}

const std::vector<std::string>& fixed_columns(Category category)
{
    static const std::vector<std::string> identity = {
        "Company Name", "Accord Code", "Sector", "Cap", "Free Float"};
    static const std::vector<std::string> identifiers = {
        "BSE Code", "NSE Code", "ISIN"};

    if (category == Category::IDENTITY)
        return identity;
    if (category == Category::IDENTIFIERS)
        return identifiers;
    throw std::invalid_argument("Category '" + to_string(category) + "' is not a fixed block");
}

std::string to_string(Category category)
{
    return info(category).name;
}

std::string to_string(DataKind kind)
{
    switch (kind)
    {
    case DataKind::VALUATION: return "valuation";
    case DataKind::TRAILING:  return "trailing";
    case DataKind::QUARTERLY: return "quarterly";
    case DataKind::ANNUAL:    return "annual";
    case DataKind::PRICE:     return "price";
    }
    return "unknown";
}

std::string to_string(PeriodFormat format)
{
    switch (format)
    {
    case PeriodFormat::DATE:        return "date";
    case PeriodFormat::YEAR_MONTH:  return "year_month";
    case PeriodFormat::FISCAL_YEAR: return "fiscal_year";
    }
    return "unknown";
}

Category category_from_string(const std::string& name)
{
    for (const auto& entry : kCatalogue)
    {
        if (name == entry.name)
        {
            return entry.category;
        }
    }
    throw std::invalid_argument("Unknown category: " + name);
}

DataKind data_kind_from_string(const std::string& name)
{
    for (DataKind kind : all_data_kinds())
    {
        if (to_string(kind) == name)
        {
            return kind;
        }
    }
    throw std::invalid_argument("Unknown data kind: " + name);
}

std::string export_label(Category category)
{
    return info(category).label;
}

std::string export_title(Category category)
{
    return info(category).title;
}

} // namespace schema
} // namespace fundmetrics
