/**
 * @file test_fixtures.hpp
 * @brief Builders shared by the test files
 */

#pragma once

#include "schema/header_classifier.hpp"
#include <string>
#include <vector>

namespace fundmetrics {
namespace testing {

/**
 * @brief Header block of the default layout, filled column by column
 *
 * Row 5 carries category labels and row 7 carries periods or fixed
 * column labels, as in the exported sheet.
 */
class HeaderBuilder {
public:
    explicit HeaderBuilder(schema::HeaderLayout layout = schema::HeaderLayout())
        : layout_(std::move(layout)), rows_(layout_.header_row_count) {}

    /// Fixed column labelled on the period row
    HeaderBuilder& fixed(const std::string& label) { return column("", label); }

    /// Column with a category label and a period cell
    HeaderBuilder& column(const std::string& category_label, const std::string& period)
    {
        const size_t col = width_++;
        for (auto& row : rows_)
            row.resize(width_);
        rows_[layout_.category_row()][col] = category_label;
        rows_[layout_.period_row][col] = period;
        return *this;
    }

    HeaderBuilder& separator() { return column("", ""); }

    /// Five identity columns
    HeaderBuilder& identity()
    {
        return fixed("Company Name").fixed("Accord Code").fixed("Sector").fixed("Cap").fixed("Free Float");
    }

    /// Three labelled identifier columns
    HeaderBuilder& identifiers()
    {
        return fixed("BSE Code").fixed("NSE Code").fixed("ISIN");
    }

    const std::vector<schema::Row>& rows() const { return rows_; }
    size_t width() const { return width_; }

private:
    schema::HeaderLayout layout_;
    std::vector<schema::Row> rows_;
    size_t width_ = 0;
};

} // namespace testing
} // namespace fundmetrics
