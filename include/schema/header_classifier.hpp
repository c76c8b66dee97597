/**
 * @file header_classifier.hpp
 * @brief Maps the fixed header rows of an input table onto categories and periods
 *
 * The classifier is a pure read: it never touches the Period Registry or
 * storage. Callers feed the discovered periods into the registry once the
 * whole table has been accepted.
 */

#ifndef FUNDMETRICS_SCHEMA_HEADER_CLASSIFIER_HPP
#define FUNDMETRICS_SCHEMA_HEADER_CLASSIFIER_HPP

#include "schema/category.hpp"
#include "schema/period_key.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fundmetrics {
namespace schema {

using Row = std::vector<std::string>;

/**
 * @struct HeaderLayout
 * @brief Fixed row positions of the header block (0-based)
 */
struct HeaderLayout {
    size_t header_row_count = 8;            ///< Rows before the first data row
    size_t number_row = 1;                  ///< Column numbers (rendered only)
    size_t title_row = 2;                   ///< Block titles (rendered only)
    std::vector<size_t> label_rows = {5, 6};///< Category label row, then subcategory row
    size_t period_row = 7;                  ///< Period keys and fixed column labels
    size_t identity_scan_width = 13;        ///< Identity labels are searched left of this column

    /// Row that carries the category label when rendering
    size_t category_row() const { return label_rows.front(); }

    /**
     * @brief Check that every row index fits inside header_row_count
     * @throws std::invalid_argument otherwise
     */
    void validate() const;

    static HeaderLayout from_json(const nlohmann::json& j);
};

/**
 * @enum ColumnKind
 * @brief Tag of a column classification
 */
enum class ColumnKind {
    CATEGORY,   ///< Belongs to a category block
    SEPARATOR,  ///< All relevant header cells are blank
    UNKNOWN     ///< Has header text that matched nothing
};

/**
 * @struct ColumnClassification
 * @brief Meaning of one column
 *
 * A CATEGORY column always has a category. A time-series column has a
 * period unless its period cell was unparseable. A fixed-block column uses
 * slot for its position inside the block. Separators carry nothing.
 */
struct ColumnClassification {
    size_t column_index = 0;
    ColumnKind kind = ColumnKind::UNKNOWN;
    std::optional<Category> category;
    std::optional<PeriodKey> period;
    size_t slot = 0;        ///< IdentityField / IdentifierField index for fixed blocks
    std::string label;      ///< Label text that decided the classification

    bool is_separator() const { return kind == ColumnKind::SEPARATOR; }
    bool is_time_series() const;
};

/**
 * @struct UnparseablePeriod
 * @brief Time-series column whose period cell matched no period format
 */
struct UnparseablePeriod {
    size_t column = 0;
    Category category = Category::IDENTITY;
    std::string raw;
};

/**
 * @class ColumnClassificationMap
 * @brief Classification of every column of one table
 */
class ColumnClassificationMap {
public:
    ColumnClassificationMap() = default;
    ColumnClassificationMap(std::vector<ColumnClassification> columns,
                            std::vector<UnparseablePeriod> unparseable);

    size_t size() const { return columns_.size(); }
    const std::vector<ColumnClassification>& columns() const { return columns_; }

    /// @throws std::out_of_range if column is past the end
    const ColumnClassification& at(size_t column) const;

    /// Distinct parsed periods of a category, in column order
    std::vector<PeriodKey> periods(Category category) const;

    /// (period, column) pairs of a time-series category, in column order
    std::vector<std::pair<PeriodKey, size_t>> period_columns(Category category) const;

    /// First column holding (category, period)
    std::optional<size_t> column_for(Category category, const PeriodKey& period) const;

    std::optional<size_t> identity_column(IdentityField field) const;
    std::optional<size_t> identifier_column(IdentifierField field) const;

    const std::vector<UnparseablePeriod>& unparseable() const { return unparseable_; }

    size_t count(ColumnKind kind) const;

private:
    std::optional<size_t> fixed_column(Category category, size_t slot) const;

    std::vector<ColumnClassification> columns_;
    std::vector<UnparseablePeriod> unparseable_;
};

/**
 * @class HeaderClassifier
 * @brief Keyword-driven column classifier
 *
 * Usage Example:
 * @code
 * HeaderClassifier classifier(HeaderLayout{});
 * auto map = classifier.classify(table.header_rows);
 * registry.merge(map);
 * @endcode
 */
class HeaderClassifier {
public:
    explicit HeaderClassifier(HeaderLayout layout = HeaderLayout());

    /**
     * @brief Classify every column of the header block
     * @param header_rows Header rows; extra rows beyond header_row_count are ignored
     * @return Column map
     * @throws core::SchemaError if there are too few header rows, or if the
     *         entity name or entity code column cannot be located
     */
    ColumnClassificationMap classify(const std::vector<Row>& header_rows) const;

    /**
     * @brief Category named by a label, most specific rule first
     *
     * A label mentioning free float resolves to the free-float variant of
     * its measure, never the plain one.
     */
    static std::optional<Category> match_category(const std::string& label);

    static std::optional<IdentityField> match_identity(const std::string& label);
    static std::optional<IdentifierField> match_identifier(const std::string& label);

    const HeaderLayout& layout() const { return layout_; }

private:
    HeaderLayout layout_;
};

} // namespace schema
} // namespace fundmetrics

#endif // FUNDMETRICS_SCHEMA_HEADER_CLASSIFIER_HPP
