/**
 * @file block_projector.hpp
 * @brief Derives export column positions from the Period Registry
 *
 * The projector is the inverse of the HeaderClassifier: the classifier
 * turns columns into periods, the projector turns periods into columns.
 * Positions depend on the live registry and must be regenerated after
 * every ingest; never cache a BlockLayout across ingestion cycles.
 */

#ifndef FUNDMETRICS_SCHEMA_BLOCK_PROJECTOR_HPP
#define FUNDMETRICS_SCHEMA_BLOCK_PROJECTOR_HPP

#include "schema/category.hpp"
#include "schema/header_classifier.hpp"
#include "schema/period_key.hpp"
#include "schema/period_registry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fundmetrics {
namespace schema {

/**
 * @struct Block
 * @brief Contiguous column range of one category
 */
struct Block {
    Category category = Category::IDENTITY;
    size_t start_col = 0;
    size_t width = 0;
    std::vector<PeriodKey> periods;     ///< Time-series blocks, most recent first
    std::vector<std::string> labels;    ///< Fixed blocks, in block order

    /// Last column of the block (inclusive); only meaningful when width > 0
    size_t end_col() const { return start_col + width - 1; }

    /// Absolute column of a period inside this block
    std::optional<size_t> column_of(const PeriodKey& period) const;
};

/**
 * @class BlockLayout
 * @brief Full column plan of an export
 *
 * Zero-width blocks are omitted, so has_block() is false for a category
 * the registry has no periods for.
 */
class BlockLayout {
public:
    BlockLayout() = default;
    BlockLayout(std::vector<Block> blocks, std::vector<size_t> separators, size_t total_columns);

    const std::vector<Block>& blocks() const { return blocks_; }
    const std::vector<size_t>& separator_columns() const { return separators_; }
    size_t total_columns() const { return total_columns_; }

    bool has_block(Category category) const;

    /// @throws std::out_of_range if the category has no block
    const Block& block(Category category) const;

    std::optional<size_t> column_for(Category category, const PeriodKey& period) const;

    bool is_separator(size_t column) const;

private:
    std::vector<Block> blocks_;
    std::vector<size_t> separators_;
    size_t total_columns_ = 0;
};

/**
 * @class BlockProjector
 * @brief Computes block positions and renders export header rows
 *
 * Usage Example:
 * @code
 * BlockProjector projector;
 * BlockLayout layout = projector.project(registry);
 * auto header = projector.render_header_rows(layout);
 * @endcode
 */
class BlockProjector {
public:
    explicit BlockProjector(HeaderLayout header = HeaderLayout());

    /**
     * @brief Lay out one block per category, in the given order
     *
     * Time-series blocks take one column per registry period, most recent
     * first. Fixed blocks take their fixed width. A single separator column
     * precedes every emitted block except the first.
     *
     * @param registry Periods to project (the live registry or a subset)
     * @param order Category order; defaults to the canonical order
     * @throws std::invalid_argument if a category appears twice in order
     */
    BlockLayout project(const PeriodRegistry& registry,
                        const std::vector<Category>& order = canonical_category_order()) const;

    /**
     * @brief Render the header block for a layout
     *
     * Row contents:
     * - number row: 1-based column numbers (column 0 left blank)
     * - title row: block title at the first column of each time-series block
     * - category row: block label across every column of a time-series block
     * - period row: period keys, or the fixed column labels
     */
    std::vector<Row> render_header_rows(const BlockLayout& layout) const;

    const HeaderLayout& header_layout() const { return header_; }

private:
    HeaderLayout header_;
};

} // namespace schema
} // namespace fundmetrics

#endif // FUNDMETRICS_SCHEMA_BLOCK_PROJECTOR_HPP
