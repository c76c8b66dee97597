/**
 * @file block_projector.cpp
 * @brief Implementation of BlockProjector and BlockLayout
 */

#include "schema/block_projector.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace fundmetrics {
namespace schema {

std::optional<size_t> Block::column_of(const PeriodKey& period) const
{
    auto it = std::find(periods.begin(), periods.end(), period);
    if (it == periods.end())
    {
        return std::nullopt;
    }
    return start_col + static_cast<size_t>(std::distance(periods.begin(), it));
}

// ============================================================================
// BlockLayout
// ============================================================================

BlockLayout::BlockLayout(std::vector<Block> blocks, std::vector<size_t> separators, size_t total_columns)
    : blocks_(std::move(blocks)), separators_(std::move(separators)), total_columns_(total_columns)
{
}

bool BlockLayout::has_block(Category category) const
{
    return std::any_of(blocks_.begin(), blocks_.end(),
                       [category](const Block& b) { return b.category == category; });
}

const Block& BlockLayout::block(Category category) const
{
    for (const auto& b : blocks_)
    {
        if (b.category == category)
        {
            return b;
        }
    }
    throw std::out_of_range("BlockLayout: no block for category '" + to_string(category) + "'");
}

std::optional<size_t> BlockLayout::column_for(Category category, const PeriodKey& period) const
{
    for (const auto& b : blocks_)
    {
        if (b.category == category)
        {
            return b.column_of(period);
        }
    }
    return std::nullopt;
}

bool BlockLayout::is_separator(size_t column) const
{
    return std::binary_search(separators_.begin(), separators_.end(), column);
}

// ============================================================================
// BlockProjector
// ============================================================================

BlockProjector::BlockProjector(HeaderLayout header)
    : header_(std::move(header))
{
    header_.validate();
}

BlockLayout BlockProjector::project(const PeriodRegistry& registry,
                                    const std::vector<Category>& order) const
{
    std::set<Category> seen;
    std::vector<Block> blocks;
    std::vector<size_t> separators;
    size_t next_col = 0;

    for (Category category : order)
    {
        if (!seen.insert(category).second)
        {
            throw std::invalid_argument("BlockProjector: category '" + to_string(category) +
                                        "' appears twice in the block order");
        }

        Block block;
        block.category = category;
        if (is_time_series(category))
        {
            block.periods = registry.periods(category);
            block.width = block.periods.size();
        }
        else
        {
            block.labels = fixed_columns(category);
            block.width = block.labels.size();
        }

        if (block.width == 0)
        {
            continue;
        }

        if (!blocks.empty())
        {
            separators.push_back(next_col++);
        }
        block.start_col = next_col;
        next_col += block.width;
        blocks.push_back(std::move(block));
    }

    core::logger()->debug("Projected {} blocks over {} columns ({} separators)",
                          blocks.size(), next_col, separators.size());
    return BlockLayout(std::move(blocks), std::move(separators), next_col);
}

std::vector<Row> BlockProjector::render_header_rows(const BlockLayout& layout) const
{
    const size_t width = layout.total_columns();
    std::vector<Row> rows(header_.header_row_count, Row(width));

    for (size_t col = 1; col < width; ++col)
    {
        rows[header_.number_row][col] = std::to_string(col);
    }

    for (const auto& block : layout.blocks())
    {
        if (!is_time_series(block.category))
        {
            for (size_t i = 0; i < block.width; ++i)
            {
                rows[header_.period_row][block.start_col + i] = block.labels[i];
            }
            continue;
        }

        rows[header_.title_row][block.start_col] = export_title(block.category);
        const std::string label = export_label(block.category);
        for (size_t i = 0; i < block.width; ++i)
        {
            rows[header_.category_row()][block.start_col + i] = label;
            rows[header_.period_row][block.start_col + i] = block.periods[i].to_string();
        }
    }

    return rows;
}

} // namespace schema
} // namespace fundmetrics
