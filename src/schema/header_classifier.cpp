/**
 * @file header_classifier.cpp
 * @brief Implementation of HeaderClassifier and ColumnClassificationMap
 */

#include "schema/header_classifier.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fundmetrics {
namespace schema {

namespace {

std::string normalize(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string out = text.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out == "nan" ? "" : out;
}

std::vector<std::string> tokenize(const std::string& lower)
{
    std::vector<std::string> tokens;
    std::string current;
    for (char c : lower)
    {
        if (std::isalnum(static_cast<unsigned char>(c)))
        {
            current.push_back(c);
        }
        else if (!current.empty())
        {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty())
    {
        tokens.push_back(current);
    }
    return tokens;
}

bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

bool has_token(const std::vector<std::string>& tokens, const char* token)
{
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

bool mentions_free_float(const std::string& lower)
{
    return contains(lower, "free float") || contains(lower, "free-float") || contains(lower, "freefloat");
}

// Revenue/profit split shared by the trailing and quarterly families
std::optional<Category> match_flow(const std::string& lower,
                                   Category revenue, Category revenue_ff,
                                   Category profit, Category profit_ff)
{
    const bool free_float = mentions_free_float(lower);
    if (contains(lower, "revenue") || contains(lower, "net sales"))
    {
        return free_float ? revenue_ff : revenue;
    }
    if (contains(lower, "pat") || contains(lower, "profit after tax"))
    {
        return free_float ? profit_ff : profit;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// HeaderLayout
// ============================================================================

void HeaderLayout::validate() const
{
    if (label_rows.empty())
    {
        throw std::invalid_argument("HeaderLayout: at least one label row is required");
    }
    std::vector<size_t> rows = label_rows;
    rows.push_back(number_row);
    rows.push_back(title_row);
    rows.push_back(period_row);
    for (size_t row : rows)
    {
        if (row >= header_row_count)
        {
            throw std::invalid_argument("HeaderLayout: row " + std::to_string(row) +
                                        " is outside the " + std::to_string(header_row_count) +
                                        " header rows");
        }
    }
    if (identity_scan_width < fixed_columns(Category::IDENTITY).size())
    {
        throw std::invalid_argument("HeaderLayout: identity_scan_width is narrower than the identity block");
    }
}

HeaderLayout HeaderLayout::from_json(const nlohmann::json& j)
{
    HeaderLayout layout;
    layout.header_row_count = j.value("header_rows", layout.header_row_count);
    layout.number_row = j.value("number_row", layout.number_row);
    layout.title_row = j.value("title_row", layout.title_row);
    layout.label_rows = j.value("label_rows", layout.label_rows);
    layout.period_row = j.value("period_row", layout.period_row);
    layout.identity_scan_width = j.value("identity_scan_width", layout.identity_scan_width);
    layout.validate();
    return layout;
}

// ============================================================================
// ColumnClassification / ColumnClassificationMap
// ============================================================================

bool ColumnClassification::is_time_series() const
{
    return kind == ColumnKind::CATEGORY && category && schema::is_time_series(*category);
}

ColumnClassificationMap::ColumnClassificationMap(std::vector<ColumnClassification> columns,
                                                 std::vector<UnparseablePeriod> unparseable)
    : columns_(std::move(columns)), unparseable_(std::move(unparseable))
{
}

const ColumnClassification& ColumnClassificationMap::at(size_t column) const
{
    if (column >= columns_.size())
    {
        throw std::out_of_range("ColumnClassificationMap: column " + std::to_string(column) +
                                " out of range");
    }
    return columns_[column];
}

std::vector<PeriodKey> ColumnClassificationMap::periods(Category category) const
{
    std::vector<PeriodKey> out;
    for (const auto& entry : period_columns(category))
    {
        if (std::find(out.begin(), out.end(), entry.first) == out.end())
        {
            out.push_back(entry.first);
        }
    }
    return out;
}

std::vector<std::pair<PeriodKey, size_t>> ColumnClassificationMap::period_columns(Category category) const
{
    std::vector<std::pair<PeriodKey, size_t>> out;
    for (const auto& column : columns_)
    {
        if (column.is_time_series() && *column.category == category && column.period)
        {
            out.emplace_back(*column.period, column.column_index);
        }
    }
    return out;
}

std::optional<size_t> ColumnClassificationMap::column_for(Category category, const PeriodKey& period) const
{
    for (const auto& column : columns_)
    {
        if (column.is_time_series() && *column.category == category &&
            column.period && *column.period == period)
        {
            return column.column_index;
        }
    }
    return std::nullopt;
}

std::optional<size_t> ColumnClassificationMap::fixed_column(Category category, size_t slot) const
{
    for (const auto& column : columns_)
    {
        if (column.kind == ColumnKind::CATEGORY && column.category == category && column.slot == slot)
        {
            return column.column_index;
        }
    }
    return std::nullopt;
}

std::optional<size_t> ColumnClassificationMap::identity_column(IdentityField field) const
{
    return fixed_column(Category::IDENTITY, static_cast<size_t>(field));
}

std::optional<size_t> ColumnClassificationMap::identifier_column(IdentifierField field) const
{
    return fixed_column(Category::IDENTIFIERS, static_cast<size_t>(field));
}

size_t ColumnClassificationMap::count(ColumnKind kind) const
{
    return static_cast<size_t>(std::count_if(columns_.begin(), columns_.end(),
                                             [kind](const ColumnClassification& c) { return c.kind == kind; }));
}

// ============================================================================
// HeaderClassifier
// ============================================================================

HeaderClassifier::HeaderClassifier(HeaderLayout layout)
    : layout_(std::move(layout))
{
    layout_.validate();
}

std::optional<Category> HeaderClassifier::match_category(const std::string& label)
{
    const std::string lower = normalize(label);
    if (lower.empty())
    {
        return std::nullopt;
    }
    const auto tokens = tokenize(lower);

    if (contains(lower, "market cap"))
    {
        return mentions_free_float(lower) ? Category::MARKET_CAP_FREE_FLOAT : Category::MARKET_CAP;
    }

    if (has_token(tokens, "ttm"))
    {
        auto category = match_flow(lower, Category::TTM_REVENUE, Category::TTM_REVENUE_FREE_FLOAT,
                                   Category::TTM_PAT, Category::TTM_PAT_FREE_FLOAT);
        if (category)
            return category;
    }

    if (contains(lower, "quarterly"))
    {
        auto category = match_flow(lower, Category::QUARTERLY_REVENUE, Category::QUARTERLY_REVENUE_FREE_FLOAT,
                                   Category::QUARTERLY_PAT, Category::QUARTERLY_PAT_FREE_FLOAT);
        if (category)
            return category;
    }

    if (has_token(tokens, "roce"))
        return Category::ROCE;
    if (has_token(tokens, "roe"))
        return Category::ROE;
    if (contains(lower, "retention") || contains(lower, "dividend"))
        return Category::RETENTION;

    if (contains(lower, "share price"))
        return Category::SHARE_PRICE;

    if (contains(lower, "price to revenue") || lower == "pr" || contains(lower, "p/r") ||
        (has_token(tokens, "pr") && has_token(tokens, "ratio")))
        return Category::PRICE_TO_REVENUE;

    if (contains(lower, "price to earnings") || lower == "pe" || contains(lower, "p/e") ||
        (has_token(tokens, "pe") && has_token(tokens, "ratio")))
        return Category::PRICE_TO_EARNINGS;

    return std::nullopt;
}

std::optional<IdentityField> HeaderClassifier::match_identity(const std::string& label)
{
    const std::string lower = normalize(label);
    if (lower.empty())
        return std::nullopt;

    if (contains(lower, "company name"))
        return IdentityField::NAME;
    if (contains(lower, "accord code"))
        return IdentityField::CODE;
    if (lower == "sector")
        return IdentityField::SECTOR;
    if (lower == "cap" || lower == "large cap" || lower == "mid cap" || lower == "small cap")
        return IdentityField::CAP;
    if (mentions_free_float(lower) && !contains(lower, "market cap"))
        return IdentityField::FREE_FLOAT;
    return std::nullopt;
}

std::optional<IdentifierField> HeaderClassifier::match_identifier(const std::string& label)
{
    const auto tokens = tokenize(normalize(label));
    if (has_token(tokens, "bse"))
        return IdentifierField::BSE_CODE;
    if (has_token(tokens, "nse"))
        return IdentifierField::NSE_CODE;
    if (has_token(tokens, "isin"))
        return IdentifierField::ISIN;
    return std::nullopt;
}

ColumnClassificationMap HeaderClassifier::classify(const std::vector<Row>& header_rows) const
{
    if (header_rows.size() < layout_.header_row_count)
    {
        throw core::SchemaError("header rows",
                                "Expected " + std::to_string(layout_.header_row_count) +
                                " header rows, found " + std::to_string(header_rows.size()));
    }

    size_t width = 0;
    for (size_t r = 0; r < layout_.header_row_count; ++r)
    {
        width = std::max(width, header_rows[r].size());
    }

    auto cell = [&header_rows](size_t row, size_t col) -> std::string {
        const Row& cells = header_rows[row];
        if (col >= cells.size())
            return "";
        const std::string& raw = cells[col];
        const auto first = raw.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        const auto last = raw.find_last_not_of(" \t\r\n");
        std::string value = raw.substr(first, last - first + 1);
        return value == "nan" ? "" : value;
    };

    const size_t identity_width = fixed_columns(Category::IDENTITY).size();
    const size_t identifier_width = fixed_columns(Category::IDENTIFIERS).size();
    std::vector<bool> identity_taken(identity_width, false);
    std::vector<bool> identifier_taken(identifier_width, false);

    std::vector<ColumnClassification> columns;
    std::vector<UnparseablePeriod> unparseable;
    columns.reserve(width);

    auto& log = *core::logger();

    // Category of the last labelled time-series column; merged block labels
    // leave later columns of the block with blank label cells
    std::optional<Category> carried;
    std::string carried_label;

    for (size_t col = 0; col < width; ++col)
    {
        ColumnClassification cls;
        cls.column_index = col;

        std::vector<std::string> labels;
        for (size_t row : layout_.label_rows)
        {
            labels.push_back(cell(row, col));
        }
        const std::string period_text = cell(layout_.period_row, col);

        const bool unlabelled = std::all_of(labels.begin(), labels.end(),
                                            [](const std::string& s) { return s.empty(); });
        if (unlabelled && period_text.empty())
        {
            carried.reset();
            cls.kind = ColumnKind::SEPARATOR;
            columns.push_back(cls);
            continue;
        }

        // 1. Time-series category from the label rows, first match wins
        std::optional<Category> category;
        for (const auto& label : labels)
        {
            category = match_category(label);
            if (category)
            {
                cls.label = label;
                break;
            }
        }

        if (category)
        {
            carried = category;
            carried_label = cls.label;
        }
        else if (carried && unlabelled && PeriodKey::parse(period_text))
        {
            category = carried;
            cls.label = carried_label;
        }
        else
        {
            carried.reset();
        }

        if (category)
        {
            cls.kind = ColumnKind::CATEGORY;
            cls.category = category;
            auto key = PeriodKey::parse(period_text);
            if (key && key->format() == period_format(*category))
            {
                cls.period = key;
            }
            else
            {
                unparseable.push_back({col, *category, period_text});
                log.warn("Column {} ({}): unparseable period '{}', column excluded",
                         col, to_string(*category), period_text);
            }
            columns.push_back(cls);
            continue;
        }

        // 2. Identifier codes, labelled on a label row or the period row
        std::vector<std::string> candidates = labels;
        candidates.push_back(period_text);
        for (const auto& text : candidates)
        {
            auto field = match_identifier(text);
            if (field && !identifier_taken[static_cast<size_t>(*field)])
            {
                identifier_taken[static_cast<size_t>(*field)] = true;
                cls.kind = ColumnKind::CATEGORY;
                cls.category = Category::IDENTIFIERS;
                cls.slot = static_cast<size_t>(*field);
                cls.label = text;
                break;
            }
        }
        if (cls.kind == ColumnKind::CATEGORY)
        {
            columns.push_back(cls);
            continue;
        }

        // 3. Identity fields, only near the left edge
        if (col < layout_.identity_scan_width)
        {
            for (size_t row = 0; row < layout_.header_row_count; ++row)
            {
                const std::string text = cell(row, col);
                auto field = match_identity(text);
                if (field && !identity_taken[static_cast<size_t>(*field)])
                {
                    identity_taken[static_cast<size_t>(*field)] = true;
                    cls.kind = ColumnKind::CATEGORY;
                    cls.category = Category::IDENTITY;
                    cls.slot = static_cast<size_t>(*field);
                    cls.label = text;
                    break;
                }
            }
        }

        if (cls.kind != ColumnKind::CATEGORY)
        {
            cls.kind = ColumnKind::UNKNOWN;
            cls.label = period_text.empty() ? labels.front() : period_text;
        }
        columns.push_back(cls);
    }

    // Unlabelled identifiers: the last non-separator columns, by position
    const bool no_identifiers = std::none_of(identifier_taken.begin(), identifier_taken.end(),
                                             [](bool taken) { return taken; });
    if (no_identifiers)
    {
        std::vector<size_t> tail;
        for (auto it = columns.rbegin(); it != columns.rend() && tail.size() < identifier_width; ++it)
        {
            if (!it->is_separator())
            {
                tail.push_back(it->column_index);
            }
        }
        const bool all_unknown = tail.size() == identifier_width &&
                                 std::all_of(tail.begin(), tail.end(), [&columns](size_t c) {
                                     return columns[c].kind == ColumnKind::UNKNOWN;
                                 });
        if (all_unknown)
        {
            std::reverse(tail.begin(), tail.end());
            for (size_t slot = 0; slot < tail.size(); ++slot)
            {
                auto& cls = columns[tail[slot]];
                cls.kind = ColumnKind::CATEGORY;
                cls.category = Category::IDENTIFIERS;
                cls.slot = slot;
            }
            log.debug("Identifier columns assigned by position: {}..{}", tail.front(), tail.back());
        }
    }

    const auto& identity_labels = fixed_columns(Category::IDENTITY);
    for (IdentityField required : {IdentityField::NAME, IdentityField::CODE})
    {
        if (!identity_taken[static_cast<size_t>(required)])
        {
            const std::string& name = identity_labels[static_cast<size_t>(required)];
            throw core::SchemaError(name, "Required column '" + name + "' not found in the first " +
                                              std::to_string(layout_.identity_scan_width) + " columns");
        }
    }

    ColumnClassificationMap map(std::move(columns), std::move(unparseable));
    log.info("Classified {} columns: {} categorised, {} separators, {} unknown, {} unparseable periods",
             map.size(), map.count(ColumnKind::CATEGORY), map.count(ColumnKind::SEPARATOR),
             map.count(ColumnKind::UNKNOWN), map.unparseable().size());
    return map;
}

} // namespace schema
} // namespace fundmetrics
