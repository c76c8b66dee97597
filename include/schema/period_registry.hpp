/**
 * @file period_registry.hpp
 * @brief Append-only set of known periods per category
 */

#ifndef FUNDMETRICS_SCHEMA_PERIOD_REGISTRY_HPP
#define FUNDMETRICS_SCHEMA_PERIOD_REGISTRY_HPP

#include "schema/category.hpp"
#include "schema/period_key.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <set>
#include <vector>

namespace fundmetrics {
namespace schema {

class ColumnClassificationMap;

/**
 * @class PeriodRegistry
 * @brief Category -> distinct period keys, most recent first
 *
 * The registry only grows. Re-observing a known period is a no-op, and
 * there is deliberately no removal operation.
 *
 * Thread safety: not thread-safe for concurrent mutation.
 */
class PeriodRegistry {
public:
    using PeriodSet = std::set<PeriodKey, std::greater<PeriodKey>>;

    PeriodRegistry() = default;

    /**
     * @brief Record a period for a time-series category
     * @return true if the key was new
     * @throws std::invalid_argument for a fixed category or a key whose
     *         format does not match the category's data kind
     */
    bool observe(Category category, const PeriodKey& key);

    /**
     * @brief Add every period discovered by a classification
     * @return Number of keys that were new
     */
    size_t merge(const ColumnClassificationMap& classification);

    /**
     * @brief Add every period of another registry
     * @return Number of keys that were new
     */
    size_t merge(const PeriodRegistry& other);

    /// Periods of a category, most recent first; empty if none
    std::vector<PeriodKey> periods(Category category) const;

    size_t size(Category category) const;
    size_t total() const;
    bool contains(Category category, const PeriodKey& key) const;
    bool empty() const { return total() == 0; }

    /// True if every period of other is also in this registry
    bool includes(const PeriodRegistry& other) const;

    /**
     * @brief Serialize as {"category_name": ["period", ...], ...}
     */
    nlohmann::json to_json() const;

    /**
     * @brief Rebuild from to_json() output
     * @throws std::invalid_argument on unknown categories or unparseable periods
     */
    static PeriodRegistry from_json(const nlohmann::json& j);

private:
    std::map<Category, PeriodSet> periods_;
};

} // namespace schema
} // namespace fundmetrics

#endif // FUNDMETRICS_SCHEMA_PERIOD_REGISTRY_HPP
