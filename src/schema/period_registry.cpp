/**
 * @file period_registry.cpp
 * @brief Implementation of PeriodRegistry
 */

#include "schema/period_registry.hpp"
#include "schema/header_classifier.hpp"
#include <stdexcept>

namespace fundmetrics {
namespace schema {

bool PeriodRegistry::observe(Category category, const PeriodKey& key)
{
    if (!is_time_series(category))
    {
        throw std::invalid_argument("PeriodRegistry: category '" + to_string(category) +
                                    "' does not carry periods");
    }
    if (key.format() != period_format(category))
    {
        throw std::invalid_argument("PeriodRegistry: period " + key.to_string() + " has format " +
                                    to_string(key.format()) + ", category '" +
                                    to_string(category) + "' expects " +
                                    to_string(period_format(category)));
    }
    return periods_[category].insert(key).second;
}

size_t PeriodRegistry::merge(const ColumnClassificationMap& classification)
{
    size_t added = 0;
    for (Category category : canonical_category_order())
    {
        if (!is_time_series(category))
        {
            continue;
        }
        for (const auto& key : classification.periods(category))
        {
            if (observe(category, key))
            {
                ++added;
            }
        }
    }
    return added;
}

size_t PeriodRegistry::merge(const PeriodRegistry& other)
{
    size_t added = 0;
    for (const auto& entry : other.periods_)
    {
        for (const auto& key : entry.second)
        {
            if (observe(entry.first, key))
            {
                ++added;
            }
        }
    }
    return added;
}

std::vector<PeriodKey> PeriodRegistry::periods(Category category) const
{
    auto it = periods_.find(category);
    if (it == periods_.end())
    {
        return {};
    }
    return std::vector<PeriodKey>(it->second.begin(), it->second.end());
}

size_t PeriodRegistry::size(Category category) const
{
    auto it = periods_.find(category);
    return it == periods_.end() ? 0 : it->second.size();
}

size_t PeriodRegistry::total() const
{
    size_t count = 0;
    for (const auto& entry : periods_)
    {
        count += entry.second.size();
    }
    return count;
}

bool PeriodRegistry::contains(Category category, const PeriodKey& key) const
{
    auto it = periods_.find(category);
    return it != periods_.end() && it->second.count(key) > 0;
}

bool PeriodRegistry::includes(const PeriodRegistry& other) const
{
    for (const auto& entry : other.periods_)
    {
        for (const auto& key : entry.second)
        {
            if (!contains(entry.first, key))
            {
                return false;
            }
        }
    }
    return true;
}

nlohmann::json PeriodRegistry::to_json() const
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto& entry : periods_)
    {
        if (entry.second.empty())
        {
            continue;
        }
        nlohmann::json keys = nlohmann::json::array();
        for (const auto& key : entry.second)
        {
            keys.push_back(key.to_string());
        }
        j[to_string(entry.first)] = keys;
    }
    return j;
}

PeriodRegistry PeriodRegistry::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::invalid_argument("PeriodRegistry: expected a JSON object");
    }

    PeriodRegistry registry;
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const Category category = category_from_string(it.key());
        for (const auto& item : it.value())
        {
            const std::string text = item.get<std::string>();
            auto key = PeriodKey::parse(text);
            if (!key)
            {
                throw std::invalid_argument("PeriodRegistry: unparseable period '" + text +
                                            "' for " + it.key());
            }
            registry.observe(category, *key);
        }
    }
    return registry;
}

} // namespace schema
} // namespace fundmetrics
