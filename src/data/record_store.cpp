/**
 * @file record_store.cpp
 * @brief Record helpers shared by every store
 */

#include "data/record_store.hpp"

namespace fundmetrics {
namespace data {

std::optional<double> TimeSeriesRecord::value(schema::Category category) const
{
    auto it = values.find(category);
    if (it == values.end())
    {
        return std::nullopt;
    }
    return it->second;
}

schema::PeriodRegistry load_registry(const RecordStore& store)
{
    schema::PeriodRegistry registry;
    for (schema::DataKind kind : schema::all_data_kinds())
    {
        const auto periods = store.get_distinct_periods(kind);
        for (schema::Category category : schema::categories_of(kind))
        {
            for (const auto& period : periods)
            {
                registry.observe(category, period);
            }
        }
    }
    return registry;
}

} // namespace data
} // namespace fundmetrics
