/**
 * @file time_series_cache.cpp
 * @brief Implementation of TimeSeriesBundle and TimeSeriesCache
 */

#include "data/time_series_cache.hpp"
#include "core/logging.hpp"
#include <algorithm>

namespace fundmetrics
{
    namespace data
    {

        void TimeSeriesBundle::add(TimeSeriesRecord record)
        {
            by_kind_[slot(record.kind)].push_back(std::move(record));
        }

        void TimeSeriesBundle::finalize()
        {
            for (auto &records : by_kind_)
            {
                std::sort(records.begin(), records.end(),
                          [](const TimeSeriesRecord &a, const TimeSeriesRecord &b)
                          { return a.period > b.period; });
            }
        }

        RecordRange TimeSeriesBundle::records(schema::DataKind kind) const
        {
            const auto &records = by_kind_[slot(kind)];
            return RecordRange(records.begin(), records.end());
        }

        RecordRange TimeSeriesBundle::up_to(schema::DataKind kind, const schema::PeriodKey &cutoff) const
        {
            const auto &records = by_kind_[slot(kind)];
            // Sorted descending, so records newer than the cutoff form a prefix
            auto first = std::partition_point(records.begin(), records.end(),
                                              [&cutoff](const TimeSeriesRecord &r)
                                              { return !schema::at_or_before(r.period, cutoff); });
            return RecordRange(first, records.end());
        }

        const TimeSeriesRecord *TimeSeriesBundle::latest_at_or_before(schema::DataKind kind,
                                                                      const schema::PeriodKey &cutoff) const
        {
            auto range = up_to(kind, cutoff);
            return range.empty() ? nullptr : &range[0];
        }

        const TimeSeriesRecord *TimeSeriesBundle::find(schema::DataKind kind,
                                                       const schema::PeriodKey &period) const
        {
            const auto &records = by_kind_[slot(kind)];
            auto it = std::lower_bound(records.begin(), records.end(), period,
                                       [](const TimeSeriesRecord &r, const schema::PeriodKey &p)
                                       { return r.period > p; });
            if (it == records.end() || it->period != period)
            {
                return nullptr;
            }
            return &*it;
        }

        std::vector<schema::PeriodKey> TimeSeriesBundle::periods(schema::DataKind kind) const
        {
            std::vector<schema::PeriodKey> out;
            for (const auto &record : by_kind_[slot(kind)])
            {
                out.push_back(record.period);
            }
            return out;
        }

        size_t TimeSeriesBundle::count(schema::DataKind kind) const
        {
            return by_kind_[slot(kind)].size();
        }

        bool TimeSeriesBundle::empty() const
        {
            return std::all_of(by_kind_.begin(), by_kind_.end(),
                               [](const std::vector<TimeSeriesRecord> &r)
                               { return r.empty(); });
        }

        // ============================================================================
        // TimeSeriesCache
        // ============================================================================

        TimeSeriesCache TimeSeriesCache::load(const RecordStore &store, const std::set<EntityId> &ids)
        {
            TimeSeriesCache cache;
            size_t total = 0;

            for (schema::DataKind kind : schema::all_data_kinds())
            {
                auto records = store.get_records(kind, ids);
                total += records.size();
                for (auto &record : records)
                {
                    const EntityId id = record.entity_id;
                    cache.bundles_[id].add(std::move(record));
                }
            }

            for (auto &entry : cache.bundles_)
            {
                entry.second.finalize();
            }

            core::logger()->debug("Time-series cache loaded: {} records for {} of {} entities",
                                  total, cache.bundles_.size(), ids.size());
            return cache;
        }

        const TimeSeriesBundle &TimeSeriesCache::bundle(const EntityId &id) const
        {
            static const TimeSeriesBundle empty_bundle;
            auto it = bundles_.find(id);
            return it == bundles_.end() ? empty_bundle : it->second;
        }

    } // namespace data
} // namespace fundmetrics
