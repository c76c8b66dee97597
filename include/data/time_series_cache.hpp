/**
 * @file time_series_cache.hpp
 * @brief Point-in-time, per-entity snapshot of stored time series
 *
 * Loaded once per calculation batch with one bulk read per data kind.
 * After load() the cache is immutable, so any number of threads may read
 * it concurrently without synchronisation.
 */

#pragma once

#include "data/record_store.hpp"
#include <array>
#include <set>
#include <unordered_map>
#include <vector>

namespace fundmetrics
{
    namespace data
    {

        /**
         * @class RecordRange
         * @brief Non-owning view over contiguous records, most recent first
         */
        class RecordRange
        {
        public:
            using const_iterator = std::vector<TimeSeriesRecord>::const_iterator;

            RecordRange() = default;
            RecordRange(const_iterator first, const_iterator last)
                : first_(first), last_(last), valid_(true) {}

            const_iterator begin() const { return first_; }
            const_iterator end() const { return last_; }
            size_t size() const { return valid_ ? static_cast<size_t>(last_ - first_) : 0; }
            bool empty() const { return size() == 0; }

            /// i-th record; 0 is the most recent
            const TimeSeriesRecord &operator[](size_t i) const { return *(first_ + i); }

        private:
            const_iterator first_{};
            const_iterator last_{};
            bool valid_ = false;
        };

        /**
         * @class TimeSeriesBundle
         * @brief All records of one entity, grouped by kind and sorted descending
         */
        class TimeSeriesBundle
        {
        public:
            TimeSeriesBundle() = default;

            /// Append a record; call finalize() once all records are added
            void add(TimeSeriesRecord record);

            /// Sort every kind most-recent-first
            void finalize();

            RecordRange records(schema::DataKind kind) const;

            /**
             * @brief Records at or before cutoff, most recent first
             *
             * Cutoffs of another format are compared at month granularity.
             */
            RecordRange up_to(schema::DataKind kind, const schema::PeriodKey &cutoff) const;

            /// Latest record at or before cutoff, or nullptr
            const TimeSeriesRecord *latest_at_or_before(schema::DataKind kind,
                                                        const schema::PeriodKey &cutoff) const;

            /// Record with exactly this period, or nullptr
            const TimeSeriesRecord *find(schema::DataKind kind, const schema::PeriodKey &period) const;

            std::vector<schema::PeriodKey> periods(schema::DataKind kind) const;

            size_t count(schema::DataKind kind) const;
            bool empty() const;

        private:
            static size_t slot(schema::DataKind kind) { return static_cast<size_t>(kind); }

            std::array<std::vector<TimeSeriesRecord>, 5> by_kind_;
        };

        /**
         * @class TimeSeriesCache
         * @brief Bundles for a set of entities
         *
         * Usage Example:
         * @code
         * auto cache = TimeSeriesCache::load(store, {"TCS", "INFY"});
         * const auto &bundle = cache.bundle("TCS");
         * @endcode
         */
        class TimeSeriesCache
        {
        public:
            TimeSeriesCache() = default;

            /**
             * @brief Load bundles with exactly one bulk read per data kind
             * @param store Record store to read
             * @param ids Entities to load
             */
            static TimeSeriesCache load(const RecordStore &store, const std::set<EntityId> &ids);

            /// Bundle for an entity; an empty bundle if the entity has no records
            const TimeSeriesBundle &bundle(const EntityId &id) const;

            bool contains(const EntityId &id) const { return bundles_.count(id) > 0; }
            size_t size() const { return bundles_.size(); }

        private:
            std::unordered_map<EntityId, TimeSeriesBundle> bundles_;
        };

    } // namespace data
} // namespace fundmetrics
