/**
 * @file instrument_store.hpp
 * @brief Persistence boundary for convertible instrument records.
 *
 * The engine never mutates a stored record in place. It reads a copy,
 * computes the new state, and commits with update(), which succeeds only
 * if the stored version still matches the version that was read.
 *
 * Thread Safety: Implementations must be safe for concurrent use.
 */

#pragma once

#include "venture/instruments/convertible_instrument.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace venture
{
    namespace instruments
    {

        /**
         * @class InstrumentStore
         * @brief Abstract instrument repository.
         */
        class InstrumentStore
        {
        public:
            virtual ~InstrumentStore() = default;

            /**
             * @brief Store a new record and assign its id and initial version.
             * @return The stored record.
             */
            virtual ConvertibleInstrument insert(ConvertibleInstrument instrument) = 0;

            /** @brief Copy of the record, or nullopt. */
            virtual std::optional<ConvertibleInstrument> find(const std::string &id) const = 0;

            /**
             * @brief Replace a record if nobody else wrote it since it was read.
             * @param instrument New state. Its version must equal the stored version.
             * @return The stored record with its version incremented.
             * @throws core::NotFoundError If the id is unknown.
             * @throws core::ConcurrentModificationError On a version mismatch.
             */
            virtual ConvertibleInstrument update(const ConvertibleInstrument &instrument) = 0;

            virtual std::vector<ConvertibleInstrument> find_by_startup(const std::string &startup_id) const = 0;

            virtual std::vector<ConvertibleInstrument> find_by_investor(const std::string &investor_id) const = 0;

            virtual std::vector<ConvertibleInstrument> find_by_status(InstrumentStatus status) const = 0;
        };

        /**
         * @class InMemoryInstrumentStore
         * @brief Mutex-guarded map implementation of InstrumentStore.
         *
         * Ids are assigned sequentially ("CI-000001", ...). Query results
         * are ordered by id.
         */
        class InMemoryInstrumentStore : public InstrumentStore
        {
        public:
            InMemoryInstrumentStore() = default;

            ConvertibleInstrument insert(ConvertibleInstrument instrument) override;
            std::optional<ConvertibleInstrument> find(const std::string &id) const override;
            ConvertibleInstrument update(const ConvertibleInstrument &instrument) override;
            std::vector<ConvertibleInstrument> find_by_startup(const std::string &startup_id) const override;
            std::vector<ConvertibleInstrument> find_by_investor(const std::string &investor_id) const override;
            std::vector<ConvertibleInstrument> find_by_status(InstrumentStatus status) const override;

            size_t size() const;

        private:
            template <typename Predicate>
            std::vector<ConvertibleInstrument> select(Predicate pred) const;

            mutable std::mutex mutex_;
            std::unordered_map<std::string, ConvertibleInstrument> records_;
            std::uint64_t next_id_ = 1;
        };

    } // namespace instruments
} // namespace venture
