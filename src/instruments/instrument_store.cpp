/**
 * @file instrument_store.cpp
 * @brief In-memory instrument repository with optimistic versioning.
 */

#include "venture/instruments/instrument_store.hpp"
#include "venture/core/errors.hpp"

#include <algorithm>
#include <cstdio>

namespace venture
{
    namespace instruments
    {

        ConvertibleInstrument InMemoryInstrumentStore::insert(ConvertibleInstrument instrument)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (instrument.id.empty())
            {
                char buffer[32];
                std::snprintf(buffer, sizeof(buffer), "CI-%06llu", static_cast<unsigned long long>(next_id_++));
                instrument.id = buffer;
            }
            if (records_.count(instrument.id) != 0)
            {
                throw core::ValidationError("id", "Instrument id already exists: " + instrument.id);
            }

            instrument.version = 1;
            records_[instrument.id] = instrument;
            return instrument;
        }

        std::optional<ConvertibleInstrument> InMemoryInstrumentStore::find(const std::string &id) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = records_.find(id);
            if (it == records_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        ConvertibleInstrument InMemoryInstrumentStore::update(const ConvertibleInstrument &instrument)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = records_.find(instrument.id);
            if (it == records_.end())
            {
                throw core::NotFoundError("Convertible instrument not found: " + instrument.id);
            }
            if (it->second.version != instrument.version)
            {
                throw core::ConcurrentModificationError(
                    "Instrument " + instrument.id + " was modified concurrently (expected version " +
                    std::to_string(instrument.version) + ", found " + std::to_string(it->second.version) + ")");
            }

            ConvertibleInstrument stored = instrument;
            stored.version = instrument.version + 1;
            it->second = stored;
            return stored;
        }

        template <typename Predicate>
        std::vector<ConvertibleInstrument> InMemoryInstrumentStore::select(Predicate pred) const
        {
            std::vector<ConvertibleInstrument> out;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &p : records_)
                {
                    if (pred(p.second))
                    {
                        out.push_back(p.second);
                    }
                }
            }
            std::sort(out.begin(), out.end(),
                      [](const ConvertibleInstrument &a, const ConvertibleInstrument &b)
                      { return a.id < b.id; });
            return out;
        }

        std::vector<ConvertibleInstrument> InMemoryInstrumentStore::find_by_startup(const std::string &startup_id) const
        {
            return select([&](const ConvertibleInstrument &ci)
                          { return ci.terms.startup_id == startup_id; });
        }

        std::vector<ConvertibleInstrument> InMemoryInstrumentStore::find_by_investor(const std::string &investor_id) const
        {
            return select([&](const ConvertibleInstrument &ci)
                          { return ci.terms.investor_id == investor_id; });
        }

        std::vector<ConvertibleInstrument> InMemoryInstrumentStore::find_by_status(InstrumentStatus status) const
        {
            return select([&](const ConvertibleInstrument &ci)
                          { return ci.status == status; });
        }

        size_t InMemoryInstrumentStore::size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return records_.size();
        }

    } // namespace instruments
} // namespace venture
