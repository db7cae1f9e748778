#include "filedrop/server/chunk_ledger.hpp"

namespace filedrop::server
{

    ChunkLedger::ChunkLedger(MetadataStore &store) : store_(store)
    {
        for (const auto &[handle, records] : store_.load_ledgers())
        {
            auto &chunks = entries_[handle];
            for (const auto &record : records)
            {
                if (record.event)
                {
                    chunks[record.index] = *record.event;
                }
                else
                {
                    chunks.erase(record.index);
                }
            }
        }
    }

    LedgerUpdate ChunkLedger::record(const std::string &handle, const ChunkEvent &event)
    {
        std::lock_guard lock(mutex_);
        store_.append_ledger(handle, LedgerRecord{.index = event.index, .event = event});

        auto &chunks = entries_[handle];
        LedgerUpdate update{};
        if (auto it = chunks.find(event.index); it != chunks.end())
        {
            update.existed = true;
            update.previous = it->second;
            it->second = event;
        }
        else
        {
            chunks.emplace(event.index, event);
        }
        return update;
    }

    void ChunkLedger::restore(const std::string &handle, std::uint64_t index, const std::optional<ChunkEvent> &previous)
    {
        std::lock_guard lock(mutex_);
        store_.append_ledger(handle, LedgerRecord{.index = index, .event = previous});

        auto &chunks = entries_[handle];
        if (previous)
        {
            chunks[index] = *previous;
        }
        else
        {
            chunks.erase(index);
        }
    }

    std::vector<std::uint64_t> ChunkLedger::received_indices(const std::string &handle) const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::uint64_t> indices;
        if (auto it = entries_.find(handle); it != entries_.end())
        {
            indices.reserve(it->second.size());
            for (const auto &[index, event] : it->second)
            {
                indices.push_back(index);
            }
        }
        return indices;
    }

    std::vector<ChunkEvent> ChunkLedger::events(const std::string &handle) const
    {
        std::lock_guard lock(mutex_);
        std::vector<ChunkEvent> result;
        if (auto it = entries_.find(handle); it != entries_.end())
        {
            result.reserve(it->second.size());
            for (const auto &[index, event] : it->second)
            {
                result.push_back(event);
            }
        }
        return result;
    }

} // namespace filedrop::server
