#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "filedrop/server/metadata_store.hpp"
#include "filedrop/server/upload_types.hpp"

namespace filedrop::server
{

    struct LedgerUpdate
    {
        bool existed{};
        std::optional<ChunkEvent> previous;
    };

    // Which chunk indices of each upload have been received, with the timing
    // of the write that last stored each one.
    class ChunkLedger
    {
    public:
        explicit ChunkLedger(MetadataStore &store);

        // Marks event.index received and replaces its event.
        LedgerUpdate record(const std::string &handle, const ChunkEvent &event);

        // Undoes a record() whose surrounding request failed.
        void restore(const std::string &handle, std::uint64_t index, const std::optional<ChunkEvent> &previous);

        std::vector<std::uint64_t> received_indices(const std::string &handle) const;

        std::vector<ChunkEvent> events(const std::string &handle) const;

    private:
        MetadataStore &store_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::map<std::uint64_t, ChunkEvent>> entries_;
    };

} // namespace filedrop::server
