#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace splatlink::transfer {

// Pre-sized, index-addressed chunk buffers for one download. Workers fill
// disjoint slots in any order; assemble() must only run after every worker
// has been joined.
class ChunkSlotTable {
public:
    explicit ChunkSlotTable(std::uint32_t chunk_count);

    ChunkSlotTable(const ChunkSlotTable&) = delete;
    ChunkSlotTable& operator=(const ChunkSlotTable&) = delete;

    // Returns the number of filled slots after the write
    std::uint32_t store(std::uint32_t chunk_index, std::vector<std::uint8_t> data);

    std::uint32_t size() const { return static_cast<std::uint32_t>(slots_.size()); }
    std::uint32_t filled_count() const;

    // Lowest index whose slot is still empty
    std::optional<std::uint32_t> first_missing() const;

    std::uint64_t total_bytes() const;

    // Concatenates all slots in index order and releases them
    std::vector<std::uint8_t> assemble();

private:
    mutable std::mutex mutex_;
    std::vector<std::optional<std::vector<std::uint8_t>>> slots_;
    std::uint32_t filled_;
};

} // namespace splatlink::transfer
