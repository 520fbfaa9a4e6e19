#include "splatlink/transfer/chunk_slot_table.hpp"
#include <stdexcept>
#include <string>

namespace splatlink::transfer {

ChunkSlotTable::ChunkSlotTable(std::uint32_t chunk_count)
    : slots_(chunk_count)
    , filled_(0) {
}

std::uint32_t ChunkSlotTable::store(std::uint32_t chunk_index, std::vector<std::uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (chunk_index >= slots_.size()) {
        throw std::out_of_range("Chunk index " + std::to_string(chunk_index) + " out of range");
    }

    if (!slots_[chunk_index]) {
        filled_++;
    }
    slots_[chunk_index] = std::move(data);
    return filled_;
}

std::uint32_t ChunkSlotTable::filled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filled_;
}

std::optional<std::uint32_t> ChunkSlotTable::first_missing() const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (std::uint32_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            return i;
        }
    }
    return std::nullopt;
}

std::uint64_t ChunkSlotTable::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::uint64_t total = 0;
    for (const auto& slot : slots_) {
        if (slot) {
            total += slot->size();
        }
    }
    return total;
}

std::vector<std::uint8_t> ChunkSlotTable::assemble() {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t total = 0;
    for (const auto& slot : slots_) {
        if (slot) {
            total += slot->size();
        }
    }

    std::vector<std::uint8_t> output;
    output.reserve(total);

    for (auto& slot : slots_) {
        if (slot) {
            output.insert(output.end(), slot->begin(), slot->end());
            slot.reset();
        }
    }

    filled_ = 0;
    return output;
}

}
