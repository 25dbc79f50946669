#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "frame_types.hpp"

namespace roofwatch {

// Process-wide holder of the current roof status. Records are immutable once
// published; update() builds the next record and swaps a pointer, so readers
// only ever contend for the swap itself.
class StatusStore {
public:
    explicit StatusStore(size_t trend_capacity = 32);

    // Writer side. Only the monitor loop calls this.
    void update(const ClassificationResult& result);

    // Never null. Starts out as the UNKNOWN record.
    std::shared_ptr<const StatusRecord> snapshot() const;

    size_t trend_capacity() const { return trend_capacity_; }

private:
    const size_t trend_capacity_;
    std::mutex writer_mu_;
    mutable std::shared_mutex mu_;
    std::shared_ptr<const StatusRecord> current_;
};

}  // namespace roofwatch
