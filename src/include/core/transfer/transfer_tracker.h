#pragma once

#include <chrono>
#include <core/model/byte_range.h>
#include <core/model/transfer_record.h>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rangeserve::core {

/*
    Delivery telemetry per convert_id.

    Begin() appends a RangeRecord and hands back its position in the record's
    `ranges`; Finalize() fills that entry in once streaming stopped. Records are
    never removed, so a slot stays valid for the life of the tracker.

    A single mutex guards the whole map. Nothing under it does I/O.
*/
class TransferTracker {
public:
    using Clock = std::chrono::system_clock;
    using RangeSlot = std::size_t;

    TransferTracker() = default;
    ~TransferTracker() = default;

    TransferTracker(const TransferTracker&) = delete;
    TransferTracker& operator=(const TransferTracker&) = delete;

    RangeSlot Begin(const std::string& convert_id,
                    std::int64_t file_size,
                    const ByteRange& range,
                    const std::string& remote_address,
                    Clock::time_point start_time);

    // Unknown ids or slots are ignored.
    void Finalize(const std::string& convert_id,
                  RangeSlot slot,
                  std::uint64_t returned_bytes,
                  Clock::time_point end_time,
                  bool client_cancelled);

    // Deep copy of the current record, possibly with unfinished ranges.
    std::optional<TransferRecord> Snapshot(const std::string& convert_id) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TransferRecord> records_;
};

} // namespace rangeserve::core
