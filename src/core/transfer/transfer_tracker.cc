#include <core/constant/transfer.h>
#include <core/transfer/transfer_tracker.h>
#include <core/util/human_readable.h>
#include <spdlog/spdlog.h>

namespace rangeserve::core {

namespace {

std::int64_t toUnixNanos(TransferTracker::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace

TransferTracker::RangeSlot TransferTracker::Begin(const std::string& convert_id,
                                                  std::int64_t file_size,
                                                  const ByteRange& range,
                                                  const std::string& remote_address,
                                                  Clock::time_point start_time) {
    auto start_ns = toUnixNanos(start_time);

    RangeRecord entry;
    entry.byte_start = static_cast<std::uint64_t>(range.start);
    if (range.end_unspecified || range.end + 1 == file_size) {
        entry.byte_end = transfer::kUnspecifiedEnd;
    } else {
        entry.byte_end = range.end;
    }
    entry.request_len = range.length();
    entry.request_len_human = human_readable::Bytes(entry.request_len);
    entry.time_start_ns = start_ns;
    entry.client_addr = remote_address;
    entry.end_unspecified = range.end_unspecified;

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = records_.try_emplace(convert_id);
    auto& record = it->second;
    if (inserted) {
        record.file_size = static_cast<std::uint64_t>(file_size);
        record.file_size_human = human_readable::Bytes(record.file_size);
        record.time_start_ns = start_ns;
    }
    record.ranges.push_back(std::move(entry));
    return record.ranges.size() - 1;
}

void TransferTracker::Finalize(const std::string& convert_id,
                               RangeSlot slot,
                               std::uint64_t returned_bytes,
                               Clock::time_point end_time,
                               bool client_cancelled) {
    auto end_ns = toUnixNanos(end_time);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(convert_id);
    if (it == records_.end() || slot >= it->second.ranges.size()) {
        spdlog::debug("No range slot {} for convert_id {}, dropping telemetry", slot, convert_id);
        return;
    }

    auto& record = it->second;
    auto& entry = record.ranges[slot];
    entry.returned_bytes = returned_bytes;
    entry.returned_bytes_human = human_readable::Bytes(returned_bytes);
    if (entry.request_len > 0) {
        entry.returned_perc = static_cast<double>(returned_bytes)
                              / static_cast<double>(entry.request_len) * 100.0;
    }
    entry.time_end_ns = end_ns;
    entry.client_cancelled = client_cancelled;
    entry.time_duration = human_readable::Duration(
        std::chrono::nanoseconds(entry.time_end_ns - entry.time_start_ns));

    if (end_ns > record.time_end_ns) {
        record.time_end_ns = end_ns;
    }
    if (record.time_end_ns > record.time_start_ns) {
        record.time_duration = human_readable::Duration(
            std::chrono::nanoseconds(record.time_end_ns - record.time_start_ns));
    }
}

std::optional<TransferRecord> TransferTracker::Snapshot(const std::string& convert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(convert_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t TransferTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace rangeserve::core
