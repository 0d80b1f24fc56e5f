#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rangeserve::core {

// One range request made under a convert_id. The fields after time_start_ns
// stay zero-valued until that request has finished streaming.
struct RangeRecord {
    std::uint64_t byte_start{0};
    std::int64_t byte_end{0}; // -1 if open-ended or reaching EOF
    std::uint64_t request_len{0};
    std::string request_len_human;
    std::uint64_t returned_bytes{0};
    std::string returned_bytes_human;
    double returned_perc{0.0};
    std::int64_t time_start_ns{0};
    std::int64_t time_end_ns{0};
    std::string time_duration;
    bool client_cancelled{false};
    std::string client_addr;

    bool end_unspecified{false}; // not serialized

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RangeRecord,
                                   byte_start,
                                   byte_end,
                                   request_len,
                                   request_len_human,
                                   returned_bytes,
                                   returned_bytes_human,
                                   returned_perc,
                                   time_start_ns,
                                   time_end_ns,
                                   time_duration,
                                   client_cancelled,
                                   client_addr)
};

// Aggregate for every range request seen under one convert_id.
struct TransferRecord {
    std::int64_t time_start_ns{0};
    std::int64_t time_end_ns{0};
    std::string time_duration;
    std::uint64_t file_size{0};
    std::string file_size_human;
    std::vector<RangeRecord> ranges;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        TransferRecord, time_start_ns, time_end_ns, time_duration, file_size, file_size_human, ranges)
};

} // namespace rangeserve::core
