#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/url/url_view.hpp>
#include <core/model/byte_range.h>
#include <core/network/server/http_server.h>
#include <core/network/server/response_writer.h>
#include <core/storage/file_reader.h>
#include <core/transfer/transfer_tracker.h>
#include <core/util/config.h>
#include <cstdint>
#include <string>

namespace rangeserve::core {

// Serves GET /getfile/<path>?convert_id=<id>, honouring a single-range Range
// header, and reports every delivery to the TransferTracker.
class FileController {
public:
    FileController(HttpServer& server, TransferTracker& tracker, const Settings& settings);
    ~FileController() = default;

private:
    boost::asio::awaitable<void> onGetFile(const HttpRequest& req,
                                           const boost::urls::url_view& target,
                                           ResponseWriter& writer);

    // Streams range.length() bytes from the reader's current position.
    // Returns the number of bytes the peer accepted.
    boost::asio::awaitable<std::uint64_t> copyRange(FileReader& file,
                                                   const ByteRange& range,
                                                   ResponseWriter& writer,
                                                   std::string& copy_error);

    void installRoutes(HttpServer& server);

    TransferTracker& tracker_;
    const Settings& settings_;
};

} // namespace rangeserve::core
