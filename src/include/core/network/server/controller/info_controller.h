#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/url/url_view.hpp>
#include <core/network/server/http_server.h>
#include <core/network/server/response_writer.h>
#include <core/transfer/transfer_tracker.h>

namespace rangeserve::core {

// GET /getinfo?convert_id=<id>: the tracked record as indented JSON.
class InfoController {
public:
    InfoController(HttpServer& server, TransferTracker& tracker);
    ~InfoController() = default;

private:
    boost::asio::awaitable<void> onGetInfo(const HttpRequest& req,
                                           const boost::urls::url_view& target,
                                           ResponseWriter& writer);

    void installRoutes(HttpServer& server);

    TransferTracker& tracker_;
};

} // namespace rangeserve::core
