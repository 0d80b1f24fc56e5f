#include <boost/beast/http.hpp>
#include <core/constant/route.h>
#include <core/network/server/controller/info_controller.h>
#include <core/util/url.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace rangeserve::core {

InfoController::InfoController(HttpServer& server, TransferTracker& tracker)
    : tracker_(tracker) {
    installRoutes(server);
}

net::awaitable<void> InfoController::onGetInfo(const HttpRequest& req,
                                               const boost::urls::url_view& target,
                                               ResponseWriter& writer) {
    const auto version = req.version();
    const bool keep_alive = req.keep_alive();

    auto cid = url::QueryParam(target, query::kConvertId);
    if (!cid || cid->empty()) {
        co_await writer.Send(HttpServer::BadRequest(version, keep_alive, "missing convert_id"));
        co_return;
    }
    const std::string& convert_id = *cid;

    auto record = tracker_.Snapshot(convert_id);
    if (!record) {
        spdlog::info("convert_id not found: {}", convert_id);
        co_await writer.Send(HttpServer::NotFound(version, keep_alive, "convert_id not found"));
        co_return;
    }

    std::string body;
    std::string encode_error;
    try {
        json data = *record;
        body = data.dump(2) + "\n";
    } catch (const json::exception& e) {
        encode_error = e.what();
    }
    if (!encode_error.empty()) {
        spdlog::error("convert_id: {}, json encode error: {}", convert_id, encode_error);
        co_await writer.Send(HttpServer::InternalServerError(version,
                                                             keep_alive,
                                                             "json encode error: " + encode_error));
        co_return;
    }

    co_await writer.Send(HttpServer::Ok(version, keep_alive, body));
}

void InfoController::installRoutes(HttpServer& server) {
    server.AddRoute(std::string(ApiRoute::kGetInfo),
                    http::verb::get,
                    std::bind(&InfoController::onGetInfo,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2,
                              std::placeholders::_3));
}

} // namespace rangeserve::core
