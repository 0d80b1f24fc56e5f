#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/url_view.hpp>
#include <core/network/server/response_writer.h>
#include <core/util/config.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace rangeserve::core {

class FileController;
class InfoController;
class TransferTracker;

using StringRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpRequest = StringRequest;

// Handlers answer through the writer, so they may stream a body of any size.
// `target` is the parsed request target and points into the request.
using RouteHandler = std::function<boost::asio::awaitable<void>(
    const HttpRequest&, const boost::urls::url_view& target, ResponseWriter&)>;

// Route table entry
struct RouteInfo {
    boost::beast::http::verb method;
    RouteHandler handler;
};

class HttpServer {
public:
    HttpServer(boost::asio::io_context& io_context,
               TransferTracker& tracker,
               const Settings& settings);

    ~HttpServer();

    // A path ending in '/' matches every target below it.
    void AddRoute(const std::string& path, boost::beast::http::verb method, RouteHandler&& handler);

    // Port 0 binds an ephemeral port; see port().
    void Start(uint16_t port);

    // Safe from any thread: the acceptor is closed on its own strand.
    void Stop();

    bool is_running() const { return running_; }
    uint16_t port() const;

    static HttpResponse Ok(unsigned int version,
                           bool keep_alive,
                           std::string_view body = {},
                           std::string_view content_type = "application/json");
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse BadRequest(unsigned int version,
                                   bool keep_alive,
                                   std::string_view error_message = "Bad Request");
    static HttpResponse RangeNotSatisfiable(unsigned int version,
                                            bool keep_alive,
                                            std::uint64_t file_size,
                                            std::string_view error_message = "invalid range");
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error");
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");

private:
    // Accept loop, one coroutine per connection
    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleConnection(boost::beast::tcp_stream stream);

    boost::asio::awaitable<void> handleRequest(const HttpRequest& request, ResponseWriter& writer);

    const RouteInfo* findRoute(std::string_view path) const;

    void closeAcceptor();

    static HttpResponse textResponse(boost::beast::http::status status,
                                     unsigned int version,
                                     bool keep_alive,
                                     std::string_view message);

    boost::asio::io_context& io_context_;
    Settings settings_;
    // Bound to a strand; only touched from it once the server runs.
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    std::map<std::string, RouteInfo, std::less<>> routes_;
    std::unique_ptr<FileController> file_controller_;
    std::unique_ptr<InfoController> info_controller_;
};

} // namespace rangeserve::core
