#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url/parse.hpp>
#include <core/constant/transfer.h>
#include <core/network/server/controller/file_controller.h>
#include <core/network/server/controller/info_controller.h>
#include <core/network/server/http_server.h>
#include <spdlog/spdlog.h>

namespace rangeserve::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

namespace {

std::string endpointToString(const tcp::endpoint& endpoint) {
    auto address = endpoint.address();
    if (address.is_v6()) {
        return fmt::format("[{}]:{}", address.to_string(), endpoint.port());
    }
    return fmt::format("{}:{}", address.to_string(), endpoint.port());
}

beast::string_view toBeast(std::string_view s) {
    return beast::string_view(s.data(), s.size());
}

} // namespace

HttpServer::HttpServer(net::io_context& io_context,
                       TransferTracker& tracker,
                       const Settings& settings)
    : io_context_(io_context)
    , settings_(settings)
    , acceptor_(net::make_strand(io_context))
    , running_(false) {
    file_controller_ = std::make_unique<FileController>(*this, tracker, settings_);
    info_controller_ = std::make_unique<InfoController>(*this, tracker);
    spdlog::info("HttpServer created.");
}

HttpServer::~HttpServer() {
    // The io_context no longer runs here, so the acceptor is ours alone.
    running_ = false;
    closeAcceptor();
    spdlog::info("HttpServer destroyed.");
}

void HttpServer::AddRoute(const std::string& path, http::verb method, RouteHandler&& handler) {
    routes_[path] = {method, std::move(handler)};
    spdlog::info("Added route: {} {}", std::string(http::to_string(method)), path);
}

void HttpServer::Start(uint16_t port) {
    if (running_) {
        spdlog::warn("Server is already running.");
        return;
    }

    try {
        tcp::endpoint endpoint(net::ip::make_address(settings_.bind_address), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        running_ = true;
        spdlog::info("HTTP Server started on {}", endpointToString(acceptor_.local_endpoint()));

        net::co_spawn(acceptor_.get_executor(), acceptConnections(), net::detached);

    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on {}:{}: {}", settings_.bind_address, port, e.what());
        running_ = false;
        if (acceptor_.is_open()) {
            beast::error_code ec;
            acceptor_.close(ec);
        }
    }
}

void HttpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(acceptor_.get_executor(), [this]() {
        closeAcceptor();
        spdlog::info("HTTP Server stopped.");
    });
}

void HttpServer::closeAcceptor() {
    beast::error_code ec;
    if (acceptor_.is_open()) {
        acceptor_.cancel(ec);
        acceptor_.close(ec);
    }
}

uint16_t HttpServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

HttpResponse HttpServer::textResponse(http::status status,
                                      unsigned int version,
                                      bool keep_alive,
                                      std::string_view message) {
    HttpResponse res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = message;
    res.body() += '\n';
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Ok(unsigned int version,
                            bool keep_alive,
                            std::string_view body,
                            std::string_view content_type) {
    HttpResponse res{http::status::ok, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, toBeast(content_type));
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return textResponse(http::status::not_found, version, keep_alive, error_message);
}

HttpResponse HttpServer::BadRequest(unsigned int version,
                                    bool keep_alive,
                                    std::string_view error_message) {
    return textResponse(http::status::bad_request, version, keep_alive, error_message);
}

HttpResponse HttpServer::RangeNotSatisfiable(unsigned int version,
                                             bool keep_alive,
                                             std::uint64_t file_size,
                                             std::string_view error_message) {
    auto res = textResponse(http::status::range_not_satisfiable,
                            version,
                            keep_alive,
                            error_message);
    res.set(http::field::content_range, fmt::format("bytes */{}", file_size));
    return res;
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message) {
    return textResponse(http::status::internal_server_error, version, keep_alive, error_message);
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    return textResponse(http::status::method_not_allowed, version, keep_alive, error_message);
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
        try {
            // Each connection runs on its own strand; the io_context has many threads.
            tcp::socket socket(net::make_strand(io_context_));
            co_await acceptor_.async_accept(socket, net::use_awaitable);
            spdlog::debug("Accepted connection from: {}",
                          endpointToString(socket.remote_endpoint()));

            auto executor = socket.get_executor();
            net::co_spawn(executor,
                          handleConnection(beast::tcp_stream(std::move(socket))),
                          net::detached);
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                spdlog::info("Accept operation cancelled.");
                break;
            } else {
                spdlog::error("Error accepting connection: {}", e.what());
            }
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error during accept: {}", e.what());
        }
    }
    spdlog::info("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleConnection(beast::tcp_stream stream) {
    std::string remote_address = "unknown";
    try {
        remote_address = endpointToString(stream.socket().remote_endpoint());

        beast::flat_buffer buffer;
        bool keep_alive = true;

        while (keep_alive) {
            try {
                stream.expires_after(settings_.read_timeout);

                http::request_parser<http::string_body> parser;
                parser.body_limit(transfer::kMaxRequestBodySize);

                co_await http::async_read(stream, buffer, parser, net::use_awaitable);
                stream.expires_never();
                auto req = parser.release();

                spdlog::debug("Received {} request for {} from {}",
                              std::string(req.method_string()),
                              std::string(req.target()),
                              remote_address);

                keep_alive = req.keep_alive();

                ResponseWriter writer(stream, remote_address, settings_.write_timeout);
                co_await handleRequest(req, writer);

                if (!writer.reusable()) {
                    spdlog::debug("Connection to {} will not be reused", remote_address);
                    break;
                }
            } catch (const boost::system::system_error& e) {
                if (e.code() == beast::error::timeout || e.code() == net::error::eof
                    || e.code() == net::error::connection_reset
                    || e.code() == net::error::operation_aborted
                    || e.code() == http::error::end_of_stream) {
                    spdlog::debug("Connection {} closed: {}", remote_address, e.code().message());
                    break;
                }
                throw;
            }
        }

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    } catch (const std::exception& e) {
        spdlog::error("Session error for {}: {}", remote_address, e.what());
    }
    spdlog::debug("Connection handling finished for {}", remote_address);
}

const RouteInfo* HttpServer::findRoute(std::string_view path) const {
    if (auto it = routes_.find(path); it != routes_.end()) {
        return &it->second;
    }

    const RouteInfo* best = nullptr;
    std::size_t best_length = 0;
    for (const auto& [pattern, info] : routes_) {
        if (pattern.ends_with('/') && path.starts_with(pattern) && pattern.size() > best_length) {
            best = &info;
            best_length = pattern.size();
        }
    }
    return best;
}

net::awaitable<void> HttpServer::handleRequest(const HttpRequest& req, ResponseWriter& writer) {
    std::string_view raw_target(req.target().data(), req.target().size());
    auto parsed = urls::parse_origin_form(raw_target);
    if (!parsed.has_value()) {
        spdlog::warn("Rejecting request target {}: {}",
                     std::string(raw_target),
                     parsed.error().message());
        co_await writer.Send(BadRequest(req.version(), req.keep_alive(), "invalid request target"));
        co_return;
    }
    const urls::url_view target = *parsed;
    const std::string path = target.path();
    const auto* route = findRoute(path);

    if (route == nullptr) {
        spdlog::warn("Route not found: {}", path);
        co_await writer.Send(NotFound(req.version(), req.keep_alive(), "404 page not found"));
        co_return;
    }

    if (route->method != req.method()) {
        spdlog::warn("Method not allowed for route {}: requested {}, expected {}",
                     path,
                     std::string(http::to_string(req.method())),
                     std::string(http::to_string(route->method)));
        co_await writer.Send(MethodNotAllowed(req.version(), req.keep_alive()));
        co_return;
    }

    std::string failure;
    try {
        co_await route->handler(req, target, writer);
        co_return;
    } catch (const std::exception& e) {
        spdlog::error("Error executing handler for {}: {}", path, e.what());
        failure = e.what();
    }

    if (writer.started()) {
        writer.Abandon();
        co_return;
    }
    co_await writer.Send(InternalServerError(req.version(), req.keep_alive(), failure));
}

} // namespace rangeserve::core
