#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/write.hpp>
#include <core/network/server/response_writer.h>
#include <spdlog/spdlog.h>

namespace rangeserve::core {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {

bool isPeerGone(const beast::error_code& ec) {
    return ec == net::error::broken_pipe || ec == net::error::connection_reset
           || ec == net::error::connection_aborted || ec == net::error::not_connected
           || ec == net::error::eof || ec == net::error::operation_aborted
           || ec == beast::error::timeout;
}

} // namespace

ResponseWriter::ResponseWriter(beast::tcp_stream& stream,
                               std::string remote_address,
                               std::chrono::seconds write_timeout)
    : stream_(stream)
    , remote_address_(std::move(remote_address))
    , write_timeout_(write_timeout) {}

void ResponseWriter::fail(const beast::error_code& ec) {
    error_ = ec;
    cancelled_ = isPeerGone(ec);
    spdlog::debug("Write to {} failed: {}", remote_address_, ec.message());
}

net::awaitable<bool> ResponseWriter::Send(HttpResponse response) {
    if (failed()) {
        co_return false;
    }
    keep_alive_ = response.keep_alive();
    started_ = true;

    beast::error_code ec;
    stream_.expires_after(write_timeout_);
    co_await http::async_write(stream_, response, net::redirect_error(net::use_awaitable, ec));
    stream_.expires_never();
    if (ec) {
        fail(ec);
        co_return false;
    }
    co_return true;
}

net::awaitable<bool> ResponseWriter::SendHeader(HttpResponseHeader& header) {
    if (failed()) {
        co_return false;
    }
    keep_alive_ = header.keep_alive();
    started_ = true;

    beast::error_code ec;
    http::response_serializer<http::empty_body> serializer{header};
    stream_.expires_after(write_timeout_);
    co_await http::async_write_header(stream_,
                                      serializer,
                                      net::redirect_error(net::use_awaitable, ec));
    stream_.expires_never();
    if (ec) {
        fail(ec);
        co_return false;
    }
    co_return true;
}

net::awaitable<std::size_t> ResponseWriter::Write(const char* data, std::size_t size) {
    if (failed() || size == 0) {
        co_return 0;
    }

    beast::error_code ec;
    stream_.expires_after(write_timeout_);
    auto written = co_await net::async_write(stream_,
                                             net::buffer(data, size),
                                             net::redirect_error(net::use_awaitable, ec));
    stream_.expires_never();
    if (ec) {
        fail(ec);
    }
    co_return written;
}

} // namespace rangeserve::core
