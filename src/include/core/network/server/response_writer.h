#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace rangeserve::core {

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using HttpResponseHeader = boost::beast::http::response<boost::beast::http::empty_body>;

/*
    Output side of one request.

    Either Send() a complete response, or SendHeader() followed by any number
    of Write() calls for the body. Writes never throw: the first failure is
    remembered, later calls become no-ops, and cancelled() tells whether the
    failure means the peer went away.
*/
class ResponseWriter {
public:
    ResponseWriter(boost::beast::tcp_stream& stream,
                   std::string remote_address,
                   std::chrono::seconds write_timeout);

    boost::asio::awaitable<bool> Send(HttpResponse response);
    boost::asio::awaitable<bool> SendHeader(HttpResponseHeader& header);

    // Returns how many bytes reached the socket.
    boost::asio::awaitable<std::size_t> Write(const char* data, std::size_t size);

    // The body will end short of its Content-Length; close afterwards.
    void Abandon() { abandoned_ = true; }

    const std::string& remote_address() const { return remote_address_; }
    bool started() const { return started_; }
    bool failed() const { return static_cast<bool>(error_); }
    bool cancelled() const { return cancelled_; }
    const boost::beast::error_code& error() const { return error_; }

    // Whether the connection may carry another request.
    bool reusable() const { return !failed() && !abandoned_ && keep_alive_; }

private:
    void fail(const boost::beast::error_code& ec);

    boost::beast::tcp_stream& stream_;
    std::string remote_address_;
    std::chrono::seconds write_timeout_;
    bool started_{false};
    bool abandoned_{false};
    bool keep_alive_{true};
    bool cancelled_{false};
    boost::beast::error_code error_;
};

} // namespace rangeserve::core
