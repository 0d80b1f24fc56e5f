#include <algorithm>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <core/constant/route.h>
#include <core/network/server/controller/file_controller.h>
#include <core/range/range_resolver.h>
#include <core/util/url.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
namespace urls = boost::urls;
namespace beast = boost::beast;
namespace http = beast::http;

namespace rangeserve::core {

FileController::FileController(HttpServer& server,
                               TransferTracker& tracker,
                               const Settings& settings)
    : tracker_(tracker)
    , settings_(settings) {
    installRoutes(server);
}

net::awaitable<void> FileController::onGetFile(const HttpRequest& req,
                                               const urls::url_view& target,
                                               ResponseWriter& writer) {
    const auto version = req.version();
    const bool keep_alive = req.keep_alive();

    // Grows as the request is understood: raddr, then cid, then s/e.
    std::string tag = fmt::format("raddr={}", writer.remote_address());
    const std::string decoded_path = target.path();
    spdlog::info("{} [START] accept request path={}", tag, decoded_path);

    // Strip the route, keeping the leading slash of the file path.
    std::string_view raw_path(decoded_path);
    raw_path.remove_prefix(std::min(raw_path.size(), ApiRoute::kGetFile.size() - 1));
    if (raw_path.find_first_not_of('/') == std::string_view::npos) {
        spdlog::info("{} path={} missing filepath", tag, decoded_path);
        co_await writer.Send(HttpServer::BadRequest(version, keep_alive, "missing filepath"));
        co_return;
    }

    auto file_path = url::ResolveFilePath(settings_.root_dir, raw_path);
    if (!file_path) {
        spdlog::info("{} path={} invalid filepath {}", tag, decoded_path, std::string(raw_path));
        co_await writer.Send(HttpServer::BadRequest(version, keep_alive, "invalid filepath"));
        co_return;
    }

    auto cid = url::QueryParam(target, query::kConvertId);
    if (!cid || cid->empty()) {
        spdlog::info("{} path={} missing convert_id", tag, decoded_path);
        co_await writer.Send(HttpServer::BadRequest(version, keep_alive, "missing convert_id"));
        co_return;
    }
    const std::string& convert_id = *cid;
    tag += fmt::format(",cid={}", convert_id);

    FileReader file;
    std::error_code ec;
    if (!file.Open(*file_path, ec)) {
        spdlog::info("{} cannot open file: {}", tag, ec.message());
        co_await writer.Send(
            HttpServer::NotFound(version, keep_alive, "cannot open file: " + ec.message()));
        co_return;
    }

    FileStat stat;
    if (!file.Stat(stat, ec)) {
        spdlog::error("{} stat error: {}", tag, ec.message());
        co_await writer.Send(
            HttpServer::InternalServerError(version, keep_alive, "stat error: " + ec.message()));
        co_return;
    }
    if (stat.is_directory) {
        spdlog::info("{} path is directory", tag);
        co_await writer.Send(HttpServer::BadRequest(version, keep_alive, "path is directory"));
        co_return;
    }
    const std::int64_t file_size = stat.size;

    std::optional<std::string_view> range_header;
    if (auto it = req.find(http::field::range); it != req.end()) {
        range_header = std::string_view(it->value().data(), it->value().size());
    }

    ByteRange range;
    std::string range_error;
    try {
        range = RangeResolver::Resolve(range_header, file_size);
    } catch (const MalformedRangeError& e) {
        range_error = e.what();
    }
    if (!range_error.empty()) {
        spdlog::info("{} bad range header: {}", tag, range_error);
        co_await writer.Send(
            HttpServer::BadRequest(version, keep_alive, "bad range header: " + range_error));
        co_return;
    }
    if (!RangeResolver::ClampToFile(range, file_size)) {
        spdlog::info("{} invalid range start={} end={} filesize={}",
                     tag,
                     range.start,
                     range.end,
                     file_size);
        co_await writer.Send(HttpServer::RangeNotSatisfiable(version,
                                                             keep_alive,
                                                             static_cast<std::uint64_t>(file_size)));
        co_return;
    }
    tag += fmt::format(",s={},e={}", range.start, range.end);

    if (!file.Seek(range.start, ec)) {
        spdlog::error("{} seek error: {}", tag, ec.message());
        co_await writer.Send(
            HttpServer::InternalServerError(version, keep_alive, "seek error: " + ec.message()));
        co_return;
    }

    const std::uint64_t expected_len = range.length();
    auto slot = tracker_.Begin(convert_id,
                               file_size,
                               range,
                               writer.remote_address(),
                               TransferTracker::Clock::now());

    HttpResponseHeader header{range.is_partial ? http::status::partial_content : http::status::ok,
                              version};
    header.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    header.keep_alive(keep_alive);
    header.set(http::field::accept_ranges, "bytes");
    header.set(http::field::content_type, "application/octet-stream");
    header.content_length(expected_len);
    if (range.is_partial) {
        header.set(http::field::content_range,
                   fmt::format("bytes {}-{}/{}", range.start, range.end, file_size));
    }

    std::uint64_t copied = 0;
    std::string copy_error;
    if (co_await writer.SendHeader(header)) {
        copied = co_await copyRange(file, range, writer, copy_error);
    }
    if (writer.failed() && copy_error.empty()) {
        copy_error = writer.error().message();
    }
    const bool client_cancelled = writer.cancelled();

    if (copied == expected_len) {
        spdlog::info("{} [END: ok] expected bytes to return={}, actual copied={}",
                     tag,
                     expected_len,
                     copied);
    } else {
        spdlog::info("{} [END: partial/cancel] expected bytes to return={}, actual copied={}",
                     tag,
                     expected_len,
                     copied);
        writer.Abandon();
    }
    if (client_cancelled) {
        spdlog::info("{} client cancelled", tag);
    }
    if (!copy_error.empty()) {
        spdlog::warn("{} copy error: {}", tag, copy_error);
    }

    tracker_.Finalize(convert_id, slot, copied, TransferTracker::Clock::now(), client_cancelled);
}

net::awaitable<std::uint64_t> FileController::copyRange(FileReader& file,
                                                        const ByteRange& range,
                                                        ResponseWriter& writer,
                                                        std::string& copy_error) {
    std::vector<char> buffer(std::max<std::size_t>(settings_.copy_buffer_size, 1));
    std::uint64_t remaining = range.length();
    std::uint64_t copied = 0;
    std::error_code ec;

    while (remaining > 0) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        auto got = file.Read(buffer.data(), want, ec);
        if (got == 0) {
            copy_error = ec ? ec.message() : "unexpected end of file";
            break;
        }

        auto written = co_await writer.Write(buffer.data(), got);
        copied += written;
        remaining -= written;
        if (written < got || writer.failed()) {
            break;
        }
    }
    co_return copied;
}

void FileController::installRoutes(HttpServer& server) {
    server.AddRoute(std::string(ApiRoute::kGetFile),
                    http::verb::get,
                    std::bind(&FileController::onGetFile,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2,
                              std::placeholders::_3));
}

} // namespace rangeserve::core
