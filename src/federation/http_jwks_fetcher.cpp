// ---------------------------------------------------------------------------
// http_jwks_fetcher.cpp
//
// [알려진 한계]
// - IPv6 리터럴 호스트("[::1]")는 지원하지 않는다.
// - chunked 응답은 Beast 파서가 처리하며 body_limit 은 디코딩 후 크기 기준.
// ---------------------------------------------------------------------------

#include "federation/http_jwks_fetcher.hpp"

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <fmt/format.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http  = boost::beast::http;
namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

namespace {

struct FetchState {
    std::expected<JwksHttpResponse, JwksError> result{
        std::unexpected(JwksError{JwksErrorCode::kFetchFailed, "jwks fetch did not complete", 0})};
};

[[nodiscard]] JwksError network_error(std::string_view step, const boost::system::error_code& ec) {
    return JwksError{JwksErrorCode::kFetchFailed, fmt::format("{}: {}", step, ec.message()), 0};
}

// ---------------------------------------------------------------------------
// exchange
//   연결된 스트림에서 GET 요청/응답 한 번을 수행한다. tcp/ssl 공용.
// ---------------------------------------------------------------------------
template <typename Stream>
auto exchange(Stream&                   stream,
              const ParsedUri&          uri,
              std::chrono::milliseconds timeout,
              std::size_t               max_size,
              FetchState&               state) -> net::awaitable<bool>
{
    boost::system::error_code ec;

    http::request<http::empty_body> req{http::verb::get, uri.target, 11};
    req.set(http::field::host, uri.host);
    req.set(http::field::user_agent, "authgate-jwks/1.0");
    req.set(http::field::accept, "application/json, application/jwk-set+json");

    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        state.result = std::unexpected(network_error("write", ec));
        co_return false;
    }

    beast::flat_buffer                        buffer;
    http::response_parser<http::string_body>  parser;
    parser.body_limit(max_size);

    co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
    if (ec == http::error::body_limit) {
        state.result = std::unexpected(JwksError{JwksErrorCode::kResponseTooLarge,
                                                 fmt::format("jwks body exceeds {} bytes", max_size), 0});
        co_return false;
    }
    if (ec) {
        state.result = std::unexpected(network_error("read", ec));
        co_return false;
    }

    const auto& res    = parser.get();
    const int   status = static_cast<int>(res.result_int());
    if (status < 200 || status >= 300) {
        state.result = std::unexpected(JwksError{JwksErrorCode::kHttpStatus,
                                                 fmt::format("jwks endpoint returned HTTP {}", status), status});
        co_return true;
    }

    JwksHttpResponse out;
    out.status = status;
    out.body   = res.body();
    if (const auto it = res.find(http::field::cache_control); it != res.end()) {
        out.cache_control = std::string(it->value());
    }
    state.result = std::move(out);
    co_return true;
}

auto run_fetch(net::io_context&          ioc,
               ssl::context&             tls_ctx,
               ParsedUri                 uri,
               std::chrono::milliseconds timeout,
               std::size_t               max_size,
               FetchState&               state) -> net::awaitable<void>
{
    boost::system::error_code ec;

    tcp::resolver resolver{ioc};
    const auto endpoints = co_await resolver.async_resolve(
        uri.host, uri.port, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        state.result = std::unexpected(network_error("resolve", ec));
        co_return;
    }

    if (!uri.tls) {
        beast::tcp_stream stream{ioc};
        stream.expires_after(timeout);
        co_await stream.async_connect(endpoints, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            state.result = std::unexpected(network_error("connect", ec));
            co_return;
        }
        co_await exchange(stream, uri, timeout, max_size, state);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return;
    }

    beast::ssl_stream<beast::tcp_stream> stream{ioc, tls_ctx};
    if (!SSL_set_tlsext_host_name(stream.native_handle(), uri.host.c_str())) {
        state.result = std::unexpected(JwksError{JwksErrorCode::kFetchFailed, "cannot set SNI host name", 0});
        co_return;
    }
    stream.set_verify_callback(ssl::host_name_verification(uri.host));

    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await beast::get_lowest_layer(stream).async_connect(
        endpoints, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        state.result = std::unexpected(network_error("connect", ec));
        co_return;
    }

    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        state.result = std::unexpected(network_error("tls handshake", ec));
        co_return;
    }

    if (!co_await exchange(stream, uri, timeout, max_size, state)) {
        co_return;
    }

    // 상대가 close_notify 없이 끊는 경우(stream_truncated)는 정상으로 본다
    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::ssl::error::stream_truncated) {
        spdlog::debug("http_jwks_fetcher: tls shutdown: {}", ec.message());
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_jwks_uri
// ---------------------------------------------------------------------------
std::expected<ParsedUri, JwksError> parse_jwks_uri(const std::string& uri) {
    ParsedUri out;
    std::string_view rest = uri;
    if (rest.starts_with("https://")) {
        out.tls  = true;
        out.port = "443";
        rest.remove_prefix(8);
    } else if (rest.starts_with("http://")) {
        out.tls  = false;
        out.port = "80";
        rest.remove_prefix(7);
    } else {
        return std::unexpected(JwksError{JwksErrorCode::kInvalidScheme,
                                         fmt::format("unsupported scheme in '{}'", uri), 0});
    }

    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.target = std::string(rest.substr(slash));
    }
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        return std::unexpected(JwksError{JwksErrorCode::kInvalidScheme,
                                         "credentials in jwks uri are not allowed", 0});
    }
    if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        out.port  = std::string(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
        if (out.port.empty()) {
            return std::unexpected(JwksError{JwksErrorCode::kInvalidScheme, "empty port in jwks uri", 0});
        }
    }
    if (authority.empty()) {
        return std::unexpected(JwksError{JwksErrorCode::kInvalidScheme, "jwks uri has no host", 0});
    }
    out.host = std::string(authority);
    return out;
}

// ---------------------------------------------------------------------------
// fetch
// ---------------------------------------------------------------------------
std::expected<JwksHttpResponse, JwksError>
HttpJwksFetcher::fetch(const std::string& uri, std::chrono::milliseconds timeout, std::size_t max_size) {
    auto parsed = parse_jwks_uri(uri);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    // 코루틴 프레임이 state/tls_ctx 를 참조하므로 ioc 가 먼저 소멸해야 한다
    FetchState      state;
    ssl::context    tls_ctx{ssl::context::tls_client};
    net::io_context ioc;
    boost::system::error_code ec;
    tls_ctx.set_default_verify_paths(ec);
    if (ec) {
        return std::unexpected(network_error("tls trust store", ec));
    }
    tls_ctx.set_verify_mode(ssl::verify_peer);

    net::co_spawn(ioc, run_fetch(ioc, tls_ctx, std::move(*parsed), timeout, max_size, state), net::detached);

    // resolve 처럼 expires_after 가 적용되지 않는 단계를 위해 전체 상한을 둔다
    ioc.run_for(timeout);
    if (!ioc.stopped()) {
        ioc.stop();
        return std::unexpected(JwksError{JwksErrorCode::kFetchFailed,
                                         fmt::format("jwks fetch exceeded {}ms", timeout.count()), 0});
    }
    return std::move(state.result);
}
