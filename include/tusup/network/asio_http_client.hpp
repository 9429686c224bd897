#pragma once

#include "tusup/network/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <chrono>

namespace tusup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct AsioHttpClientOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};  // Whole exchange, per request
    std::chrono::milliseconds poll_interval{50};                  // How often cancellation is checked
    bool verify_peer = true;
};

/**
 * @brief HTTP/1.1 client on Boost.Asio, with TLS through OpenSSL
 *
 * Every request opens its own connection (Connection: close), so a client
 * object holds no per-connection state. send() may be called concurrently
 * from several threads: each call uses its own io_context and socket, and the
 * shared TLS context is only read after construction. Operations are asynchronous internally; send() drives a private
 * io_context in short slices so it can notice cancellation and the deadline
 * between slices. On either, the socket is closed and pending handlers are
 * drained before returning.
 */
class AsioHttpClient : public HttpClient {
public:
    explicit AsioHttpClient(AsioHttpClientOptions options = {});

    Result<HttpResponse> send(const HttpRequest& request,
                              const CancellationToken& token) override;

private:
    AsioHttpClientOptions options_;
    asio::ssl::context ssl_context_;
};

} // namespace network
} // namespace tusup
