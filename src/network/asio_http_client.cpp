#include "tusup/network/asio_http_client.hpp"
#include "tusup/network/http_response_parser.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <functional>

namespace tusup {
namespace network {

namespace {

using Clock = std::chrono::steady_clock;

/**
 * Runs the io_context until the current step signals completion, checking
 * the cancellation token and the deadline between slices.
 */
class StepWaiter {
public:
    StepWaiter(asio::io_context& io, const CancellationToken& token,
               Clock::time_point deadline, std::chrono::milliseconds slice)
        : io_(io), token_(token), deadline_(deadline), slice_(slice) {}

    Result<void> wait(const bool& done, const std::function<void()>& abort) {
        while (!done) {
            if (token_.is_cancelled()) {
                drain(abort);
                return Err<void>(cancelled_error("Request cancelled"));
            }
            if (Clock::now() >= deadline_) {
                drain(abort);
                return Err<void>(timeout_error("Request timed out"));
            }

            const auto handled = io_.run_one_for(slice_);
            if (handled == 0 && io_.stopped()) {
                if (!done) {
                    return Err<void>(transport_error("Event loop ran out of work"));
                }
            }
            if (io_.stopped()) {
                io_.restart();
            }
        }
        return Ok();
    }

private:
    // Abort outstanding operations and let their handlers run with operation_aborted
    void drain(const std::function<void()>& abort) {
        abort();
        io_.restart();
        io_.run();
    }

    asio::io_context& io_;
    const CancellationToken& token_;
    Clock::time_point deadline_;
    std::chrono::milliseconds slice_;
};

bool is_end_of_stream(const boost::system::error_code& ec) {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template <typename Stream, typename Handshake>
Result<HttpResponse> exchange(Stream& stream,
                              tcp::socket& socket,
                              const tcp::resolver::results_type& endpoints,
                              const HttpRequest& request,
                              StepWaiter& waiter,
                              Handshake&& handshake) {
    const auto close_socket = [&socket]() {
        boost::system::error_code close_ec;
        socket.close(close_ec);
    };

    bool done = false;
    boost::system::error_code ec;

    asio::async_connect(socket, endpoints,
        [&](const boost::system::error_code& e, const tcp::endpoint&) {
            ec = e;
            done = true;
        });
    if (auto waited = waiter.wait(done, close_socket); waited.is_error()) {
        return Err<HttpResponse>(waited.error());
    }
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to connect to " + request.url.authority() +
                                                 ": " + ec.message()));
    }

    if (auto shaken = handshake(close_socket); shaken.is_error()) {
        return Err<HttpResponse>(shaken.error());
    }

    const std::vector<uint8_t> wire = request.serialize();
    done = false;
    asio::async_write(stream, asio::buffer(wire),
        [&](const boost::system::error_code& e, std::size_t) {
            ec = e;
            done = true;
        });
    if (auto waited = waiter.wait(done, close_socket); waited.is_error()) {
        return Err<HttpResponse>(waited.error());
    }
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to send request: " + ec.message()));
    }

    HttpResponseParser parser;
    parser.expect_no_body(request.method == HttpMethod::HEAD);
    std::array<char, 8192> buffer{};

    while (true) {
        done = false;
        std::size_t bytes_read = 0;
        stream.async_read_some(asio::buffer(buffer),
            [&](const boost::system::error_code& e, std::size_t n) {
                ec = e;
                bytes_read = n;
                done = true;
            });
        if (auto waited = waiter.wait(done, close_socket); waited.is_error()) {
            return Err<HttpResponse>(waited.error());
        }

        if (bytes_read > 0) {
            auto parsed = parser.parse(buffer.data(), bytes_read);
            if (parsed.is_error()) {
                close_socket();
                return Err<HttpResponse>(parsed.error());
            }
            if (parsed.value()) {
                break;
            }
        }

        if (is_end_of_stream(ec)) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }
        if (ec) {
            return Err<HttpResponse>(transport_error("Failed to read response: " + ec.message()));
        }
    }

    close_socket();
    return Ok(parser.get_response());
}

} // namespace

AsioHttpClient::AsioHttpClient(AsioHttpClientOptions options)
    : options_(options)
    , ssl_context_(asio::ssl::context::tls_client) {
    ssl_context_.set_options(
        asio::ssl::context::default_workarounds |
        asio::ssl::context::no_sslv2 |
        asio::ssl::context::no_sslv3);

    boost::system::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Could not load default CA certificates: {}", ec.message());
    }
}

Result<HttpResponse> AsioHttpClient::send(const HttpRequest& request,
                                          const CancellationToken& token) {
    const Url& url = request.url;
    if (!url.has_host()) {
        return Err<HttpResponse>(transport_error("Request URL has no host: " + url.to_string()));
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<HttpResponse>(transport_error("Unsupported URL scheme: " + url.scheme));
    }
    if (token.is_cancelled()) {
        return Err<HttpResponse>(cancelled_error("Request cancelled before it was sent"));
    }

    spdlog::debug("{} {}", HttpMethodUtils::to_string(request.method), url.to_string());

    asio::io_context io;
    StepWaiter waiter(io, token, Clock::now() + options_.timeout, options_.poll_interval);

    tcp::resolver resolver(io);
    tcp::resolver::results_type endpoints;
    bool done = false;
    boost::system::error_code ec;

    resolver.async_resolve(url.host, std::to_string(url.effective_port()),
        [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            done = true;
        });
    if (auto waited = waiter.wait(done, [&resolver]() { resolver.cancel(); }); waited.is_error()) {
        return Err<HttpResponse>(waited.error());
    }
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to resolve " + url.host + ": " + ec.message()));
    }

    Result<HttpResponse> result = Err<HttpResponse>(transport_error("Request was not sent"));

    if (url.is_secure()) {
        asio::ssl::stream<tcp::socket> stream(io, ssl_context_);

        // SNI is required by most TLS front ends
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            return Err<HttpResponse>(transport_error("Failed to set TLS server name for " + url.host));
        }
        if (options_.verify_peer) {
            stream.set_verify_mode(asio::ssl::verify_peer);
            stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        } else {
            stream.set_verify_mode(asio::ssl::verify_none);
        }

        auto handshake = [&](const std::function<void()>& abort) -> Result<void> {
            bool shaken = false;
            boost::system::error_code handshake_ec;
            stream.async_handshake(asio::ssl::stream_base::client,
                [&](const boost::system::error_code& e) {
                    handshake_ec = e;
                    shaken = true;
                });
            if (auto waited = waiter.wait(shaken, abort); waited.is_error()) {
                return waited;
            }
            if (handshake_ec) {
                return Err<void>(transport_error("TLS handshake with " + url.host +
                                                 " failed: " + handshake_ec.message()));
            }
            return Ok();
        };

        result = exchange(stream, stream.next_layer(), endpoints, request, waiter, handshake);
    } else {
        tcp::socket socket(io);
        auto no_handshake = [](const std::function<void()>&) -> Result<void> { return Ok(); };
        result = exchange(socket, socket, endpoints, request, waiter, no_handshake);
    }

    if (result.is_ok()) {
        spdlog::debug("{} {} -> {}", HttpMethodUtils::to_string(request.method),
                      url.to_string(), result.value().status_code);
    }
    return result;
}

} // namespace network
} // namespace tusup
