#pragma once

#include "tusup/network/http_client.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tusup::test {

/**
 * @brief Scripted HttpClient for unit tests
 *
 * Responses are handed out in the order they were queued. A request that
 * arrives with nothing queued fails with a transport error. Every request is
 * recorded for later inspection along with its cancellation token. Like the
 * real transport, a request whose token is already cancelled is never sent:
 * it fails with a cancelled error, is counted in refused() and leaves the
 * script untouched.
 */
class FakeHttpClient : public network::HttpClient {
public:
    using Handler = std::function<Result<network::HttpResponse>(const network::HttpRequest&)>;

    void enqueue(int status, network::HeaderMap headers = {}, const std::string& body = {}) {
        network::HttpResponse response;
        response.status_code = status;
        response.headers = std::move(headers);
        response.body.assign(body.begin(), body.end());
        enqueue_result(Ok(std::move(response)));
    }

    void enqueue_result(Result<network::HttpResponse> result) {
        std::lock_guard lock(mutex_);
        script_.push_back([result](const network::HttpRequest&) { return result; });
    }

    void enqueue_handler(Handler handler) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(handler));
    }

    Result<network::HttpResponse> send(const network::HttpRequest& request,
                                       const network::CancellationToken& token) override {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            if (token.is_cancelled()) {
                ++refused_;
                return Err<network::HttpResponse>(cancelled_error("Request cancelled before sending"));
            }
            requests_.push_back(request);
            tokens_.push_back(token);
            if (script_.empty()) {
                return Err<network::HttpResponse>(transport_error("No scripted response for " +
                                                                  request.url.to_string()));
            }
            handler = std::move(script_.front());
            script_.pop_front();
        }
        return handler(request);
    }

    std::vector<network::HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    /// Token of the n-th recorded request.
    network::CancellationToken token(std::size_t index) const {
        std::lock_guard lock(mutex_);
        return tokens_.at(index);
    }

    std::size_t refused() const {
        std::lock_guard lock(mutex_);
        return refused_;
    }

    std::size_t count(network::HttpMethod method) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& request : requests_) {
            if (request.method == method) {
                ++n;
            }
        }
        return n;
    }

    std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return script_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Handler> script_;
    std::vector<network::HttpRequest> requests_;
    std::vector<network::CancellationToken> tokens_;
    std::size_t refused_ = 0;
};

inline network::HeaderMap offset_header(std::uint64_t offset) {
    return network::HeaderMap{{"Upload-Offset", std::to_string(offset)}};
}

} // namespace tusup::test
