#pragma once

#include "tusup/core/result.hpp"
#include "tusup/network/cancellation.hpp"
#include "tusup/network/http_types.hpp"

namespace tusup {
namespace network {

/**
 * @brief Transport used by the upload client
 *
 * One call is one request/response exchange. Implementations return the
 * response whatever its status code; only transport failures are errors.
 * When @p token is cancelled while the request is in flight the call returns
 * a Cancelled error as soon as it notices.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request,
                                      const CancellationToken& token) = 0;
};

} // namespace network
} // namespace tusup
