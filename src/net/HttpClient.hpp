// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <net/Http.hpp>

#include <chrono>
#include <stop_token>
#include <string>

namespace mcpmux::net
{

/// @brief Outgoing request for fetch().
struct HttpClientRequest
{
    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    std::string body;
    std::chrono::milliseconds timeout { 5000 };
    std::stop_token cancel; ///< A stop request aborts the exchange with a TransportError.
};

/// @brief Performs a single HTTP/1.1 request over a fresh connection.
///
/// The whole exchange (resolve, connect, TLS handshake, write, read) is bounded by
/// the request timeout. https URLs verify the peer against the system trust store.
/// A stop request on `cancel` is noticed within a few milliseconds.
/// @return The response (of any status) or ConnectionError / TimeoutError / TransportError.
[[nodiscard]] auto fetch(const HttpClientRequest& request) -> Result<HttpResponse>;

} // namespace mcpmux::net
