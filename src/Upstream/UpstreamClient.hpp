#pragma once

#include "../SingleFlight/Cancellation.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <stdexcept>
#include <string>

using boost::asio::ip::tcp;

class UpstreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Line-oriented request/response against the upstream service: one
// connection per request, "query\n" out, one '\n'-terminated line back.
class UpstreamClient {
public:
    UpstreamClient(std::string host, unsigned short port, int timeout_ms);

    // Throws UpstreamError on network failure or timeout, CallerCancelled if
    // the token is cancelled first.
    std::string request(const CancellationToken& token, const std::string& query) const;

    const std::string& host() const { return host_; }
    unsigned short port() const { return port_; }

private:
    void runOperation(boost::asio::io_context& io_context, tcp::socket& socket,
                      const bool& done, const char* operation) const;

    std::string host_;
    unsigned short port_;
    std::chrono::milliseconds timeout_;
};
