#include "UpstreamClient.hpp"
#include <spdlog/spdlog.h>

UpstreamClient::UpstreamClient(std::string host, unsigned short port, int timeout_ms)
    : host_(std::move(host)), port_(port), timeout_(timeout_ms) {
}

std::string UpstreamClient::request(const CancellationToken& token, const std::string& query) const {
    if (token.isCancellationRequested()) {
        throw CallerCancelled();
    }

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);

    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        throw UpstreamError("resolve " + host_ + ": " + ec.message());
    }

    // Closing the socket aborts whichever operation is pending.
    CancellationRegistration registration = token.registerCallback([&io_context, &socket] {
        boost::asio::post(io_context, [&socket] {
            boost::system::error_code ignored;
            socket.close(ignored);
        });
    });

    bool done = false;
    boost::asio::async_connect(socket, endpoints,
        [&ec, &done](const boost::system::error_code& error, const tcp::endpoint&) {
            ec = error;
            done = true;
        });
    runOperation(io_context, socket, done, "connect");
    if (token.isCancellationRequested()) {
        throw CallerCancelled();
    }
    if (ec) {
        throw UpstreamError("connect " + host_ + ":" + std::to_string(port_) + ": " + ec.message());
    }

    std::string request_line = query + "\n";
    done = false;
    boost::asio::async_write(socket, boost::asio::buffer(request_line),
        [&ec, &done](const boost::system::error_code& error, std::size_t) {
            ec = error;
            done = true;
        });
    runOperation(io_context, socket, done, "write");
    if (token.isCancellationRequested()) {
        throw CallerCancelled();
    }
    if (ec) {
        throw UpstreamError("write: " + ec.message());
    }

    std::string response;
    std::size_t length = 0;
    done = false;
    boost::asio::async_read_until(socket, boost::asio::dynamic_buffer(response), '\n',
        [&ec, &done, &length](const boost::system::error_code& error, std::size_t n) {
            ec = error;
            length = n;
            done = true;
        });
    runOperation(io_context, socket, done, "read");
    if (token.isCancellationRequested()) {
        throw CallerCancelled();
    }
    if (ec) {
        throw UpstreamError("read: " + ec.message());
    }

    response.resize(length - 1);
    if (!response.empty() && response.back() == '\r') {
        response.pop_back();
    }

    registration.reset();
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    return response;
}

void UpstreamClient::runOperation(boost::asio::io_context& io_context, tcp::socket& socket,
                                  const bool& done, const char* operation) const {
    io_context.restart();
    io_context.run_for(timeout_);
    if (done) {
        return;
    }

    boost::system::error_code ignored;
    socket.close(ignored);
    io_context.restart();
    io_context.run();

    spdlog::warn("[UpstreamClient] {} to {}:{} timed out after {} ms",
                 operation, host_, port_, timeout_.count());
    throw UpstreamError(std::string(operation) + " timed out");
}
