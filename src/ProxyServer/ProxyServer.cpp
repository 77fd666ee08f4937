#include "ProxyServer.hpp"
#include "../Session/Session.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <utility>
#include <boost/asio/ip/address.hpp>

ProxyServer::ProxyServer(boost::asio::io_context& io_context,
                         const std::string& listen_address, unsigned short port,
                         QueryCoalescer& coalescer)
    : io_context_(io_context),
      acceptor_(io_context, tcp::endpoint(boost::asio::ip::make_address(listen_address), port)),
      coalescer_(coalescer) {

    spdlog::info("[ProxyServer] Listening on {}:{}", listen_address, this->port());
    do_accept();
}

void ProxyServer::shutdown() {
    if (!accepting_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
    shutdown_source_.cancel();
    spdlog::info("[ProxyServer] Stopped accepting new connections");
}

void ProxyServer::shutdownOnSignal(boost::asio::signal_set& signals,
                                   std::function<void(int)> on_signal) {
    signals.async_wait([this, on_signal = std::move(on_signal)](
                           const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("[ProxyServer] Signal wait failed: {}", ec.message());
            }
            return;
        }
        spdlog::info("[ProxyServer] Received signal {}, shutting down gracefully...", signal_number);
        shutdown();
        if (on_signal) {
            on_signal(signal_number);
        }
    });
}

void ProxyServer::do_accept() {
    if (!accepting_.load()) {
        return;
    }

    // Each connection gets its own strand so its handlers never run concurrently.
    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && accepting_.load()) {
                auto session = std::make_shared<Session>(std::move(socket), coalescer_,
                                                         shutdown_source_.getToken());
                session->start();
            } else if (ec && ec != boost::asio::error::operation_aborted) {
                spdlog::warn("[ProxyServer] Accept error: {}", ec.message());
            }
            if (accepting_.load()) {
                do_accept();
            }
        });
}
