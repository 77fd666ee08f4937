#ifndef PROXY_SERVER_HPP
#define PROXY_SERVER_HPP

#include "../QueryCoalescer/QueryCoalescer.hpp"
#include "../SingleFlight/Cancellation.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <string>

using boost::asio::ip::tcp;

class ProxyServer {
public:
    ProxyServer(boost::asio::io_context& io_context,
                const std::string& listen_address, unsigned short port,
                QueryCoalescer& coalescer);

    // Stops accepting and cancels the token handed to in-flight fetches.
    void shutdown();

    // Waits on signals and, when one arrives, shuts the server down and then
    // calls on_signal with the signal number. Both run as an ordinary handler
    // on the signal set's executor, never in signal context.
    void shutdownOnSignal(boost::asio::signal_set& signals, std::function<void(int)> on_signal);

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept();
    boost::asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    QueryCoalescer& coalescer_;
    CancellationSource shutdown_source_;
    std::atomic<bool> accepting_{true};
};

#endif // PROXY_SERVER_HPP
