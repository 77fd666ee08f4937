#pragma once

#include "../QueryCoalescer/QueryCoalescer.hpp"
#include "../SingleFlight/Cancellation.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

using boost::asio::ip::tcp;

// One client connection. Requests are newline-terminated commands:
//   GET <query>     -> OK <shared 0|1> <value>  |  ERR <message>
//   FORGET <query>  -> FORGOTTEN | SHARED
//   STATS           -> STATS executions=.. joins=.. forgotten=.. inflight=..
// GET replies are written as their results arrive, so they may come back in
// a different order than the requests.
class Session : public std::enable_shared_from_this<Session> {
public:
    // client_socket's executor must be a strand; every handler runs on it.
    // Fetches are started with shutdown_token rather than a per-connection
    // token: a fetch may be shared with other clients, so one client going
    // away must not abort it.
    Session(tcp::socket client_socket, QueryCoalescer& coalescer,
            CancellationToken shutdown_token);
    ~Session();
    void start();

    // Longest request line accepted; a client that sends more without a
    // newline gets "ERR line too long" and is disconnected.
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

private:
    QueryCoalescer& coalescer_;
    tcp::socket client_socket_;
    std::string read_buffer_;
    std::deque<std::string> write_queue_;
    CancellationToken shutdown_token_;
    std::atomic<bool> closed_;
    bool close_after_write_ = false;

    void read_request();
    void handle_request(const std::string& line);
    void handle_get(const std::string& query);
    void handle_forget(const std::string& query);
    void handle_stats();
    void queue_response(std::string response);
    void write_next();
    void close();
};
