#include "Session.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <string>
#include <utility>

static std::string describe_error(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

static std::string format_result(const Result<std::string>& result) {
    if (!result.ok()) {
        return "ERR " + describe_error(result.error);
    }
    return std::string("OK ") + (result.shared ? "1" : "0") + " " + result.value;
}

static bool is_expected_error(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::connection_reset;
}

Session::Session(tcp::socket client_socket, QueryCoalescer& coalescer,
                 CancellationToken shutdown_token)
    : coalescer_(coalescer),
      client_socket_(std::move(client_socket)),
      shutdown_token_(std::move(shutdown_token)),
      closed_(false) {
}

Session::~Session() {
    spdlog::debug("[Session] Destroyed");
}

void Session::start() {
    boost::system::error_code ec;
    auto remote = client_socket_.remote_endpoint(ec);
    if (!ec) {
        spdlog::debug("[Session] Client connected from {}:{}",
                      remote.address().to_string(), remote.port());
    }
    read_request();
}

void Session::read_request() {
    auto self = shared_from_this();
    boost::asio::async_read_until(client_socket_,
                                  boost::asio::dynamic_buffer(read_buffer_, kMaxLineLength), '\n',
        [this, self](const boost::system::error_code& ec, std::size_t length) {
            if (ec == boost::asio::error::not_found) {
                spdlog::warn("[Session] Request line exceeds {} bytes, closing", kMaxLineLength);
                read_buffer_.clear();
                close_after_write_ = true;
                queue_response("ERR line too long");
                return;
            }
            if (ec) {
                if (!is_expected_error(ec)) {
                    spdlog::warn("[Session] Read error: {}", ec.message());
                }
                close();
                return;
            }

            std::string line = read_buffer_.substr(0, length - 1);
            read_buffer_.erase(0, length);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            handle_request(line);
            read_request();
        });
}

void Session::handle_request(const std::string& line) {
    auto space = line.find(' ');
    std::string command = line.substr(0, space);
    std::string argument = space == std::string::npos ? std::string() : line.substr(space + 1);

    if (command == "GET" && !argument.empty()) {
        handle_get(argument);
    } else if (command == "FORGET" && !argument.empty()) {
        handle_forget(argument);
    } else if (command == "STATS" && argument.empty()) {
        handle_stats();
    } else {
        spdlog::debug("[Session] Unknown command: {}", line);
        queue_response("ERR unknown command");
    }
}

void Session::handle_get(const std::string& query) {
    ResultChannel<std::string> channel;
    try {
        channel = coalescer_.fetchAsync(shutdown_token_, query);
    } catch (const std::exception& e) {
        spdlog::error("[Session] Failed to start fetch: {}", e.what());
        queue_response(std::string("ERR ") + e.what());
        return;
    }

    // The callback runs on whichever thread completes the fetch; hop back
    // onto the session's strand before touching the write queue.
    auto self = shared_from_this();
    channel.onReady([self](const Result<std::string>& result) {
        std::string response = format_result(result);
        boost::asio::post(self->client_socket_.get_executor(),
            [self, response = std::move(response)]() mutable {
                self->queue_response(std::move(response));
            });
    });
}

void Session::handle_forget(const std::string& query) {
    bool forgotten = false;
    try {
        forgotten = coalescer_.forget(query);
    } catch (const std::exception& e) {
        spdlog::error("[Session] Failed to forget query: {}", e.what());
        queue_response(std::string("ERR ") + e.what());
        return;
    }
    queue_response(forgotten ? "FORGOTTEN" : "SHARED");
}

void Session::handle_stats() {
    auto stats = coalescer_.getStats();
    queue_response("STATS executions=" + std::to_string(stats.executions) +
                   " joins=" + std::to_string(stats.joins) +
                   " forgotten=" + std::to_string(stats.forgotten) +
                   " inflight=" + std::to_string(stats.in_flight));
}

void Session::queue_response(std::string response) {
    if (closed_.load()) {
        return;
    }

    bool idle = write_queue_.empty();
    write_queue_.push_back(std::move(response) + "\n");
    if (idle) {
        write_next();
    }
}

void Session::write_next() {
    auto self = shared_from_this();
    boost::asio::async_write(client_socket_, boost::asio::buffer(write_queue_.front()),
        [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (!is_expected_error(ec)) {
                    spdlog::warn("[Session] Write error: {}", ec.message());
                }
                close();
                return;
            }

            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                write_next();
            } else if (close_after_write_) {
                close();
            }
        });
}

void Session::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }

    spdlog::debug("[Session] Closing session");

    boost::system::error_code ec;
    client_socket_.shutdown(tcp::socket::shutdown_both, ec);
    client_socket_.close(ec);
}
