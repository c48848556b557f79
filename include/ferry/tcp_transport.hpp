/**
 * @file tcp_transport.hpp
 * @brief TCP implementation of the transfer transport using ASIO
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides:
 * - Listening and outbound connections, one connection per peer
 * - Length-prefixed frames carrying CBOR messages
 * - Many concurrent requests per connection, matched by correlation id
 * - Per-request timeouts
 * - Requests in both directions over the same connection
 *
 * Frame layout (big endian):
 *   u32 body length | u64 correlation id | u8 kind (0 request, 1 response) | body
 *
 * The peer id of an outbound connection is the "host:port" it was opened
 * with; for an inbound connection it is the remote endpoint.
 */

#pragma once

#include "ferry/transport.hpp"
#include "ferry/transfer_config.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ferry {

/**
 * @brief Split "host:port" (IPv6 hosts in brackets)
 * @return (host, port), std::nullopt if malformed
 */
std::optional<std::pair<std::string, uint16_t>> parse_peer_address(const std::string& peer_id);

/**
 * @brief TcpTransport - framed request/response transport over TCP
 */
class TcpTransport : public Transport {
public:
    /**
     * @param listen_port Port to listen on (0 for automatic)
     * @param request_timeout Time a request may wait for its response
     * @param threads Number of I/O threads
     * @param offer_timeout Time an Offer may wait for the peer's decision
     */
    explicit TcpTransport(
        uint16_t listen_port = 0,
        std::chrono::milliseconds request_timeout = config::DEFAULT_REQUEST_TIMEOUT,
        size_t threads = config::DEFAULT_IO_THREADS,
        std::chrono::milliseconds offer_timeout = config::DEFAULT_OFFER_TIMEOUT
    );

    ~TcpTransport() override;

    // Disable copy and move
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;
    TcpTransport(TcpTransport&&) = delete;
    TcpTransport& operator=(TcpTransport&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Start listening and processing
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Stop; pending requests complete with connection_aborted
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Get listening port
     * @return Port number (0 if not started)
     */
    uint16_t get_listen_port() const;

    /// Number of open connections
    size_t connection_count() const;

    // ========================================================================
    // Transport
    // ========================================================================

    void async_request(const std::string& peer_id, wire::Request request, ResponseHandler handler) override;
    void set_request_handler(RequestHandler handler) override;

private:
    class Connection;
    friend class Connection;

    struct QueuedRequest {
        wire::Request request;
        ResponseHandler handler;
    };

    struct Connecting {
        std::shared_ptr<asio::ip::tcp::socket> socket;
        std::vector<QueuedRequest> queued;
    };

    void do_accept();
    void connect(const std::string& peer_id);
    void finish_connect(const std::string& peer_id, std::shared_ptr<asio::ip::tcp::socket> socket, std::error_code ec);
    void register_connection(const std::shared_ptr<Connection>& connection);
    void on_connection_closed(const std::string& peer_id, const Connection* connection);
    void dispatch_request(const std::string& peer_id, wire::Request request, Responder respond);
    void fail_handler(ResponseHandler handler, std::error_code ec);
    uint64_t next_correlation_id();

    asio::io_context io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<asio::ip::tcp::acceptor> tcp_acceptor_;
    std::vector<std::thread> worker_threads_;

    uint16_t listen_port_;
    const std::chrono::milliseconds request_timeout_;
    const std::chrono::milliseconds offer_timeout_;     ///< Offers wait on a person, not a disk
    const size_t thread_count_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> next_correlation_id_;

    mutable std::mutex connections_mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
    std::map<std::string, Connecting> connecting_;

    std::mutex handler_mutex_;
    RequestHandler request_handler_;
};

} // namespace ferry
