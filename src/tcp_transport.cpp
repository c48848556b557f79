/**
 * @file tcp_transport.cpp
 * @brief Implementation of the framed TCP transport
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ferry/tcp_transport.hpp"
#include "ferry/utilities.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <variant>

namespace ferry {

namespace {

constexpr size_t FRAME_HEADER_SIZE = 13;
constexpr uint8_t FRAME_KIND_REQUEST = 0;
constexpr uint8_t FRAME_KIND_RESPONSE = 1;

using Frame = std::shared_ptr<std::vector<uint8_t>>;

Frame make_frame(uint64_t correlation_id, uint8_t kind, const std::vector<uint8_t>& body) {
    auto frame = std::make_shared<std::vector<uint8_t>>();
    frame->reserve(FRAME_HEADER_SIZE + body.size());

    uint32_t length = static_cast<uint32_t>(body.size());
    for (int shift = 24; shift >= 0; shift -= 8) {
        frame->push_back(static_cast<uint8_t>(length >> shift));
    }
    for (int shift = 56; shift >= 0; shift -= 8) {
        frame->push_back(static_cast<uint8_t>(correlation_id >> shift));
    }
    frame->push_back(kind);
    frame->insert(frame->end(), body.begin(), body.end());
    return frame;
}

uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

uint64_t read_be64(const uint8_t* p) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | p[i];
    }
    return value;
}

std::string endpoint_to_peer_id(const asio::ip::tcp::endpoint& endpoint) {
    const auto address = endpoint.address();
    if (address.is_v6()) {
        return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
    }
    return address.to_string() + ":" + std::to_string(endpoint.port());
}

void invoke_handler(const ResponseHandler& handler, std::error_code ec, std::optional<wire::Response> response) {
    try {
        handler(ec, std::move(response));
    } catch (const std::exception& e) {
        utilities::log_error("Response handler threw: " + std::string(e.what()));
    }
}

} // anonymous namespace

std::optional<std::pair<std::string, uint16_t>> parse_peer_address(const std::string& peer_id) {
    std::string host;
    std::string port_text;

    if (!peer_id.empty() && peer_id.front() == '[') {
        auto close = peer_id.find(']');
        if (close == std::string::npos || close + 1 >= peer_id.size() || peer_id[close + 1] != ':') {
            return std::nullopt;
        }
        host = peer_id.substr(1, close - 1);
        port_text = peer_id.substr(close + 2);
    } else {
        auto colon = peer_id.rfind(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        host = peer_id.substr(0, colon);
        port_text = peer_id.substr(colon + 1);
    }

    if (host.empty() || port_text.empty() || port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<uint16_t>(port));
}

// ============================================================================
// Connection
// ============================================================================

/**
 * @brief One TCP connection; all state is confined to its strand
 */
class TcpTransport::Connection : public std::enable_shared_from_this<TcpTransport::Connection> {
public:
    Connection(TcpTransport& owner, asio::ip::tcp::socket socket, std::string peer_id)
        : owner_(owner)
        , socket_(std::move(socket))
        , strand_(asio::make_strand(owner.io_context_))
        , peer_id_(std::move(peer_id))
        , closed_(false)
    {
    }

    const std::string& peer_id() const { return peer_id_; }

    void start() {
        asio::post(strand_, [self = shared_from_this()]() {
            self->read_header();
        });
    }

    void send_request(uint64_t correlation_id, wire::Request request, ResponseHandler handler) {
        asio::post(strand_, [self = shared_from_this(), correlation_id,
                             request = std::move(request), handler = std::move(handler)]() mutable {
            self->begin_request(correlation_id, request, std::move(handler));
        });
    }

    void send_response(uint64_t correlation_id, const wire::Response& response) {
        auto body = wire::encode_response(response);
        if (body.size() > config::MAX_MESSAGE_SIZE) {
            utilities::log_error("Response too large for peer " + peer_id_ + ": " + std::to_string(body.size()) + " bytes");
            return;
        }
        auto frame = make_frame(correlation_id, FRAME_KIND_RESPONSE, body);
        asio::post(strand_, [self = shared_from_this(), frame]() {
            self->enqueue_frame(frame);
        });
    }

    void close() {
        asio::post(strand_, [self = shared_from_this()]() {
            self->close_on_strand(asio::error::connection_aborted);
        });
    }

private:
    struct Pending {
        ResponseHandler handler;
        std::shared_ptr<asio::steady_timer> timer;
    };

    void begin_request(uint64_t correlation_id, const wire::Request& request, ResponseHandler handler) {
        if (closed_) {
            invoke_handler(handler, asio::error::not_connected, std::nullopt);
            return;
        }

        auto body = wire::encode_request(request);
        if (body.size() > config::MAX_MESSAGE_SIZE) {
            invoke_handler(handler, asio::error::message_size, std::nullopt);
            return;
        }

        auto timer = std::make_shared<asio::steady_timer>(strand_);
        timer->expires_after(std::holds_alternative<wire::OfferRequest>(request) ? owner_.offer_timeout_
                                                                                : owner_.request_timeout_);
        timer->async_wait([self = shared_from_this(), correlation_id](const std::error_code& ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            self->expire_request(correlation_id);
        });

        pending_.emplace(correlation_id, Pending{std::move(handler), timer});
        enqueue_frame(make_frame(correlation_id, FRAME_KIND_REQUEST, body));
    }

    void expire_request(uint64_t correlation_id) {
        auto it = pending_.find(correlation_id);
        if (it == pending_.end()) {
            return;
        }
        auto handler = std::move(it->second.handler);
        pending_.erase(it);

        utilities::log_debug("Request " + std::to_string(correlation_id) + " to " + peer_id_ + " timed out");
        invoke_handler(handler, asio::error::timed_out, std::nullopt);
    }

    void enqueue_frame(Frame frame) {
        if (closed_) {
            return;
        }
        write_queue_.push_back(std::move(frame));
        if (write_queue_.size() == 1) {
            write_next();
        }
    }

    void write_next() {
        asio::async_write(
            socket_,
            asio::buffer(*write_queue_.front()),
            asio::bind_executor(strand_, [self = shared_from_this()](const std::error_code& ec, std::size_t) {
                if (self->closed_) {
                    return;
                }
                if (ec) {
                    self->close_on_strand(ec);
                    return;
                }
                self->write_queue_.pop_front();
                if (!self->write_queue_.empty()) {
                    self->write_next();
                }
            })
        );
    }

    void read_header() {
        asio::async_read(
            socket_,
            asio::buffer(header_),
            asio::bind_executor(strand_, [self = shared_from_this()](const std::error_code& ec, std::size_t) {
                if (ec) {
                    self->close_on_strand(ec);
                    return;
                }

                uint32_t length = read_be32(self->header_.data());
                uint64_t correlation_id = read_be64(self->header_.data() + 4);
                uint8_t kind = self->header_[12];

                if (length == 0 || length > config::MAX_MESSAGE_SIZE) {
                    utilities::log_warn("Invalid frame length " + std::to_string(length) + " from " + self->peer_id_);
                    self->close_on_strand(asio::error::message_size);
                    return;
                }

                self->body_.resize(length);
                self->read_body(correlation_id, kind);
            })
        );
    }

    void read_body(uint64_t correlation_id, uint8_t kind) {
        asio::async_read(
            socket_,
            asio::buffer(body_),
            asio::bind_executor(strand_, [self = shared_from_this(), correlation_id, kind](const std::error_code& ec, std::size_t) {
                if (ec) {
                    self->close_on_strand(ec);
                    return;
                }
                if (!self->handle_frame(correlation_id, kind)) {
                    self->close_on_strand(asio::error::invalid_argument);
                    return;
                }
                self->read_header();
            })
        );
    }

    bool handle_frame(uint64_t correlation_id, uint8_t kind) {
        if (kind == FRAME_KIND_REQUEST) {
            auto request = wire::decode_request(body_);
            if (!request) {
                utilities::log_warn("Dropping malformed request from " + peer_id_);
                return true;
            }

            std::weak_ptr<Connection> weak_self = shared_from_this();
            Responder respond = [weak_self, correlation_id](wire::Response response) {
                if (auto self = weak_self.lock()) {
                    self->send_response(correlation_id, response);
                } else {
                    utilities::log_debug("Connection gone; dropping " + wire::response_type_name(response));
                }
            };
            owner_.dispatch_request(peer_id_, std::move(*request), std::move(respond));
            return true;
        }

        if (kind == FRAME_KIND_RESPONSE) {
            auto it = pending_.find(correlation_id);
            if (it == pending_.end()) {
                // Late response to a request that already timed out
                return true;
            }
            Pending pending = std::move(it->second);
            pending_.erase(it);
            pending.timer->cancel();

            auto response = wire::decode_response(body_);
            if (!response) {
                invoke_handler(pending.handler, std::make_error_code(std::errc::bad_message), std::nullopt);
            } else {
                invoke_handler(pending.handler, std::error_code(), std::move(*response));
            }
            return true;
        }

        utilities::log_warn("Unknown frame kind " + std::to_string(kind) + " from " + peer_id_);
        return false;
    }

    void close_on_strand(std::error_code reason) {
        if (closed_) {
            return;
        }
        closed_ = true;

        if (reason == asio::error::eof) {
            utilities::log_info("Peer " + peer_id_ + " disconnected");
        } else {
            utilities::log_info("Connection to " + peer_id_ + " closed: " + reason.message());
        }

        std::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        write_queue_.clear();

        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& [correlation_id, entry] : pending) {
            entry.timer->cancel();
            invoke_handler(entry.handler, asio::error::connection_aborted, std::nullopt);
        }

        owner_.on_connection_closed(peer_id_, this);
    }

    TcpTransport& owner_;
    asio::ip::tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
    const std::string peer_id_;

    std::array<uint8_t, FRAME_HEADER_SIZE> header_{};
    std::vector<uint8_t> body_;
    std::deque<Frame> write_queue_;
    std::map<uint64_t, Pending> pending_;
    bool closed_;
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

TcpTransport::TcpTransport(
    uint16_t listen_port,
    std::chrono::milliseconds request_timeout,
    size_t threads,
    std::chrono::milliseconds offer_timeout
)
    : io_context_()
    , tcp_acceptor_(nullptr)
    , listen_port_(listen_port)
    , request_timeout_(request_timeout)
    , offer_timeout_(offer_timeout)
    , thread_count_(std::max<size_t>(1, threads))
    , running_(false)
    , next_correlation_id_(1)
{
}

TcpTransport::~TcpTransport() {
    stop();
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool TcpTransport::start() {
    if (running_.exchange(true)) {
        utilities::log_warn("TcpTransport already running");
        return false;
    }

    try {
        io_context_.restart();
        work_guard_.emplace(asio::make_work_guard(io_context_));

        tcp_acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(
            io_context_,
            asio::ip::tcp::endpoint(asio::ip::tcp::v4(), listen_port_)
        );
        listen_port_ = tcp_acceptor_->local_endpoint().port();

        utilities::log_info("TcpTransport listening on port " + std::to_string(listen_port_));

        do_accept();

        for (size_t i = 0; i < thread_count_; ++i) {
            worker_threads_.emplace_back([this]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    utilities::log_error("Worker thread error: " + std::string(e.what()));
                }
            });
        }

        utilities::log_info("TcpTransport started with " + std::to_string(worker_threads_.size()) + " threads");
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Failed to start TcpTransport: " + std::string(e.what()));
        tcp_acceptor_.reset();
        work_guard_.reset();
        running_ = false;
        return false;
    }
}

void TcpTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    utilities::log_info("Stopping TcpTransport...");

    asio::post(io_context_, [this]() {
        std::error_code ignored;
        if (tcp_acceptor_ && tcp_acceptor_->is_open()) {
            tcp_acceptor_->close(ignored);
        }
    });

    std::vector<std::shared_ptr<Connection>> connections;
    std::map<std::string, Connecting> connecting;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& [peer_id, connection] : connections_) {
            connections.push_back(connection);
        }
        connecting.swap(connecting_);
    }

    for (auto& connection : connections) {
        connection->close();
    }

    for (auto& [peer_id, pending] : connecting) {
        if (pending.socket) {
            auto socket = pending.socket;
            asio::post(socket->get_executor(), [socket]() {
                std::error_code ignored;
                socket->close(ignored);
            });
        }
        for (auto& queued : pending.queued) {
            fail_handler(std::move(queued.handler), asio::error::operation_aborted);
        }
    }

    // Let outstanding handlers drain, then join
    work_guard_.reset();
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.clear();
    }
    tcp_acceptor_.reset();

    utilities::log_info("TcpTransport stopped");
}

bool TcpTransport::is_running() const {
    return running_;
}

uint16_t TcpTransport::get_listen_port() const {
    return listen_port_;
}

size_t TcpTransport::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

// ============================================================================
// Transport
// ============================================================================

void TcpTransport::async_request(const std::string& peer_id, wire::Request request, ResponseHandler handler) {
    if (!running_) {
        invoke_handler(handler, asio::error::not_connected, std::nullopt);
        return;
    }

    std::shared_ptr<Connection> connection;
    bool start_connect = false;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(peer_id);
        if (it != connections_.end()) {
            connection = it->second;
        } else {
            auto [pending, inserted] = connecting_.try_emplace(peer_id);
            pending->second.queued.push_back(QueuedRequest{std::move(request), std::move(handler)});
            start_connect = inserted;
        }
    }

    if (connection) {
        connection->send_request(next_correlation_id(), std::move(request), std::move(handler));
        return;
    }
    if (start_connect) {
        connect(peer_id);
    }
}

void TcpTransport::set_request_handler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    request_handler_ = std::move(handler);
}

// ============================================================================
// Private Methods
// ============================================================================

void TcpTransport::do_accept() {
    tcp_acceptor_->async_accept([this](const std::error_code& error, asio::ip::tcp::socket socket) {
        if (!error) {
            std::error_code endpoint_error;
            auto remote = socket.remote_endpoint(endpoint_error);
            if (!endpoint_error) {
                std::error_code ignored;
                socket.set_option(asio::ip::tcp::no_delay(true), ignored);

                auto connection = std::make_shared<Connection>(*this, std::move(socket), endpoint_to_peer_id(remote));
                utilities::log_info("Accepted connection from " + connection->peer_id());
                register_connection(connection);
                connection->start();
            }
        } else if (error != asio::error::operation_aborted) {
            utilities::log_warn("Accept failed: " + error.message());
        }

        if (running_ && tcp_acceptor_->is_open()) {
            do_accept();
        }
    });
}

void TcpTransport::connect(const std::string& peer_id) {
    auto address = parse_peer_address(peer_id);
    if (!address) {
        utilities::log_error("Invalid peer address: " + peer_id);
        finish_connect(peer_id, nullptr, asio::error::invalid_argument);
        return;
    }

    auto strand = asio::make_strand(io_context_);
    auto socket = std::make_shared<asio::ip::tcp::socket>(strand);
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(strand);
    auto timer = std::make_shared<asio::steady_timer>(strand);
    auto timed_out = std::make_shared<bool>(false);

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connecting_.find(peer_id);
        if (it == connecting_.end()) {
            // Stopped while we were parsing
            return;
        }
        it->second.socket = socket;
    }

    asio::post(strand, [this, peer_id, address, socket, resolver, timer, timed_out]() {
        timer->expires_after(config::CONNECTION_TIMEOUT);
        timer->async_wait([socket, resolver, timed_out](const std::error_code& ec) {
            if (ec) {
                return;
            }
            *timed_out = true;
            resolver->cancel();
            std::error_code ignored;
            socket->close(ignored);
        });

        resolver->async_resolve(
            address->first,
            std::to_string(address->second),
            [this, peer_id, socket, resolver, timer, timed_out](const std::error_code& resolve_error,
                                                                asio::ip::tcp::resolver::results_type results) {
                if (resolve_error) {
                    timer->cancel();
                    finish_connect(peer_id, socket, *timed_out ? std::error_code(asio::error::timed_out) : resolve_error);
                    return;
                }

                asio::async_connect(
                    *socket,
                    results,
                    [this, peer_id, socket, timer, timed_out](const std::error_code& connect_error,
                                                              const asio::ip::tcp::endpoint&) {
                        timer->cancel();
                        finish_connect(peer_id, socket,
                                       *timed_out ? std::error_code(asio::error::timed_out) : connect_error);
                    }
                );
            }
        );
    });
}

void TcpTransport::finish_connect(const std::string& peer_id,
                                  std::shared_ptr<asio::ip::tcp::socket> socket,
                                  std::error_code ec) {
    std::vector<QueuedRequest> queued;
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connecting_.find(peer_id);
        if (it == connecting_.end()) {
            // stop() already failed the queued requests
            return;
        }
        queued = std::move(it->second.queued);
        connecting_.erase(it);

        if (!ec && !running_) {
            ec = asio::error::operation_aborted;
        }
        if (!ec && socket) {
            std::error_code ignored;
            socket->set_option(asio::ip::tcp::no_delay(true), ignored);
            connection = std::make_shared<Connection>(*this, std::move(*socket), peer_id);
            connections_[peer_id] = connection;
        }
    }

    if (!connection) {
        if (!ec) {
            ec = asio::error::not_connected;
        }
        utilities::log_warn("Failed to connect to " + peer_id + ": " + ec.message());
        for (auto& request : queued) {
            invoke_handler(request.handler, ec, std::nullopt);
        }
        return;
    }

    utilities::log_info("Connected to " + peer_id);
    connection->start();
    for (auto& request : queued) {
        connection->send_request(next_correlation_id(), std::move(request.request), std::move(request.handler));
    }
}

void TcpTransport::register_connection(const std::shared_ptr<Connection>& connection) {
    std::shared_ptr<Connection> replaced;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto& slot = connections_[connection->peer_id()];
        replaced = std::move(slot);
        slot = connection;
    }
    if (replaced) {
        replaced->close();
    }
}

void TcpTransport::on_connection_closed(const std::string& peer_id, const Connection* connection) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(peer_id);
    if (it != connections_.end() && it->second.get() == connection) {
        connections_.erase(it);
    }
}

void TcpTransport::dispatch_request(const std::string& peer_id, wire::Request request, Responder respond) {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = request_handler_;
    }

    if (!handler) {
        utilities::log_warn("No request handler; dropping " + wire::request_type_name(request) + " from " + peer_id);
        return;
    }

    // Off the connection strand so slow handlers do not stall reads
    asio::post(io_context_, [handler, peer_id, request = std::move(request), respond = std::move(respond)]() mutable {
        try {
            handler(peer_id, std::move(request), std::move(respond));
        } catch (const std::exception& e) {
            utilities::log_error("Request handler threw: " + std::string(e.what()));
        }
    });
}

void TcpTransport::fail_handler(ResponseHandler handler, std::error_code ec) {
    invoke_handler(handler, ec, std::nullopt);
}

uint64_t TcpTransport::next_correlation_id() {
    return next_correlation_id_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace ferry
