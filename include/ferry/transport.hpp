/**
 * @file transport.hpp
 * @brief Request/response channel between two peers
 *
 * Ferry - Peer-to-peer encrypted bulk file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The engine assumes an authenticated point-to-point channel on which
 * either side may issue requests. Every request gets exactly one
 * completion: a response, or an error code (timeout, connection loss).
 */

#pragma once

#include "ferry/wire_protocol.hpp"

#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace ferry {

/**
 * @brief Completion of an outbound request
 *
 * Called exactly once. On success ec is clear and the response is set; on
 * failure ec is set and the response is empty.
 */
using ResponseHandler = std::function<void(std::error_code ec, std::optional<wire::Response> response)>;

/**
 * @brief Sends the single response to an inbound request
 */
using Responder = std::function<void(wire::Response response)>;

/**
 * @brief Handler for inbound requests
 * @param peer_id Identity of the requesting peer
 * @param request Decoded request
 * @param respond Must be called once with the response
 */
using RequestHandler = std::function<void(const std::string& peer_id, wire::Request request, Responder respond)>;

/**
 * @brief Abstract transport
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Send a request to a peer
     *
     * The handler runs on a transport thread. A transport that is not
     * running completes inline with an error.
     */
    virtual void async_request(const std::string& peer_id, wire::Request request, ResponseHandler handler) = 0;

    /**
     * @brief Install the handler for inbound requests
     */
    virtual void set_request_handler(RequestHandler handler) = 0;
};

} // namespace ferry
