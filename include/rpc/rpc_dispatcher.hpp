// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_RPC_RPC_DISPATCHER_HPP
#define MINTNODE_RPC_RPC_DISPATCHER_HPP

#include "chain/ledger_handle.hpp"
#include "network/message.hpp"
#include <exception>
#include <functional>
#include <map>
#include <memory>

namespace mintnode {

namespace metrics { class MetricsRegistry; }
namespace network {
class NotificationSink;
class SubscriptionHub;
}

namespace rpc {

// Who is asking. The sink is used by Subscribe.
struct RequestContext {
  uint64_t session_id{0};
  std::weak_ptr<network::NotificationSink> sink;
};

/**
 * RPC dispatcher
 *
 * Maps a typed request to a typed response. Holds no per-session state; side
 * effects go through the ledger handle or the subscription hub.
 */
class RPCDispatcher {
public:
    // Receives the response exactly once. May run inline or on the ledger strand.
    using ResponseHandler =
        std::function<void(std::unique_ptr<message::Message>)>;
    using RequestHandler = std::function<void(
        const message::Message &, const RequestContext &, ResponseHandler)>;

    RPCDispatcher(chain::LedgerHandlePtr ledger,
                  network::SubscriptionHub &hub,
                  metrics::MetricsRegistry &metrics);

    /**
     * Serve one request. Never throws and never answers with nullptr: unknown
     * requests and engine faults come back as ErrorResponse. Requests that
     * touch the ledger complete later, from the ledger strand; the caller
     * must not block waiting for on_response.
     */
    void Dispatch(const message::Message &request, const RequestContext &ctx,
                  ResponseHandler on_response);

    // Acknowledgement for a session that completed its handshake
    std::unique_ptr<message::HandshakeResponse> BuildHandshakeAck(uint64_t session_id);

private:
    void RegisterHandlers();

    void HandleSubmitTx(const message::SubmitTxRequest &req,
                        const RequestContext &ctx, ResponseHandler done);
    void HandleGetProperties(const RequestContext &ctx, ResponseHandler done);
    void HandleGetBlock(const message::GetBlockRequest &req,
                        const RequestContext &ctx, ResponseHandler done);
    void HandleGetBalance(const message::GetBalanceRequest &req,
                          const RequestContext &ctx, ResponseHandler done);
    std::unique_ptr<message::Message> HandleSubscribe(const RequestContext &ctx);
    std::unique_ptr<message::Message> HandleUnsubscribe(const RequestContext &ctx);
    std::unique_ptr<message::Message> HandlePing(const message::PingMessage &req);

    // Logs an engine fault and turns it into the generic error response
    static std::unique_ptr<message::Message>
    InternalError(const char *request, uint64_t session_id,
                  std::exception_ptr error);

    chain::LedgerHandlePtr ledger_;
    network::SubscriptionHub &hub_;
    metrics::MetricsRegistry &metrics_;
    std::map<message::MessageType, RequestHandler> handlers_;
};

} // namespace rpc
} // namespace mintnode

#endif // MINTNODE_RPC_RPC_DISPATCHER_HPP
