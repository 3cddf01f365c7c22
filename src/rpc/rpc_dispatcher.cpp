// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "rpc/rpc_dispatcher.hpp"
#include "metrics/metrics_registry.hpp"
#include "network/protocol.hpp"
#include "network/subscription_hub.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace mintnode {
namespace rpc {

using message::MessageType;

RPCDispatcher::RPCDispatcher(chain::LedgerHandlePtr ledger,
                             network::SubscriptionHub &hub,
                             metrics::MetricsRegistry &metrics)
    : ledger_(std::move(ledger)), hub_(hub), metrics_(metrics) {
  if (!ledger_) {
    throw std::invalid_argument("RPCDispatcher requires a ledger handle");
  }
  RegisterHandlers();
}

void RPCDispatcher::RegisterHandlers() {
  handlers_[MessageType::SUBMIT_TX] = [this](const auto &m, const auto &ctx,
                                             ResponseHandler done) {
    HandleSubmitTx(static_cast<const message::SubmitTxRequest &>(m), ctx,
                   std::move(done));
  };
  handlers_[MessageType::GET_PROPERTIES] = [this](const auto &, const auto &ctx,
                                                  ResponseHandler done) {
    HandleGetProperties(ctx, std::move(done));
  };
  handlers_[MessageType::GET_BLOCK] = [this](const auto &m, const auto &ctx,
                                             ResponseHandler done) {
    HandleGetBlock(static_cast<const message::GetBlockRequest &>(m), ctx,
                   std::move(done));
  };
  handlers_[MessageType::GET_BALANCE] = [this](const auto &m, const auto &ctx,
                                               ResponseHandler done) {
    HandleGetBalance(static_cast<const message::GetBalanceRequest &>(m), ctx,
                     std::move(done));
  };
  handlers_[MessageType::SUBSCRIBE] = [this](const auto &, const auto &ctx,
                                             ResponseHandler done) {
    done(HandleSubscribe(ctx));
  };
  handlers_[MessageType::UNSUBSCRIBE] = [this](const auto &, const auto &ctx,
                                               ResponseHandler done) {
    done(HandleUnsubscribe(ctx));
  };
  handlers_[MessageType::PING] = [this](const auto &m, const auto &,
                                        ResponseHandler done) {
    done(HandlePing(static_cast<const message::PingMessage &>(m)));
  };
  // Handshake is only valid as the first message; the session consumes it
  handlers_[MessageType::HANDSHAKE] = [](const auto &, const auto &,
                                         ResponseHandler done) {
    done(std::make_unique<message::ErrorResponse>(
        message::ErrorCode::PROTOCOL, "handshake already completed"));
  };
}

void RPCDispatcher::Dispatch(const message::Message &request,
                             const RequestContext &ctx,
                             ResponseHandler on_response) {
  auto it = handlers_.find(request.type());
  if (it == handlers_.end()) {
    LOG_RPC_DEBUG("session {} sent non-request message {}", ctx.session_id,
                  message::type_name(request.type()));
    on_response(std::make_unique<message::ErrorResponse>(
        message::ErrorCode::UNKNOWN_MESSAGE, "not a request"));
    return;
  }

  try {
    it->second(request, ctx, on_response);
  } catch (const std::exception &) {
    // Thrown before the handler answered, so the response is still owed
    on_response(InternalError(message::type_name(request.type()),
                              ctx.session_id, std::current_exception()));
  }
}

std::unique_ptr<message::Message>
RPCDispatcher::InternalError(const char *request, uint64_t session_id,
                             std::exception_ptr error) {
  // Full error stays in the log; the client gets a generic error
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    LOG_RPC_ERROR("request {} from session {} failed: {}", request, session_id,
                  e.what());
  }
  return std::make_unique<message::ErrorResponse>(
      message::ErrorCode::INTERNAL, "internal error");
}

std::unique_ptr<message::HandshakeResponse>
RPCDispatcher::BuildHandshakeAck(uint64_t session_id) {
  auto ack = std::make_unique<message::HandshakeResponse>();
  ack->protocol_version = protocol::PROTOCOL_VERSION;
  ack->user_agent = protocol::GetUserAgent();
  ack->session_id = session_id;
  // Last height published by the scheduler; reading it never waits on the ledger
  ack->chain_height = static_cast<uint64_t>(metrics_.chain_height.value());
  return ack;
}

void RPCDispatcher::HandleSubmitTx(const message::SubmitTxRequest &req,
                                   const RequestContext &ctx,
                                   ResponseHandler done) {
  const uint64_t session_id = ctx.session_id;
  ledger_->SubmitTransaction(
      req.tx, [this, tx = req.tx, session_id, done = std::move(done)](
                  std::exception_ptr error, chain::SubmitResult result) {
        if (error) {
          done(InternalError("SUBMIT_TX", session_id, error));
          return;
        }

        switch (result.status) {
        case chain::SubmitStatus::ACCEPTED:
          metrics_.transactions_accepted.inc();
          LOG_RPC_DEBUG("accepted tx {} ({} -> {}, amount={}, fee={})",
                        result.tx_id, tx.from, tx.to, tx.amount, tx.fee);
          done(std::make_unique<message::TxAcceptedResponse>(result.tx_id));
          return;

        case chain::SubmitStatus::DUPLICATE:
          metrics_.transactions_duplicate.inc();
          LOG_RPC_DEBUG("duplicate submission of tx {}", result.tx_id);
          done(std::make_unique<message::TxAcceptedResponse>(result.tx_id));
          return;

        case chain::SubmitStatus::REJECTED:
          break;
        }

        metrics_.transactions_rejected.inc();
        LOG_RPC_DEBUG("rejected tx from {}: {}", tx.from, result.reason);
        auto response = std::make_unique<message::TxRejectedResponse>();
        response->code = result.code;
        response->reason = result.reason;
        done(std::move(response));
      });
}

void RPCDispatcher::HandleGetProperties(const RequestContext &ctx,
                                        ResponseHandler done) {
  const uint64_t session_id = ctx.session_id;
  ledger_->GetProperties([session_id, done = std::move(done)](
                             std::exception_ptr error,
                             chain::ChainProperties props) {
    if (error) {
      done(InternalError("GET_PROPERTIES", session_id, error));
      return;
    }
    auto response = std::make_unique<message::PropertiesResponse>();
    response->properties = std::move(props);
    done(std::move(response));
  });
}

void RPCDispatcher::HandleGetBlock(const message::GetBlockRequest &req,
                                   const RequestContext &ctx,
                                   ResponseHandler done) {
  const uint64_t session_id = ctx.session_id;
  ledger_->GetBlock(req.height, [session_id, done = std::move(done)](
                                    std::exception_ptr error,
                                    std::optional<chain::Block> block) {
    if (error) {
      done(InternalError("GET_BLOCK", session_id, error));
      return;
    }
    if (!block) {
      done(std::make_unique<message::NotFoundResponse>());
      return;
    }
    done(std::make_unique<message::BlockResponse>(std::move(*block)));
  });
}

void RPCDispatcher::HandleGetBalance(const message::GetBalanceRequest &req,
                                     const RequestContext &ctx,
                                     ResponseHandler done) {
  const uint64_t session_id = ctx.session_id;
  ledger_->GetBalance(req.address, [this, address = req.address, session_id,
                                    done = std::move(done)](
                                       std::exception_ptr error,
                                       std::optional<chain::Amount> balance) {
    if (error) {
      done(InternalError("GET_BALANCE", session_id, error));
      return;
    }
    if (!balance) {
      done(std::make_unique<message::NotFoundResponse>());
      return;
    }
    // Already on the ledger strand; this call queues behind anything posted since
    ledger_->GetMinFee([address, amount = *balance, session_id, done](
                           std::exception_ptr error, chain::Amount min_fee) {
      if (error) {
        done(InternalError("GET_BALANCE", session_id, error));
        return;
      }
      auto response = std::make_unique<message::BalanceResponse>();
      response->address = address;
      response->balance = amount;
      response->min_fee = min_fee;
      done(std::move(response));
    });
  });
}

std::unique_ptr<message::Message>
RPCDispatcher::HandleSubscribe(const RequestContext &ctx) {
  // Subscribing twice is a no-op; both get the acknowledgement
  hub_.subscribe(ctx.session_id, ctx.sink);
  return std::make_unique<message::SubscribedResponse>();
}

std::unique_ptr<message::Message>
RPCDispatcher::HandleUnsubscribe(const RequestContext &ctx) {
  hub_.unsubscribe(ctx.session_id);
  return std::make_unique<message::UnsubscribedResponse>();
}

std::unique_ptr<message::Message>
RPCDispatcher::HandlePing(const message::PingMessage &req) {
  return std::make_unique<message::PongMessage>(req.nonce);
}

} // namespace rpc
} // namespace mintnode
