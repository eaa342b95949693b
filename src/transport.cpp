#include "tether/transport.hpp"

namespace tether {

InProcessTransport::InProcessTransport(size_t inbound_capacity) : inbound_(inbound_capacity) {}

void InProcessTransport::attach(const std::string& node_id, Handler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  handlers_[node_id] = std::make_shared<Handler>(std::move(handler));
}

void InProcessTransport::detach(const std::string& node_id) {
  std::lock_guard<std::mutex> lk(mu_);
  handlers_.erase(node_id);
}

void InProcessTransport::set_reachable(const std::string& node_id, bool reachable) {
  std::lock_guard<std::mutex> lk(mu_);
  if (reachable) unreachable_.erase(node_id);
  else unreachable_.insert(node_id);
}

bool InProcessTransport::post(Message msg) {
  return inbound_.try_push(std::move(msg));
}

SendResult InProcessTransport::send(const std::string& node_id, const Message& msg,
                                    std::chrono::milliseconds timeout) {
  std::shared_ptr<Handler> handler;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++sent_[{node_id, msg.kind}];
    if (unreachable_.contains(node_id)) {
      return SendResult{false, ErrorCode::transient_network, "", 0};
    }
    auto it = handlers_.find(node_id);
    if (it == handlers_.end()) {
      return SendResult{false, ErrorCode::transient_network, "", 0};
    }
    handler = it->second;
  }

  // The handler runs outside the lock so a peer may call back into us.
  const auto start = std::chrono::steady_clock::now();
  SendResult r = (*handler)(msg);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  r.latency_us = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
  if (!r.delivered && r.code == ErrorCode::none) r.code = ErrorCode::transient_network;
  if (r.delivered && elapsed > timeout) {
    // The reply arrived after the caller's deadline.
    return SendResult{false, ErrorCode::transient_network, "", r.latency_us};
  }
  return r;
}

std::optional<Message> InProcessTransport::receive(std::chrono::milliseconds timeout) {
  return inbound_.pop_for(timeout);
}

uint64_t InProcessTransport::sent_count(const std::string& node_id, const std::string& kind) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sent_.find({node_id, kind});
  return it == sent_.end() ? 0 : it->second;
}

}  // namespace tether
