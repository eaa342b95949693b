#pragma once

// tether/transport.hpp: Message transport seam.
//
// The coordinator never opens sockets itself. Probes, task dispatch and abort
// requests go through ITransport::send(), which must return within the given
// timeout; an undelivered or late message is reported as
// ErrorCode::transient_network and the caller decides whether to retry.
//
// InProcessTransport connects coordinator instances and simulated workers in
// one process. It is the transport used by tests and by the single-process
// deployment.
//
// EXTENSION_POINT: network_transport
//   A socket or RPC transport implements the same two calls. Replies are the
//   JSON bodies documented in version.hpp (WIRE_PROTOCOL_VERSION).

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "tether/bounded_queue.hpp"
#include "tether/types.hpp"

namespace tether {

struct Message {
  std::string kind;            // "probe", "dispatch", "abort", "heartbeat"
  std::string from;
  std::string to;
  std::string correlation_id;  // task id or probe sequence
  std::string body;            // JSON
};

struct SendResult {
  bool        delivered{false};
  ErrorCode   code{ErrorCode::none};
  std::string reply;           // JSON body returned by the peer
  uint64_t    latency_us{0};
};

class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual SendResult send(const std::string& node_id, const Message& msg,
                          std::chrono::milliseconds timeout) = 0;

  // Next inbound message addressed to this process, or nullopt on timeout.
  virtual std::optional<Message> receive(std::chrono::milliseconds timeout) = 0;
};

class InProcessTransport : public ITransport {
 public:
  // A handler plays the remote node: it receives the message and returns the
  // reply. Returning delivered=false simulates a dropped connection.
  using Handler = std::function<SendResult(const Message&)>;

  explicit InProcessTransport(size_t inbound_capacity = 1024);

  void attach(const std::string& node_id, Handler handler);
  void detach(const std::string& node_id);

  // Partition simulation: an unreachable node drops every message.
  void set_reachable(const std::string& node_id, bool reachable);

  // Queue a message for receive(). Returns false when the inbox is full.
  bool post(Message msg);

  SendResult send(const std::string& node_id, const Message& msg,
                  std::chrono::milliseconds timeout) override;
  std::optional<Message> receive(std::chrono::milliseconds timeout) override;

  uint64_t sent_count(const std::string& node_id, const std::string& kind) const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Handler>> handlers_;
  std::set<std::string> unreachable_;
  std::map<std::pair<std::string, std::string>, uint64_t> sent_;
  BoundedQueue<Message> inbound_;
};

}  // namespace tether
