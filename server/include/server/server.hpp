#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "common/message.hpp"
#include "server/broadcast_gateway.hpp"
#include "server/thread_pool.hpp"

namespace livequiz::server {

class Connection;

// Handles one decoded request from the identified client. Replies and
// broadcasts go through the gateway.
using HandlerFn = std::function<void(const std::string& client_id, const Message&)>;
using DisconnectFn = std::function<void(const std::string& client_id)>;

// TCP front end: accepts connections, dispatches requests onto the worker
// pool, and delivers outbound events by room or by client id.
class Server : public BroadcastGateway {
 public:
  Server(std::string host, uint16_t port, std::size_t workers = 4);
  ~Server() override;

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void register_handler(const std::string& action, HandlerFn handler);
  void set_disconnect_handler(DisconnectFn handler);

  bool start();
  void stop();
  // Bound port; differs from the configured one when that was 0.
  uint16_t port() const { return port_; }

  void handle_message(const std::shared_ptr<Connection>& conn, const Message& msg);
  void connection_closed(const std::shared_ptr<Connection>& conn);

  void subscribe(const std::string& room, const std::string& client_id) override;
  void unsubscribe(const std::string& room, const std::string& client_id) override;
  void close_room(const std::string& room) override;
  void broadcast(const std::string& room, const Message& msg) override;
  void send_to(const std::string& client_id, const Message& msg) override;

  std::size_t connection_count() const;

 private:
  // Work for one client runs on the pool one task at a time, in submission
  // order. The disconnect hook is submitted last, after every request.
  struct ClientStrand {
    std::deque<std::function<void()>> pending;
    bool draining{false};
  };

  void accept_loop();
  void close_all_connections();
  std::string new_client_id();
  void run_for_client(const std::string& client_id, std::function<void()> task);
  void drain_client(const std::string& client_id);

  std::string host_;
  uint16_t port_;
  std::atomic<bool> running_{false};
  int listen_fd_{-1};
  std::thread accept_thread_;

  mutable std::mutex conns_mtx_;
  std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

  std::mutex rooms_mtx_;
  std::unordered_map<std::string, std::unordered_set<std::string>> rooms_;

  std::mutex strands_mtx_;
  std::unordered_map<std::string, ClientStrand> strands_;

  ThreadPool workers_;
  std::mutex handlers_mtx_;
  std::map<std::string, HandlerFn> handlers_;
  DisconnectFn on_disconnect_;
};

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(int fd, Server* server, std::string id, std::string peer);
  ~Connection();

  void start();
  void stop();
  bool send(const Message& msg);
  const std::string& id() const { return id_; }
  const std::string& peer() const { return peer_; }

 private:
  void read_loop();

  int fd_;
  Server* server_;
  std::string id_;
  std::string peer_;
  std::atomic<bool> alive_{true};
  std::thread reader_;
  std::mutex send_mtx_;
};

}  // namespace livequiz::server
