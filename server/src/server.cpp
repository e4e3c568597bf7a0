#include "server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"

namespace livequiz::server {

namespace {

int create_listen_socket(const std::string& host, uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    spdlog::error("socket: {}", std::strerror(errno));
    return -1;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    spdlog::error("invalid host: {}", host);
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    spdlog::error("bind {}:{}: {}", host, port, std::strerror(errno));
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 64) < 0) {
    spdlog::error("listen: {}", std::strerror(errno));
    ::close(fd);
    return -1;
  }
  return fd;
}

std::string peer_addr(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    char buf[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(addr.sin_port);
    return oss.str();
  }
  return "unknown";
}

}  // namespace

Server::Server(std::string host, uint16_t port, std::size_t workers)
    : host_(std::move(host)), port_(port), workers_(workers) {}

Server::~Server() {
  stop();
}

void Server::register_handler(const std::string& action, HandlerFn handler) {
  std::lock_guard<std::mutex> lock(handlers_mtx_);
  handlers_[action] = std::move(handler);
}

void Server::set_disconnect_handler(DisconnectFn handler) {
  std::lock_guard<std::mutex> lock(handlers_mtx_);
  on_disconnect_ = std::move(handler);
}

bool Server::start() {
  if (running_.load()) return true;
  listen_fd_ = create_listen_socket(host_, port_);
  if (listen_fd_ < 0) return false;
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    port_ = ntohs(bound.sin_port);
  }
  running_.store(true);
  accept_thread_ = std::thread(&Server::accept_loop, this);
  return true;
}

void Server::stop() {
  if (!running_.exchange(false)) return;
  if (listen_fd_ >= 0) {
    // shutdown() wakes the blocked accept() on Linux; close alone does not.
    ::shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) accept_thread_.join();
  close_all_connections();
  workers_.shutdown();
}

std::string Server::new_client_id() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  std::ostringstream oss;
  oss << std::hex << dist(gen) << dist(gen);
  return oss.str();
}

void Server::accept_loop() {
  while (running_.load()) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    if (client_fd < 0) {
      if (errno == EINTR) continue;
      if (!running_.load()) break;
      spdlog::warn("accept: {}", std::strerror(errno));
      continue;
    }
    auto conn = std::make_shared<Connection>(client_fd, this, new_client_id(), peer_addr(client_fd));
    {
      std::lock_guard<std::mutex> lock(conns_mtx_);
      connections_.emplace(conn->id(), conn);
    }
    conn->start();
    spdlog::info("client {} connected from {}", conn->id(), conn->peer());
  }
}

void Server::handle_message(const std::shared_ptr<Connection>& conn, const Message& msg) {
  const std::string client_id = conn->id();
  run_for_client(client_id, [this, client_id, msg] {
    HandlerFn handler;
    {
      std::lock_guard<std::mutex> lock(handlers_mtx_);
      auto it = handlers_.find(msg.action);
      if (it != handlers_.end()) handler = it->second;
    }

    if (!handler) {
      spdlog::warn("client {} sent unknown action {}", client_id, msg.action);
      send_to(client_id, make_error_response(msg.action, "UNKNOWN_ACTION", "Action not supported"));
      return;
    }
    try {
      handler(client_id, msg);
    } catch (const std::exception& ex) {
      spdlog::error("handler {} failed for {}: {}", msg.action, client_id, ex.what());
      send_to(client_id, make_error_response(msg.action, "HANDLER_ERROR", ex.what()));
    }
  });
}

void Server::run_for_client(const std::string& client_id, std::function<void()> task) {
  bool schedule = false;
  {
    std::lock_guard<std::mutex> lock(strands_mtx_);
    auto& strand = strands_[client_id];
    strand.pending.push_back(std::move(task));
    if (!strand.draining) {
      strand.draining = true;
      schedule = true;
    }
  }
  if (!schedule) return;
  if (!workers_.enqueue([this, client_id] { drain_client(client_id); })) {
    spdlog::debug("dropped work for {} during shutdown", client_id);
    std::lock_guard<std::mutex> lock(strands_mtx_);
    strands_.erase(client_id);
  }
}

void Server::drain_client(const std::string& client_id) {
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(strands_mtx_);
      auto it = strands_.find(client_id);
      if (it == strands_.end()) return;
      if (it->second.pending.empty()) {
        strands_.erase(it);
        return;
      }
      task = std::move(it->second.pending.front());
      it->second.pending.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      spdlog::error("task for {} failed: {}", client_id, ex.what());
    }
  }
}

void Server::connection_closed(const std::shared_ptr<Connection>& conn) {
  const std::string client_id = conn->id();
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    connections_.erase(client_id);
  }
  {
    std::lock_guard<std::mutex> lock(rooms_mtx_);
    for (auto it = rooms_.begin(); it != rooms_.end();) {
      it->second.erase(client_id);
      it = it->second.empty() ? rooms_.erase(it) : std::next(it);
    }
  }
  spdlog::info("client {} disconnected", client_id);

  DisconnectFn handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mtx_);
    handler = on_disconnect_;
  }
  if (handler) {
    // Runs only after every request this client already sent has finished.
    run_for_client(client_id, [handler, client_id] { handler(client_id); });
  }
}

void Server::subscribe(const std::string& room, const std::string& client_id) {
  std::lock_guard<std::mutex> lock(rooms_mtx_);
  rooms_[room].insert(client_id);
}

void Server::unsubscribe(const std::string& room, const std::string& client_id) {
  std::lock_guard<std::mutex> lock(rooms_mtx_);
  auto it = rooms_.find(room);
  if (it == rooms_.end()) return;
  it->second.erase(client_id);
  if (it->second.empty()) rooms_.erase(it);
}

void Server::close_room(const std::string& room) {
  std::lock_guard<std::mutex> lock(rooms_mtx_);
  rooms_.erase(room);
}

void Server::broadcast(const std::string& room, const Message& msg) {
  std::vector<std::string> members;
  {
    std::lock_guard<std::mutex> lock(rooms_mtx_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return;
    members.assign(it->second.begin(), it->second.end());
  }
  for (const auto& id : members) send_to(id, msg);
}

void Server::send_to(const std::string& client_id, const Message& msg) {
  std::shared_ptr<Connection> conn;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    auto it = connections_.find(client_id);
    if (it != connections_.end()) conn = it->second;
  }
  if (!conn) {
    spdlog::debug("drop {} for departed client {}", msg.action, client_id);
    return;
  }
  conn->send(msg);
}

std::size_t Server::connection_count() const {
  std::lock_guard<std::mutex> lock(conns_mtx_);
  return connections_.size();
}

void Server::close_all_connections() {
  std::unordered_map<std::string, std::shared_ptr<Connection>> to_close;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    to_close.swap(connections_);
  }
  for (auto& kv : to_close) {
    if (kv.second) kv.second->stop();
  }
}

Connection::Connection(int fd, Server* server, std::string id, std::string peer)
    : fd_(fd), server_(server), id_(std::move(id)), peer_(std::move(peer)) {}

Connection::~Connection() {
  stop();
}

void Connection::start() {
  reader_ = std::thread(&Connection::read_loop, this);
}

void Connection::stop() {
  if (alive_.exchange(false)) {
    std::lock_guard<std::mutex> lock(send_mtx_);
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
      ::close(fd_);
      fd_ = -1;
    }
  }
  if (reader_.joinable()) {
    // The reader may drop the last reference to itself.
    if (reader_.get_id() == std::this_thread::get_id()) {
      reader_.detach();
    } else {
      reader_.join();
    }
  }
}

bool Connection::send(const Message& msg) {
  std::string error;
  auto frame = encode_frame(msg, error);
  if (frame.empty()) {
    spdlog::warn("encode error to {}: {}", id_, error);
    return false;
  }
  std::lock_guard<std::mutex> lock(send_mtx_);
  if (fd_ < 0) return false;
  if (!write_frame(fd_, frame, error)) {
    spdlog::warn("send error to {}: {}", id_, error);
    return false;
  }
  return true;
}

void Connection::read_loop() {
  auto self = shared_from_this();
  while (alive_.load()) {
    std::vector<std::uint8_t> frame;
    std::string error;
    if (!read_frame(fd_, frame, error)) {
      if (alive_.load() && error != "EOF") {
        spdlog::warn("read error from {}: {}", id_, error);
      }
      break;
    }
    Message msg;
    if (!decode_frame(frame, msg, error)) {
      spdlog::warn("decode error from {}: {}", id_, error);
      send(make_error_response("", "INVALID_FRAME", error));
      continue;
    }
    server_->handle_message(self, msg);
  }
  // Server shutdown stops connections itself and must not re-enter it.
  if (alive_.load()) server_->connection_closed(self);
}

}  // namespace livequiz::server
