#include "common/codec.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace livequiz {
namespace {

void put_be32(std::uint8_t* out, std::uint32_t value) {
  out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
  out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  out[3] = static_cast<std::uint8_t>(value & 0xFF);
}

std::uint32_t get_be32(const std::uint8_t* in) {
  return (static_cast<std::uint32_t>(in[0]) << 24) |
         (static_cast<std::uint32_t>(in[1]) << 16) |
         (static_cast<std::uint32_t>(in[2]) << 8) |
         static_cast<std::uint32_t>(in[3]);
}

}  // namespace

bool is_valid_utf8(const std::string& s) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(s.data());
  const std::size_t len = s.size();
  std::size_t i = 0;
  while (i < len) {
    const unsigned char c = bytes[i];
    std::size_t trailing = 0;
    if (c <= 0x7F) {
      trailing = 0;
    } else if ((c >> 5) == 0x6) {
      if ((c & 0x1E) == 0) return false;  // overlong
      trailing = 1;
    } else if ((c >> 4) == 0xE) {
      trailing = 2;
    } else if ((c >> 3) == 0x1E) {
      trailing = 3;
    } else {
      return false;
    }
    if (i + trailing >= len) return false;
    for (std::size_t j = 1; j <= trailing; ++j) {
      if ((bytes[i + j] >> 6) != 0x2) return false;
    }
    i += trailing + 1;
  }
  return true;
}

ssize_t read_exact(int fd, void* buffer, std::size_t length) {
  auto* out = static_cast<std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::read(fd, out + total, length - total);
    if (n == 0) break;  // EOF
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

ssize_t write_exact(int fd, const void* buffer, std::size_t length) {
  const auto* in = static_cast<const std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    // MSG_NOSIGNAL: a peer that vanished mid-write must not kill the process.
    ssize_t n = ::send(fd, in + total, length - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

std::vector<std::uint8_t> encode_frame(const Message& msg, std::string& error) {
  std::string payload;
  try {
    payload = message_to_json(msg).dump();
  } catch (const nlohmann::json::exception& ex) {
    error = std::string("JSON serialize error: ") + ex.what();
    return {};
  }
  if (payload.size() > kMaxPayloadSize) {
    error = "payload too large";
    return {};
  }

  std::vector<std::uint8_t> frame(kFramePrefixBytes + payload.size());
  put_be32(frame.data(), static_cast<std::uint32_t>(payload.size()));
  std::memcpy(frame.data() + kFramePrefixBytes, payload.data(), payload.size());
  return frame;
}

bool decode_frame(const std::vector<std::uint8_t>& frame, Message& out, std::string& error) {
  if (frame.size() < kFramePrefixBytes) {
    error = "frame too small";
    return false;
  }
  const std::uint32_t payload_len = get_be32(frame.data());
  if (payload_len > kMaxPayloadSize) {
    error = "payload too large";
    return false;
  }
  if (frame.size() != kFramePrefixBytes + payload_len) {
    error = "payload length mismatch";
    return false;
  }

  std::string payload(reinterpret_cast<const char*>(frame.data() + kFramePrefixBytes),
                      payload_len);
  if (!is_valid_utf8(payload)) {
    error = "payload not valid UTF-8";
    return false;
  }

  nlohmann::json j = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    error = "JSON parse error";
    return false;
  }

  auto msg = message_from_json(j, error);
  if (!msg) return false;
  out = std::move(*msg);
  return true;
}

bool read_frame(int fd, std::vector<std::uint8_t>& frame, std::string& error) {
  std::array<std::uint8_t, kFramePrefixBytes> prefix{};
  ssize_t n = read_exact(fd, prefix.data(), prefix.size());
  if (n == 0) {
    error = "EOF";
    return false;
  }
  if (n != static_cast<ssize_t>(prefix.size())) {
    error = "failed to read length prefix";
    return false;
  }
  const std::uint32_t payload_len = get_be32(prefix.data());
  if (payload_len > kMaxPayloadSize) {
    error = "payload too large";
    return false;
  }

  frame.resize(kFramePrefixBytes + payload_len);
  std::memcpy(frame.data(), prefix.data(), kFramePrefixBytes);
  if (payload_len == 0) return true;

  ssize_t r = read_exact(fd, frame.data() + kFramePrefixBytes, payload_len);
  if (r != static_cast<ssize_t>(payload_len)) {
    error = "failed to read payload";
    return false;
  }
  return true;
}

bool write_frame(int fd, const std::vector<std::uint8_t>& frame, std::string& error) {
  if (frame.size() < kFramePrefixBytes) {
    error = "frame too small to write";
    return false;
  }
  ssize_t n = write_exact(fd, frame.data(), frame.size());
  if (n != static_cast<ssize_t>(frame.size())) {
    error = "failed to write full frame";
    return false;
  }
  return true;
}

}  // namespace livequiz
