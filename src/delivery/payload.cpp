#include "matrixnotify/delivery/payload.hpp"

#include "matrixnotify/common/json_util.hpp"
#include "matrixnotify/delivery/html.hpp"

#include <openssl/rand.h>

#include <array>
#include <random>

namespace matrixnotify::delivery {

namespace {

void fill_random(std::array<unsigned char, 16> &bytes) {
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) == 1) {
    return;
  }
  // RAND_bytes only fails when the CSPRNG cannot be seeded.
  static thread_local std::mt19937_64 rng(std::random_device{}());
  for (auto &byte : bytes) {
    byte = static_cast<unsigned char>(rng() & 0xFFULL);
  }
}

} // namespace

std::string OutboundPayload::to_json() const {
  return common::json_object({
      {"msgtype", msgtype},
      {"body", body},
      {"format", format},
      {"formatted_body", formatted_body},
  });
}

OutboundPayload build_payload(const std::string &message) {
  OutboundPayload payload;
  payload.body = html::strip_html_tags_and_non_ascii(message);
  payload.formatted_body = message;
  return payload;
}

std::string build_send_url(const std::string &homeserver_url, const std::string &room_id,
                           const std::string &transaction_id) {
  std::string base = homeserver_url;
  if (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/_matrix/client/r0/rooms/" + room_id + "/send/m.room.message/" + transaction_id;
}

std::string generate_transaction_id() {
  static constexpr char kHex[] = "0123456789abcdef";
  std::array<unsigned char, 16> bytes{};
  fill_random(bytes);
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[bytes[i] >> 4U]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

} // namespace matrixnotify::delivery
