#pragma once

#include <string>

namespace matrixnotify::delivery {

inline constexpr const char *MSGTYPE_TEXT = "m.text";
inline constexpr const char *FORMAT_CUSTOM_HTML = "org.matrix.custom.html";

/// Body of an `m.room.message` event sent on the plaintext path.
struct OutboundPayload {
  std::string msgtype = MSGTYPE_TEXT;
  std::string body;
  std::string format = FORMAT_CUSTOM_HTML;
  std::string formatted_body;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] OutboundPayload build_payload(const std::string &message);

/// `{homeserver}/_matrix/client/r0/rooms/{room}/send/m.room.message/{txn}`
[[nodiscard]] std::string build_send_url(const std::string &homeserver_url,
                                         const std::string &room_id,
                                         const std::string &transaction_id);

/// Random RFC 4122 version 4 UUID, lowercase hex.
[[nodiscard]] std::string generate_transaction_id();

} // namespace matrixnotify::delivery
