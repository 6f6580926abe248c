#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace matrixnotify::delivery {

enum class DeliveryPath {
  Plaintext,
  EndToEnd,
};

/// "with" / "without", as used in "(with E2E)".
[[nodiscard]] std::string_view e2e_label(DeliveryPath path);
[[nodiscard]] std::string_view path_name(DeliveryPath path);

struct DeliveryRequest {
  std::string room_id;
  std::string message;
  bool use_e2e = false;
  // Only consulted on the plaintext path.
  std::string homeserver_url;
  std::string access_token;

  [[nodiscard]] DeliveryPath path() const {
    return use_e2e ? DeliveryPath::EndToEnd : DeliveryPath::Plaintext;
  }
};

struct DeliveryOutcome {
  DeliveryPath path = DeliveryPath::Plaintext;
  std::string transaction_id;
  std::uint16_t http_status = 0;
  std::string event_id;
  std::optional<int> exit_code;
  std::string detail;
};

enum class DeliveryErrorKind {
  Validation,
  Transport,
  Subprocess,
};

enum class ValidationField {
  None,
  Message,
  RoomId,
  HomeserverUrl,
  AccessToken,
};

struct DeliveryError {
  DeliveryErrorKind kind = DeliveryErrorKind::Validation;
  ValidationField field = ValidationField::None;
  std::uint16_t http_status = 0;
  std::string detail;

  static DeliveryError validation(ValidationField field, std::string detail);
  static DeliveryError transport(std::uint16_t status, std::string detail);
  static DeliveryError subprocess(std::string detail);

  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view kind_name(DeliveryErrorKind kind);
[[nodiscard]] std::string_view field_name(ValidationField field);

} // namespace matrixnotify::delivery
