#include "matrixnotify/delivery/types.hpp"

#include <sstream>

namespace matrixnotify::delivery {

std::string_view e2e_label(const DeliveryPath path) {
  return path == DeliveryPath::EndToEnd ? "with" : "without";
}

std::string_view path_name(const DeliveryPath path) {
  switch (path) {
  case DeliveryPath::Plaintext:
    return "plaintext";
  case DeliveryPath::EndToEnd:
    return "e2e";
  }
  return "unknown";
}

std::string_view kind_name(const DeliveryErrorKind kind) {
  switch (kind) {
  case DeliveryErrorKind::Validation:
    return "validation";
  case DeliveryErrorKind::Transport:
    return "transport";
  case DeliveryErrorKind::Subprocess:
    return "subprocess";
  }
  return "unknown";
}

std::string_view field_name(const ValidationField field) {
  switch (field) {
  case ValidationField::None:
    return "";
  case ValidationField::Message:
    return "Message";
  case ValidationField::RoomId:
    return "RoomId";
  case ValidationField::HomeserverUrl:
    return "HomeserverUrl";
  case ValidationField::AccessToken:
    return "AccessToken";
  }
  return "";
}

DeliveryError DeliveryError::validation(const ValidationField field, std::string detail) {
  DeliveryError error;
  error.kind = DeliveryErrorKind::Validation;
  error.field = field;
  error.detail = std::move(detail);
  return error;
}

DeliveryError DeliveryError::transport(const std::uint16_t status, std::string detail) {
  DeliveryError error;
  error.kind = DeliveryErrorKind::Transport;
  error.http_status = status;
  error.detail = std::move(detail);
  return error;
}

DeliveryError DeliveryError::subprocess(std::string detail) {
  DeliveryError error;
  error.kind = DeliveryErrorKind::Subprocess;
  error.detail = std::move(detail);
  return error;
}

std::string DeliveryError::to_string() const {
  std::ostringstream stream;
  stream << "Delivery error [" << kind_name(kind);
  if (field != ValidationField::None) {
    stream << ":" << field_name(field);
  }
  stream << "]";
  if (http_status != 0) {
    stream << " status=" << http_status;
  }
  if (!detail.empty()) {
    stream << " " << detail;
  }
  return stream.str();
}

} // namespace matrixnotify::delivery
