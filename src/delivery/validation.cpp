#include "matrixnotify/delivery/validation.hpp"

#include "matrixnotify/common/fs.hpp"

#include <regex>

namespace matrixnotify::delivery {

namespace {

constexpr const char *EMPTY_OR_WHITESPACE = "Cannot be empty or just whitespace:";

std::string empty_message(const std::string &what) {
  return std::string(EMPTY_OR_WHITESPACE) + " " + what;
}

} // namespace

bool is_valid_room_id(const std::string &room_id) {
  static const std::regex pattern(R"(^![^:]+:[^:]+$)");
  return std::regex_match(room_id, pattern);
}

std::optional<DeliveryError> validate_request(const DeliveryRequest &request) {
  if (common::is_blank(request.message)) {
    return DeliveryError::validation(ValidationField::Message, empty_message("Message"));
  }
  if (!is_valid_room_id(request.room_id)) {
    return DeliveryError::validation(ValidationField::RoomId,
                                     "Invalid room ID: " + request.room_id +
                                         ". It must start with '!' and contain a ':'.");
  }
  return std::nullopt;
}

std::optional<DeliveryError> validate_credentials(const DeliveryRequest &request) {
  if (common::is_blank(request.homeserver_url)) {
    return DeliveryError::validation(ValidationField::HomeserverUrl,
                                     empty_message("Homeserver url"));
  }
  if (common::is_blank(request.access_token)) {
    return DeliveryError::validation(ValidationField::AccessToken, empty_message("Access token"));
  }
  return std::nullopt;
}

} // namespace matrixnotify::delivery
