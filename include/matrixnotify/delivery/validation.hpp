#pragma once

#include "matrixnotify/delivery/types.hpp"

#include <optional>
#include <string>

namespace matrixnotify::delivery {

/// `!localpart:server` with no further colons.
[[nodiscard]] bool is_valid_room_id(const std::string &room_id);

/// Message then room ID. Returns the first violation.
[[nodiscard]] std::optional<DeliveryError> validate_request(const DeliveryRequest &request);

/// Homeserver URL then access token; only the plaintext path needs them.
[[nodiscard]] std::optional<DeliveryError> validate_credentials(const DeliveryRequest &request);

} // namespace matrixnotify::delivery
