#include <spdlog/spdlog.h>
#include <surety/execution/access_control.hpp>
#include <surety/schema/key/registry_keys.hpp>

using namespace surety::schema;

namespace surety::execution {

namespace {

constexpr auto kCodespace = std::string_view{"surety.access"};

}  // namespace

access_control::access_control(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

bool access_control::bootstrap(const account_id_t& owner) {
  auto owner_key = key::make_singleton_key(encoder_, key::kAccessOwnerKey);
  if (storage_.contains(owner_key)) {
    return false;
  }
  storage_.put(encoder_, owner_key, owner);
  storage_.put(encoder_,
               key::make_singleton_key(encoder_, key::kAccessOperationalKey),
               true);
  spdlog::info("Registry owner set to {}", to_hex(owner));
  return true;
}

std::optional<call_result_t> access_control::require_owner(
    const account_id_t& requester) const {
  auto stored = owner();
  if (!stored || *stored != requester) {
    spdlog::warn("Rejected administrative call from {}", to_hex(requester));
    return make_error_result(error_code::unauthorized, kCodespace,
                             "owner required");
  }
  return std::nullopt;
}

call_result_t access_control::authorize(const account_id_t& requester,
                                        const account_id_t& caller) {
  if (auto denied = require_owner(requester)) {
    return *denied;
  }
  if (!is_operational()) {
    return make_error_result(error_code::not_operational, kCodespace);
  }
  storage_.put(encoder_, key::make_authorized_key(encoder_, caller), true);
  spdlog::info("Authorized caller {}", to_hex(caller));
  return call_result_t{};
}

call_result_t access_control::revoke(const account_id_t& requester,
                                     const account_id_t& caller) {
  if (auto denied = require_owner(requester)) {
    return *denied;
  }
  if (!is_operational()) {
    return make_error_result(error_code::not_operational, kCodespace);
  }
  storage_.put(encoder_, key::make_authorized_key(encoder_, caller), false);
  spdlog::info("Revoked caller {}", to_hex(caller));
  return call_result_t{};
}

call_result_t access_control::set_operational(const account_id_t& requester,
                                              const bool operational) {
  if (auto denied = require_owner(requester)) {
    return *denied;
  }
  storage_.put(encoder_,
               key::make_singleton_key(encoder_, key::kAccessOperationalKey),
               operational);
  if (operational) {
    spdlog::info("Registry is operational");
  } else {
    spdlog::warn("Registry paused by owner");
  }
  return call_result_t{};
}

std::optional<call_result_t> access_control::check(
    const account_id_t& caller) const {
  if (!is_operational()) {
    return make_error_result(error_code::not_operational, kCodespace);
  }
  if (!is_authorized(caller)) {
    spdlog::debug("Unauthorized caller {}", to_hex(caller));
    return make_error_result(error_code::unauthorized, kCodespace,
                             "caller is not authorized");
  }
  return std::nullopt;
}

bool access_control::is_operational() const {
  return storage_
      .get<bool>(encoder_,
                 key::make_singleton_key(encoder_, key::kAccessOperationalKey))
      .value_or(false);
}

bool access_control::is_authorized(const account_id_t& caller) const {
  return storage_.get<bool>(encoder_, key::make_authorized_key(encoder_, caller))
      .value_or(false);
}

std::optional<account_id_t> access_control::owner() const {
  return storage_.get<account_id_t>(
      encoder_, key::make_singleton_key(encoder_, key::kAccessOwnerKey));
}

}  // namespace surety::execution
