#pragma once

#include <surety/schema/primitives.hpp>

// Schema type: call context.
// `caller` is the forwarding identity checked against the authorized set;
// `sender` is the airline, passenger or oracle on whose behalf the call is
// made; `value` is the payment attached to the call.
namespace surety::schema {

struct call_context_t final {
  account_id_t caller;
  account_id_t sender;
  amount_t value{};
};

}  // namespace surety::schema
