#pragma once

#include <surety/schema/primitives.hpp>
#include <functional>

namespace surety::execution {

/// Moves value out of the registry to an external account. Returns false when
/// the recipient refuses the transfer. The sink may call back into the
/// engine; balances are always settled before it runs.
using transfer_sink_t =
    std::function<bool(const surety::schema::account_id_t& recipient,
                       surety::schema::amount_t amount)>;

}  // namespace surety::execution
