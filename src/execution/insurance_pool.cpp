#include <spdlog/spdlog.h>
#include <surety/execution/insurance_pool.hpp>
#include <surety/schema/key/registry_keys.hpp>

using namespace surety::schema;

namespace surety::execution {

namespace {

constexpr auto kCodespace = std::string_view{"surety.insurance"};

}  // namespace

insurance_pool::insurance_pool(encoder_t& encoder,
                               storage_t& storage,
                               fund_ledger& ledger,
                               const flight_registry& flights,
                               const airline_registry& airlines,
                               const engine_config& config)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      flights_{flights},
      airlines_{airlines},
      config_{config} {}

amount_t insurance_pool::payout_for(const amount_t premium) {
  return premium * 3 / 2;
}

std::optional<insurance_claim_t> insurance_pool::find(
    const flight_key_t& flight_key,
    const account_id_t& passenger) const {
  return storage_.get<insurance_claim_t>(
      encoder_, key::make_claim_key(encoder_, flight_key, passenger));
}

std::vector<insurance_claim_t> insurance_pool::claims_for(
    const flight_key_t& flight_key) const {
  auto prefix = key::make_claim_prefix_key(encoder_, flight_key);
  auto claims = std::vector<insurance_claim_t>{};
  for (const auto& entry : storage_.list_by_prefix(prefix)) {
    claims.push_back(encoder_.decode<insurance_claim_t>(
        bytes_view_t{entry.second.data(), entry.second.size()}));
  }
  return claims;
}

void insurance_pool::save(const insurance_claim_t& claim) {
  storage_.put(encoder_,
               key::make_claim_key(encoder_, claim.flight_key, claim.passenger),
               claim);
}

call_result_t insurance_pool::buy_insurance(
    const account_id_t& payer,
    const account_id_t& passenger,
    const account_id_t& airline,
    const std::string& code,
    const timestamp_seconds_t timestamp,
    const amount_t declared_amount,
    const amount_t paid_amount,
    const transfer_sink_t& sink) {
  if (airlines_.is_registered(passenger)) {
    return make_error_result(error_code::invalid_buyer, kCodespace,
                             "airlines cannot insure flights");
  }
  auto flight_key = flights_.key_of(airline, code, timestamp);
  auto flight = flights_.find(flight_key);
  if (!flight) {
    return make_error_result(error_code::unknown_flight, kCodespace);
  }
  if (flight->status != flight_status_t::unknown) {
    return make_error_result(error_code::flight_status_finalized, kCodespace,
                             "flight status already known");
  }
  if (declared_amount == 0 || declared_amount > config_.max_insurance_amount) {
    return make_error_result(error_code::invalid_amount, kCodespace,
                             "insurance amount out of range");
  }
  if (paid_amount < declared_amount) {
    return make_error_result(error_code::insufficient_payment, kCodespace);
  }
  if (find(flight_key, passenger)) {
    return make_error_result(error_code::duplicate_claim, kCodespace);
  }

  auto claim = insurance_claim_t{};
  claim.flight_key = flight_key;
  claim.passenger = passenger;
  claim.premium_paid = declared_amount;
  save(claim);
  ledger_.deposit_pool(declared_amount);
  ledger_.refund(payer, paid_amount - declared_amount, sink);
  spdlog::info("Passenger {} insured flight {} for {} gwei", to_hex(passenger),
               code, declared_amount);

  auto result = call_result_t{};
  result.events.push_back(make_event(
      "insurance_purchased", {{"passenger", to_hex(passenger)},
                              {"flight", to_hex(flight_key)},
                              {"premium", std::to_string(declared_amount)}}));
  return result;
}

call_result_t insurance_pool::credit_insurees(const flight_key_t& flight_key) {
  auto result = call_result_t{};
  auto underfunded = std::vector<std::string>{};
  for (auto& claim : claims_for(flight_key)) {
    if (claim.payout_issued) {
      continue;
    }
    auto payout = payout_for(claim.premium_paid);
    if (ledger_.credit_payout(claim.passenger, payout).has_value()) {
      underfunded.push_back(to_hex(claim.passenger));
      continue;
    }
    claim.payout_issued = true;
    save(claim);
    result.events.push_back(make_event(
        "insurance_credited", {{"passenger", to_hex(claim.passenger)},
                               {"flight", to_hex(flight_key)},
                               {"amount", std::to_string(payout)}}));
  }
  if (!underfunded.empty()) {
    result.info = std::string{to_string(error_code::pool_underfunded)} + ":";
    for (const auto& passenger : underfunded) {
      result.info += " " + passenger;
    }
    spdlog::warn("{} claim(s) on flight {} left unpaid: pool and escrow underfunded",
                 underfunded.size(), to_hex(flight_key));
  }
  return result;
}

call_result_t insurance_pool::withdraw(const account_id_t& passenger,
                                       const amount_t amount,
                                       const transfer_sink_t& sink) {
  if (amount == 0) {
    return make_error_result(error_code::invalid_amount, kCodespace);
  }
  if (auto error = ledger_.withdraw(passenger, amount, sink)) {
    return make_error_result(*error, kCodespace);
  }
  spdlog::info("Passenger {} withdrew {} gwei", to_hex(passenger), amount);

  auto result = call_result_t{};
  result.events.push_back(
      make_event("withdrawal", {{"passenger", to_hex(passenger)},
                                {"amount", std::to_string(amount)}}));
  return result;
}

}  // namespace surety::execution
