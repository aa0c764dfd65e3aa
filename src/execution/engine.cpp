#include <spdlog/spdlog.h>
#include <surety/common/critical.hpp>
#include <surety/execution/engine.hpp>
#include <iterator>
#include <utility>

using namespace surety::schema;

namespace surety::execution {

namespace {

void merge_into(call_result_t& target, call_result_t&& source) {
  target.events.insert(std::end(target.events),
                       std::make_move_iterator(std::begin(source.events)),
                       std::make_move_iterator(std::end(source.events)));
  if (!source.info.empty()) {
    if (!target.info.empty()) {
      target.info += "; ";
    }
    target.info += source.info;
  }
}

}  // namespace

engine::engine(encoder_t& encoder,
               storage_t& storage,
               engine_config config,
               entropy_source_t entropy,
               transfer_sink_t sink)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      sink_{std::move(sink)},
      dispatch_{[this](const account_id_t& recipient, const amount_t amount) {
        return transfer(recipient, amount);
      }},
      access_{encoder_, storage_},
      ledger_{encoder_, storage_},
      airlines_{encoder_, storage_, ledger_, config_},
      flights_{encoder_, storage_, airlines_},
      insurance_{encoder_, storage_, ledger_, flights_, airlines_, config_},
      oracles_{encoder_,
               storage_,
               ledger_,
               flights_,
               entropy ? std::move(entropy)
                       : make_seeded_entropy_source(make_zero_hash()),
               config_} {
  if (access_.bootstrap(config_.owner)) {
    airlines_.bootstrap(config_.first_airline);
    spdlog::info("Bootstrapped registry with first airline {}",
                 to_hex(config_.first_airline));
    return;
  }

  auto owner = access_.owner();
  if (owner && *owner != config_.owner) {
    spdlog::warn("Store is owned by {}; ignoring configured owner {}",
                 to_hex(*owner), to_hex(config_.owner));
  }
  spdlog::info("Reopened registry with {} registered airlines",
               airlines_.registered_count());
}

void engine::set_transfer_sink(transfer_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  sink_ = std::move(sink);
}

bool engine::transfer(const account_id_t& recipient, const amount_t amount) {
  if (!sink_) {
    spdlog::warn("No transfer sink installed; cannot move {} gwei to {}",
                 amount, to_hex(recipient));
    return false;
  }
  return sink_(recipient, amount);
}

void engine::settle_delay(const flight_key_t& flight_key,
                          const flight_status_t status,
                          call_result_t& result) {
  if (!is_delayed(status)) {
    return;
  }
  merge_into(result, insurance_.credit_insurees(flight_key));
}

call_result_t engine::authorize(const account_id_t& requester,
                                const account_id_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  return access_.authorize(requester, caller);
}

call_result_t engine::revoke(const account_id_t& requester,
                             const account_id_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  return access_.revoke(requester, caller);
}

call_result_t engine::set_operational(const account_id_t& requester,
                                      const bool operational) {
  auto lock = std::scoped_lock{mutex_};
  return access_.set_operational(requester, operational);
}

call_result_t engine::register_airline(const call_context_t& ctx,
                                       const account_id_t& target) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return airlines_.register_airline(ctx.sender, target);
}

call_result_t engine::pay_membership_fund(const call_context_t& ctx) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return airlines_.pay_membership_fund(ctx.sender, ctx.value, dispatch_);
}

call_result_t engine::register_flight(const call_context_t& ctx,
                                      const std::string& code,
                                      const timestamp_seconds_t timestamp) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return flights_.register_flight(ctx.sender, code, timestamp);
}

call_result_t engine::set_flight_status(const call_context_t& ctx,
                                        const std::string& code,
                                        const timestamp_seconds_t timestamp,
                                        const flight_status_t status) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  auto result = flights_.set_status(ctx.sender, code, timestamp, status);
  if (result.ok()) {
    settle_delay(flights_.key_of(ctx.sender, code, timestamp), status, result);
  }
  return result;
}

call_result_t engine::buy_insurance(const call_context_t& ctx,
                                    const account_id_t& passenger,
                                    const account_id_t& airline,
                                    const std::string& code,
                                    const timestamp_seconds_t timestamp,
                                    const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return insurance_.buy_insurance(ctx.sender, passenger, airline, code,
                                  timestamp, amount, ctx.value, dispatch_);
}

call_result_t engine::withdraw(const call_context_t& ctx,
                               const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return insurance_.withdraw(ctx.sender, amount, dispatch_);
}

call_result_t engine::register_oracle(const call_context_t& ctx) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return oracles_.register_oracle(ctx.sender, ctx.value);
}

call_result_t engine::request_flight_status(
    const call_context_t& ctx,
    const account_id_t& airline,
    const std::string& code,
    const timestamp_seconds_t timestamp) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  return oracles_.request_status(ctx.sender, airline, code, timestamp);
}

call_result_t engine::submit_response(const call_context_t& ctx,
                                      const uint8_t index,
                                      const account_id_t& airline,
                                      const std::string& code,
                                      const timestamp_seconds_t timestamp,
                                      const flight_status_t status) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = access_.check(ctx.caller)) {
    return *denied;
  }
  auto outcome = oracles_.submit_response(ctx.sender, index, airline, code,
                                          timestamp, status);
  if (!outcome.result.ok() || !outcome.resolved) {
    return std::move(outcome.result);
  }

  // Requests are only opened for existing flights and flights are never
  // removed, so the resolution target must exist.
  auto applied = flights_.apply_resolution(outcome.flight_key, *outcome.resolved);
  if (!applied.ok()) {
    surety::common::critical("oracle quorum resolved a missing flight");
  }
  merge_into(outcome.result, std::move(applied));
  settle_delay(outcome.flight_key, *outcome.resolved, outcome.result);
  return std::move(outcome.result);
}

bool engine::is_operational() const {
  auto lock = std::scoped_lock{mutex_};
  return access_.is_operational();
}

bool engine::is_authorized(const account_id_t& caller) const {
  auto lock = std::scoped_lock{mutex_};
  return access_.is_authorized(caller);
}

uint32_t engine::registered_airline_count() const {
  auto lock = std::scoped_lock{mutex_};
  return airlines_.registered_count();
}

bool engine::is_airline_registered(const account_id_t& airline) const {
  auto lock = std::scoped_lock{mutex_};
  return airlines_.is_registered(airline);
}

bool engine::is_airline_paid(const account_id_t& airline) const {
  auto lock = std::scoped_lock{mutex_};
  return airlines_.is_paid(airline);
}

bool engine::is_airline_pending(const account_id_t& airline) const {
  auto lock = std::scoped_lock{mutex_};
  return airlines_.is_pending(airline);
}

uint32_t engine::pending_votes(const account_id_t& target) const {
  auto lock = std::scoped_lock{mutex_};
  return airlines_.pending_votes(target);
}

std::optional<flight_status_t> engine::flight_status(
    const account_id_t& airline,
    const std::string& code,
    const timestamp_seconds_t timestamp) const {
  auto flight = find_flight(airline, code, timestamp);
  if (!flight) {
    return std::nullopt;
  }
  return flight->status;
}

std::optional<flight_state_t> engine::find_flight(
    const account_id_t& airline,
    const std::string& code,
    const timestamp_seconds_t timestamp) const {
  auto lock = std::scoped_lock{mutex_};
  return flights_.find(flights_.key_of(airline, code, timestamp));
}

amount_t engine::insurance_amount(const account_id_t& passenger,
                                  const account_id_t& airline,
                                  const std::string& code,
                                  const timestamp_seconds_t timestamp) const {
  auto lock = std::scoped_lock{mutex_};
  auto claim =
      insurance_.find(flights_.key_of(airline, code, timestamp), passenger);
  if (!claim) {
    return 0;
  }
  return claim->premium_paid;
}

amount_t engine::passenger_balance(const account_id_t& passenger) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.credit_of(passenger);
}

bool engine::is_oracle_registered(const account_id_t& oracle) const {
  return oracle_indexes(oracle).has_value();
}

std::optional<oracle_indexes_t> engine::oracle_indexes(
    const account_id_t& oracle) const {
  auto lock = std::scoped_lock{mutex_};
  return oracles_.indexes_of(oracle);
}

std::optional<response_request_t> engine::find_request(
    const uint8_t index,
    const account_id_t& airline,
    const std::string& code,
    const timestamp_seconds_t timestamp) const {
  auto lock = std::scoped_lock{mutex_};
  return oracles_.find_request(index, airline, code, timestamp);
}

ledger_state_t engine::ledger_totals() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.totals();
}

const engine_config& engine::config() const {
  return config_;
}

}  // namespace surety::execution
