#include <spdlog/spdlog.h>
#include <algorithm>
#include <surety/execution/airline_registry.hpp>
#include <surety/schema/key/registry_keys.hpp>
#include <tuple>

using namespace surety::schema;

namespace surety::execution {

namespace {

constexpr auto kCodespace = std::string_view{"surety.airline"};

}  // namespace

airline_registry::airline_registry(encoder_t& encoder,
                                   storage_t& storage,
                                   fund_ledger& ledger,
                                   const engine_config& config)
    : encoder_{encoder}, storage_{storage}, ledger_{ledger}, config_{config} {}

bool airline_registry::bootstrap(const account_id_t& first_airline) {
  if (registered_count() > 0) {
    return false;
  }
  auto state = load_or_default(first_airline);
  auto result = call_result_t{};
  admit(state, result);
  spdlog::info("Bootstrapped first airline {}", to_hex(first_airline));
  return true;
}

airline_state_t airline_registry::load_or_default(
    const account_id_t& airline) const {
  if (auto stored = find(airline)) {
    return *stored;
  }
  auto state = airline_state_t{};
  state.airline = airline;
  return state;
}

pending_registration_t airline_registry::load_votes(
    const account_id_t& target) const {
  auto votes = storage_.get<pending_registration_t>(
      encoder_, key::make_vote_key(encoder_, target));
  if (votes) {
    return *votes;
  }
  auto empty = pending_registration_t{};
  empty.target = target;
  return empty;
}

void airline_registry::save(const airline_state_t& state) {
  storage_.put(encoder_, key::make_airline_key(encoder_, state.airline), state);
}

void airline_registry::save(const pending_registration_t& votes) {
  storage_.put(encoder_, key::make_vote_key(encoder_, votes.target), votes);
}

void airline_registry::admit(airline_state_t& target, call_result_t& result) {
  target.status = airline_status_t::registered;
  save(target);

  auto votes = load_votes(target.airline);
  votes.voters.clear();
  save(votes);

  auto count = registered_count() + 1;
  storage_.put(encoder_,
               key::make_singleton_key(encoder_, key::kAirlineCountKey), count);
  result.events.push_back(
      make_event("airline_admitted", {{"airline", to_hex(target.airline)},
                                      {"registered_count",
                                       std::to_string(count)}}));
}

call_result_t airline_registry::register_airline(const account_id_t& voter,
                                                 const account_id_t& target) {
  if (!is_active(voter)) {
    return make_error_result(error_code::not_authorized_airline, kCodespace,
                             "voter must be registered and funded");
  }
  auto state = load_or_default(target);
  if (state.status == airline_status_t::registered) {
    return make_error_result(error_code::already_registered, kCodespace);
  }

  auto result = call_result_t{};
  const auto registered = registered_count();
  if (registered < config_.consensus_threshold) {
    admit(state, result);
    spdlog::info("Admitted airline {} without consensus ({} registered)",
                 to_hex(target), registered + 1);
    result.data = encoder_.encode(std::tuple{true, uint32_t{0}});
    return result;
  }

  auto voter_state = load_or_default(voter);
  auto votes = load_votes(target);
  auto already_voted =
      std::ranges::find(votes.voters, voter) != std::end(votes.voters);
  if (already_voted) {
    spdlog::debug("Ignoring repeated vote from {} for {}", to_hex(voter),
                  to_hex(target));
    result.data = encoder_.encode(
        std::tuple{false, static_cast<uint32_t>(votes.voters.size())});
    return result;
  }

  votes.voters.push_back(voter);
  if (std::ranges::find(voter_state.votes_cast, target) ==
      std::end(voter_state.votes_cast)) {
    voter_state.votes_cast.push_back(target);
  }
  save(voter_state);

  const auto vote_count = static_cast<uint32_t>(votes.voters.size());
  result.events.push_back(make_event(
      "airline_vote", {{"voter", to_hex(voter)},
                       {"target", to_hex(target)},
                       {"votes", std::to_string(vote_count)}}));

  if (vote_count >= registered / config_.multi_party_rate) {
    admit(state, result);
    spdlog::info("Admitted airline {} with {} of {} votes", to_hex(target),
                 vote_count, registered);
    result.data = encoder_.encode(std::tuple{true, vote_count});
    return result;
  }

  state.status = airline_status_t::pending;
  save(state);
  save(votes);
  spdlog::info("Airline {} pending with {} vote(s), needs {}", to_hex(target),
               vote_count, registered / config_.multi_party_rate);
  result.data = encoder_.encode(std::tuple{false, vote_count});
  return result;
}

call_result_t airline_registry::pay_membership_fund(
    const account_id_t& airline,
    const amount_t value,
    const transfer_sink_t& sink) {
  auto state = find(airline);
  if (!state || state->status != airline_status_t::registered) {
    return make_error_result(error_code::not_authorized_airline, kCodespace,
                             "airline is not registered");
  }
  if (state->has_paid_fund) {
    return make_error_result(error_code::already_funded, kCodespace);
  }
  if (value < config_.join_fee) {
    return make_error_result(error_code::insufficient_payment, kCodespace,
                             "membership fund below join fee");
  }

  state->has_paid_fund = true;
  save(*state);
  ledger_.deposit_escrow(config_.join_fee);
  ledger_.refund(airline, value - config_.join_fee, sink);
  spdlog::info("Airline {} paid membership fund of {} gwei", to_hex(airline),
               config_.join_fee);

  auto result = call_result_t{};
  result.events.push_back(make_event(
      "membership_funded", {{"airline", to_hex(airline)},
                            {"amount", std::to_string(config_.join_fee)}}));
  return result;
}

std::optional<airline_state_t> airline_registry::find(
    const account_id_t& airline) const {
  return storage_.get<airline_state_t>(encoder_,
                                       key::make_airline_key(encoder_, airline));
}

bool airline_registry::is_active(const account_id_t& airline) const {
  auto state = find(airline);
  return state && state->status == airline_status_t::registered &&
         state->has_paid_fund;
}

bool airline_registry::is_registered(const account_id_t& airline) const {
  auto state = find(airline);
  return state && state->status == airline_status_t::registered;
}

bool airline_registry::is_paid(const account_id_t& airline) const {
  auto state = find(airline);
  return state && state->has_paid_fund;
}

bool airline_registry::is_pending(const account_id_t& airline) const {
  auto state = find(airline);
  return state && state->status == airline_status_t::pending;
}

uint32_t airline_registry::registered_count() const {
  return storage_
      .get<uint32_t>(encoder_,
                     key::make_singleton_key(encoder_, key::kAirlineCountKey))
      .value_or(0);
}

uint32_t airline_registry::pending_votes(const account_id_t& target) const {
  return static_cast<uint32_t>(load_votes(target).voters.size());
}

}  // namespace surety::execution
