#include <spdlog/spdlog.h>
#include <algorithm>
#include <surety/common/critical.hpp>
#include <surety/execution/oracle_consensus.hpp>
#include <surety/schema/key/registry_keys.hpp>

using namespace surety::schema;

namespace surety::execution {

namespace {

constexpr auto kCodespace = std::string_view{"surety.oracle"};

}  // namespace

oracle_consensus::oracle_consensus(encoder_t& encoder,
                                   storage_t& storage,
                                   fund_ledger& ledger,
                                   const flight_registry& flights,
                                   entropy_source_t entropy,
                                   const engine_config& config)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      flights_{flights},
      entropy_{std::move(entropy)},
      config_{config} {
  if (!entropy_) {
    surety::common::critical("oracle consensus requires an entropy source");
  }
  if (config_.index_range < 3) {
    surety::common::critical("oracle index range must hold three indexes");
  }
}

uint8_t oracle_consensus::next_index(const account_id_t& account) {
  auto nonce_key = key::make_singleton_key(encoder_, key::kOracleNonceKey);
  auto nonce = storage_.get<uint64_t>(encoder_, nonce_key).value_or(0);
  storage_.put(encoder_, nonce_key, nonce + 1);
  return index_from_entropy(entropy_(account, nonce), config_.index_range);
}

oracle_indexes_t oracle_consensus::assign_indexes(const account_id_t& oracle) {
  auto indexes = oracle_indexes_t{};
  indexes[0] = next_index(oracle);

  indexes[1] = indexes[0];
  while (indexes[1] == indexes[0]) {
    indexes[1] = next_index(oracle);
  }

  indexes[2] = indexes[1];
  while (indexes[2] == indexes[0] || indexes[2] == indexes[1]) {
    indexes[2] = next_index(oracle);
  }
  return indexes;
}

call_result_t oracle_consensus::register_oracle(const account_id_t& oracle,
                                                const amount_t payment) {
  if (indexes_of(oracle)) {
    return make_error_result(error_code::already_registered, kCodespace);
  }
  if (payment < config_.oracle_registration_fee) {
    return make_error_result(error_code::insufficient_payment, kCodespace,
                             "payment below oracle registration fee");
  }

  auto registration = oracle_registration_t{};
  registration.oracle = oracle;
  registration.indexes = assign_indexes(oracle);
  storage_.put(encoder_, key::make_oracle_key(encoder_, oracle), registration);
  ledger_.deposit_oracle_fee(payment);
  spdlog::info("Registered oracle {} with indexes {}, {}, {}", to_hex(oracle),
               registration.indexes[0], registration.indexes[1],
               registration.indexes[2]);

  auto result = call_result_t{};
  result.data = encoder_.encode(registration.indexes);
  result.events.push_back(make_event(
      "oracle_registered",
      {{"oracle", to_hex(oracle)},
       {"indexes", std::to_string(registration.indexes[0]) + "," +
                       std::to_string(registration.indexes[1]) + "," +
                       std::to_string(registration.indexes[2])}}));
  return result;
}

call_result_t oracle_consensus::request_status(
    const account_id_t& requester,
    const account_id_t& airline,
    const std::string& flight,
    const timestamp_seconds_t timestamp) {
  if (!flights_.find(flights_.key_of(airline, flight, timestamp))) {
    return make_error_result(error_code::unknown_flight, kCodespace);
  }

  auto index = next_index(requester);
  auto request_key =
      key::make_request_key(encoder_, index, airline, flight, timestamp);
  auto request = storage_.get<response_request_t>(encoder_, request_key);
  if (!request || !request->is_open) {
    request = response_request_t{};
    request->index = index;
    request->airline = airline;
    request->flight = flight;
    request->timestamp = timestamp;
    request->requester = requester;
    request->is_open = true;
    storage_.put(encoder_, request_key, *request);
  }
  spdlog::info("Opened status request for flight {} at index {}", flight,
               index);

  auto result = call_result_t{};
  result.data = encoder_.encode(index);
  result.events.push_back(
      make_event("oracle_request", {{"index", std::to_string(index)},
                                    {"airline", to_hex(airline)},
                                    {"flight", flight},
                                    {"timestamp", std::to_string(timestamp)}}));
  return result;
}

report_outcome oracle_consensus::submit_response(
    const account_id_t& oracle,
    const uint8_t index,
    const account_id_t& airline,
    const std::string& flight,
    const timestamp_seconds_t timestamp,
    const flight_status_t status) {
  auto outcome = report_outcome{};
  auto indexes = indexes_of(oracle);
  if (!indexes || std::ranges::find(*indexes, index) == std::end(*indexes)) {
    outcome.result = make_error_result(error_code::index_mismatch, kCodespace);
    return outcome;
  }

  auto request_key =
      key::make_request_key(encoder_, index, airline, flight, timestamp);
  auto request = storage_.get<response_request_t>(encoder_, request_key);
  if (!request || !request->is_open) {
    outcome.result =
        make_error_result(error_code::no_matching_request, kCodespace);
    return outcome;
  }

  auto duplicate = std::ranges::any_of(
      request->reports, [&](const oracle_report_t& report) {
        return report.oracle == oracle && report.status == status;
      });
  if (duplicate) {
    spdlog::debug("Ignoring repeated {} report from oracle {}",
                  to_string(status), to_hex(oracle));
    return outcome;
  }

  auto report = oracle_report_t{};
  report.oracle = oracle;
  report.status = status;
  request->reports.push_back(report);
  auto matching = static_cast<uint32_t>(std::ranges::count_if(
      request->reports,
      [&](const oracle_report_t& value) { return value.status == status; }));

  outcome.result.events.push_back(
      make_event("oracle_report", {{"oracle", to_hex(oracle)},
                                   {"index", std::to_string(index)},
                                   {"flight", flight},
                                   {"timestamp", std::to_string(timestamp)},
                                   {"status", std::string{to_string(status)}},
                                   {"count", std::to_string(matching)}}));

  if (matching >= config_.min_responses) {
    request->is_open = false;
    outcome.resolved = status;
    outcome.flight_key = flights_.key_of(airline, flight, timestamp);
    spdlog::info("Oracle quorum on flight {}: {} ({} reports)", flight,
                 to_string(status), matching);
  }
  storage_.put(encoder_, request_key, *request);
  return outcome;
}

std::optional<oracle_indexes_t> oracle_consensus::indexes_of(
    const account_id_t& oracle) const {
  auto registration = storage_.get<oracle_registration_t>(
      encoder_, key::make_oracle_key(encoder_, oracle));
  if (!registration) {
    return std::nullopt;
  }
  return registration->indexes;
}

std::optional<response_request_t> oracle_consensus::find_request(
    const uint8_t index,
    const account_id_t& airline,
    const std::string& flight,
    const timestamp_seconds_t timestamp) const {
  return storage_.get<response_request_t>(
      encoder_,
      key::make_request_key(encoder_, index, airline, flight, timestamp));
}

}  // namespace surety::execution
