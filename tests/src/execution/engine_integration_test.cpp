#include <gtest/gtest.h>
#include <surety/testing/engine_harness.hpp>

#include <algorithm>
#include <optional>
#include <tuple>
#include <vector>

using surety::schema::error_code;
using surety::schema::flight_status_t;
using surety::schema::kEther;
using surety::testing::kFirstAirline;
using surety::testing::kFrontEnd;
using surety::testing::kOwner;

namespace {

constexpr auto kFlight = "SU100";
constexpr auto kDeparture = surety::schema::timestamp_seconds_t{1'700'000'000};

void expect_conserved(const surety::schema::ledger_state_t& totals) {
  EXPECT_EQ(totals.airline_escrow + totals.insurance_pool + totals.oracle_fees +
                totals.credit_total,
            totals.total_received - totals.total_paid_out);
}

}  // namespace

TEST(engine_integration, admission_moves_from_bootstrap_to_majority_vote) {
  auto harness = surety::testing::engine_harness{"surety_engine_admission"};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  ASSERT_EQ(registry.registered_airline_count(), 1u);

  auto airlines = std::vector<surety::schema::account_id_t>{};
  for (uint8_t seed = 11; seed <= 13; ++seed) {
    airlines.push_back(surety::testing::make_account(seed));
    auto result =
        registry.register_airline(harness.as(kFirstAirline), airlines.back());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(harness.decode_admission(result), std::tuple(true, uint32_t{0}));
    harness.fund(airlines.back());
  }
  ASSERT_EQ(registry.registered_airline_count(), 4u);

  auto fifth = surety::testing::make_account(20);
  auto one_vote = registry.register_airline(harness.as(airlines[0]), fifth);
  ASSERT_TRUE(one_vote.ok());
  EXPECT_EQ(harness.decode_admission(one_vote), std::tuple(false, uint32_t{1}));
  EXPECT_TRUE(registry.is_airline_pending(fifth));
  EXPECT_EQ(registry.registered_airline_count(), 4u);

  auto two_votes = registry.register_airline(harness.as(airlines[1]), fifth);
  ASSERT_TRUE(two_votes.ok());
  EXPECT_EQ(harness.decode_admission(two_votes), std::tuple(true, uint32_t{2}));
  EXPECT_TRUE(registry.is_airline_registered(fifth));
  EXPECT_EQ(registry.registered_airline_count(), 5u);
  auto admitted = std::ranges::any_of(two_votes.events, [](const auto& event) {
    return event.type == "airline_admitted";
  });
  EXPECT_TRUE(admitted);
}

TEST(engine_integration, delayed_flight_pays_passenger_who_withdraws) {
  auto harness = surety::testing::engine_harness{"surety_engine_payout",
                                                 {0, 1, 2}};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  ASSERT_TRUE(
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
          .ok());

  auto passenger = surety::testing::make_account(40);
  ASSERT_TRUE(registry
                  .buy_insurance(harness.as(passenger, kEther), passenger,
                                 kFirstAirline, kFlight, kDeparture, kEther)
                  .ok());

  auto oracles = std::vector<surety::schema::account_id_t>{};
  for (uint8_t seed = 100; seed < 103; ++seed) {
    oracles.push_back(surety::testing::make_account(seed));
    ASSERT_TRUE(
        registry.register_oracle(harness.as(oracles.back(), kEther)).ok());
  }
  auto opened = registry.request_flight_status(harness.as(passenger),
                                               kFirstAirline, kFlight,
                                               kDeparture);
  ASSERT_TRUE(opened.ok());
  auto index = harness.encoder.decode<uint8_t>(
      surety::schema::bytes_view_t{opened.data.data(), opened.data.size()});

  auto last = surety::schema::call_result_t{};
  for (const auto& oracle : oracles) {
    last = registry.submit_response(harness.as(oracle), index, kFirstAirline,
                                    kFlight, kDeparture,
                                    flight_status_t::late_airline);
    ASSERT_TRUE(last.ok()) << last.info;
  }
  auto credited = std::ranges::any_of(last.events, [](const auto& event) {
    return event.type == "insurance_credited";
  });
  EXPECT_TRUE(credited);
  EXPECT_EQ(registry.flight_status(kFirstAirline, kFlight, kDeparture),
            flight_status_t::late_airline);
  EXPECT_EQ(registry.passenger_balance(passenger), kEther + kEther / 2);

  harness.transfers.clear();
  ASSERT_TRUE(registry.withdraw(harness.as(passenger), kEther).ok());
  EXPECT_EQ(registry.passenger_balance(passenger), kEther / 2);
  ASSERT_EQ(harness.transfers.size(), 1u);
  EXPECT_EQ(harness.transfers[0].recipient, passenger);
  EXPECT_EQ(harness.transfers[0].amount, kEther);

  // The half ether the pool lacked came out of the airline's escrow.
  auto totals = registry.ledger_totals();
  EXPECT_EQ(totals.airline_escrow, 9 * kEther + kEther / 2);
  EXPECT_EQ(totals.insurance_pool, 0u);
  EXPECT_EQ(totals.oracle_fees, 3 * kEther);
  EXPECT_EQ(totals.credit_total, kEther / 2);
  expect_conserved(totals);
}

TEST(engine_integration, reentrant_withdraw_sees_the_settled_balance) {
  auto harness = surety::testing::engine_harness{"surety_engine_reentry"};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  ASSERT_TRUE(
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
          .ok());
  auto passenger = surety::testing::make_account(40);
  ASSERT_TRUE(registry
                  .buy_insurance(harness.as(passenger, kEther), passenger,
                                 kFirstAirline, kFlight, kDeparture, kEther)
                  .ok());
  ASSERT_TRUE(registry
                  .set_flight_status(harness.as(kFirstAirline), kFlight,
                                     kDeparture, flight_status_t::late_other)
                  .ok());
  ASSERT_EQ(registry.passenger_balance(passenger), kEther + kEther / 2);

  auto inner = std::optional<surety::schema::call_result_t>{};
  auto observed_balance = surety::schema::amount_t{};
  harness.on_transfer = [&](const surety::schema::account_id_t& recipient,
                            surety::schema::amount_t) {
    if (inner) {
      return;
    }
    observed_balance = registry.passenger_balance(recipient);
    inner = registry.withdraw(harness.as(recipient), kEther);
  };

  auto outer = registry.withdraw(harness.as(passenger), kEther);
  ASSERT_TRUE(outer.ok());
  ASSERT_TRUE(inner.has_value());
  EXPECT_EQ(observed_balance, kEther / 2);
  EXPECT_EQ(inner->error(), error_code::insufficient_credit);
  EXPECT_EQ(registry.passenger_balance(passenger), kEther / 2);
  EXPECT_EQ(harness.transfers.size(), 1u);
  expect_conserved(registry.ledger_totals());
}

TEST(engine_integration, paused_registry_rejects_every_mutation) {
  auto harness = surety::testing::engine_harness{"surety_engine_paused"};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  auto before = registry.ledger_totals();

  ASSERT_EQ(registry.set_operational(kFrontEnd, false).error(),
            error_code::unauthorized);
  ASSERT_TRUE(registry.set_operational(kOwner, false).ok());
  EXPECT_FALSE(registry.is_operational());

  auto target = surety::testing::make_account(11);
  EXPECT_EQ(registry.register_airline(harness.as(kFirstAirline), target).error(),
            error_code::not_operational);
  EXPECT_EQ(
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
          .error(),
      error_code::not_operational);
  EXPECT_EQ(registry.register_oracle(harness.as(target, kEther)).error(),
            error_code::not_operational);
  EXPECT_EQ(registry.withdraw(harness.as(target), 1).error(),
            error_code::not_operational);
  EXPECT_EQ(registry.authorize(kOwner, target).error(),
            error_code::not_operational);
  EXPECT_FALSE(registry.is_airline_registered(target));
  EXPECT_EQ(registry.ledger_totals().total_received, before.total_received);

  ASSERT_TRUE(registry.set_operational(kOwner, true).ok());
  EXPECT_TRUE(registry.register_airline(harness.as(kFirstAirline), target).ok());
}

TEST(engine_integration, unauthorized_front_end_is_rejected) {
  auto harness = surety::testing::engine_harness{"surety_engine_front_end"};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);

  auto rogue = surety::schema::call_context_t{
      .caller = surety::testing::make_account(66), .sender = kFirstAirline};
  auto result =
      registry.register_airline(rogue, surety::testing::make_account(11));
  EXPECT_EQ(result.error(), error_code::unauthorized);
  EXPECT_EQ(registry.registered_airline_count(), 1u);

  ASSERT_TRUE(registry.revoke(kOwner, kFrontEnd).ok());
  EXPECT_FALSE(registry.is_authorized(kFrontEnd));
  EXPECT_EQ(registry
                .register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
                .error(),
            error_code::unauthorized);
}

TEST(engine_integration, state_survives_restart_without_rebootstrap) {
  auto harness = surety::testing::engine_harness{"surety_engine_restart"};
  harness.fund(kFirstAirline);
  auto second = surety::testing::make_account(11);
  harness.admit(second);
  ASSERT_TRUE(harness.engine
                  ->register_flight(harness.as(second), kFlight, kDeparture)
                  .ok());
  auto before = harness.engine->ledger_totals();

  harness.reopen();
  auto& registry = *harness.engine;
  EXPECT_TRUE(registry.is_operational());
  EXPECT_TRUE(registry.is_authorized(kFrontEnd));
  EXPECT_EQ(registry.registered_airline_count(), 2u);
  EXPECT_TRUE(registry.is_airline_paid(kFirstAirline));
  EXPECT_TRUE(registry.is_airline_paid(second));
  EXPECT_TRUE(registry.find_flight(second, kFlight, kDeparture).has_value());
  EXPECT_EQ(registry.ledger_totals().airline_escrow, before.airline_escrow);
  EXPECT_EQ(registry.ledger_totals().total_received, before.total_received);
}
