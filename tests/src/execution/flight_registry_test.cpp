#include <gtest/gtest.h>
#include <surety/testing/engine_harness.hpp>

using surety::schema::error_code;
using surety::schema::flight_status_t;
using surety::testing::kFirstAirline;

namespace {

constexpr auto kFlight = "SU100";
constexpr auto kDeparture = surety::schema::timestamp_seconds_t{1'700'000'000};

}  // namespace

TEST(flight_registry, registration_requires_a_funded_airline) {
  auto harness = surety::testing::engine_harness{"surety_flight_funded"};
  auto& registry = *harness.engine;

  auto unfunded =
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture);
  EXPECT_EQ(unfunded.error(), error_code::not_authorized_airline);
  auto stranger = registry.register_flight(
      harness.as(surety::testing::make_account(50)), kFlight, kDeparture);
  EXPECT_EQ(stranger.error(), error_code::not_authorized_airline);

  harness.fund(kFirstAirline);
  auto result =
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture);
  ASSERT_TRUE(result.ok()) << result.info;
  auto key = harness.encoder.decode<surety::schema::flight_key_t>(
      surety::schema::bytes_view_t{result.data.data(), result.data.size()});

  auto flight = registry.find_flight(kFirstAirline, kFlight, kDeparture);
  ASSERT_TRUE(flight.has_value());
  EXPECT_EQ(flight->key, key);
  EXPECT_EQ(flight->airline, kFirstAirline);
  EXPECT_EQ(flight->code, kFlight);
  EXPECT_EQ(flight->status, flight_status_t::unknown);
  EXPECT_FALSE(flight->oracle_resolved);
}

TEST(flight_registry, duplicate_flight_is_rejected) {
  auto harness = surety::testing::engine_harness{"surety_flight_duplicate"};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  ASSERT_TRUE(
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
          .ok());

  auto again =
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture);
  EXPECT_EQ(again.error(), error_code::flight_already_exists);
  EXPECT_TRUE(registry
                  .register_flight(harness.as(kFirstAirline), kFlight,
                                   kDeparture + 86'400)
                  .ok());
}

TEST(flight_registry, only_the_owning_airline_sets_status) {
  auto harness = surety::testing::engine_harness{"surety_flight_owner"};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  auto other = surety::testing::make_account(11);
  harness.admit(other);
  ASSERT_TRUE(
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
          .ok());

  auto foreign = registry.set_flight_status(harness.as(other), kFlight,
                                            kDeparture, flight_status_t::on_time);
  EXPECT_EQ(foreign.error(), error_code::unknown_flight);
  EXPECT_EQ(registry.flight_status(kFirstAirline, kFlight, kDeparture),
            flight_status_t::unknown);

  auto missing = registry.set_flight_status(
      harness.as(kFirstAirline), "SU999", kDeparture, flight_status_t::on_time);
  EXPECT_EQ(missing.error(), error_code::unknown_flight);
  EXPECT_FALSE(
      registry.flight_status(kFirstAirline, "SU999", kDeparture).has_value());
}

TEST(flight_registry, airline_updates_overwrite_until_oracles_resolve) {
  auto harness =
      surety::testing::engine_harness{"surety_flight_overwrite", {0, 1, 2}};
  auto& registry = *harness.engine;
  harness.fund(kFirstAirline);
  ASSERT_TRUE(
      registry.register_flight(harness.as(kFirstAirline), kFlight, kDeparture)
          .ok());

  auto update = registry.set_flight_status(harness.as(kFirstAirline), kFlight,
                                           kDeparture, flight_status_t::on_time);
  ASSERT_TRUE(update.ok());
  ASSERT_EQ(update.events.size(), 1u);
  EXPECT_EQ(update.events[0].type, "flight_status_resolved");
  EXPECT_TRUE(registry
                  .set_flight_status(harness.as(kFirstAirline), kFlight,
                                     kDeparture, flight_status_t::late_weather)
                  .ok());
  EXPECT_EQ(registry.flight_status(kFirstAirline, kFlight, kDeparture),
            flight_status_t::late_weather);

  // Three oracles holding {0, 1, 2}; the request draws index 0.
  auto oracles = std::vector<surety::schema::account_id_t>{};
  for (uint8_t seed = 30; seed < 33; ++seed) {
    oracles.push_back(surety::testing::make_account(seed));
    ASSERT_TRUE(registry
                    .register_oracle(harness.as(
                        oracles.back(), surety::schema::kEther))
                    .ok());
  }
  ASSERT_TRUE(registry
                  .request_flight_status(harness.as(kFirstAirline),
                                         kFirstAirline, kFlight, kDeparture)
                  .ok());
  for (const auto& oracle : oracles) {
    ASSERT_TRUE(registry
                    .submit_response(harness.as(oracle), 0, kFirstAirline,
                                     kFlight, kDeparture,
                                     flight_status_t::on_time)
                    .ok());
  }
  auto flight = registry.find_flight(kFirstAirline, kFlight, kDeparture);
  ASSERT_TRUE(flight.has_value());
  EXPECT_EQ(flight->status, flight_status_t::on_time);
  EXPECT_TRUE(flight->oracle_resolved);

  auto frozen = registry.set_flight_status(
      harness.as(kFirstAirline), kFlight, kDeparture,
      flight_status_t::late_airline);
  EXPECT_EQ(frozen.error(), error_code::flight_status_finalized);
  EXPECT_EQ(registry.flight_status(kFirstAirline, kFlight, kDeparture),
            flight_status_t::on_time);
}
