#include <gtest/gtest.h>
#include <surety/execution/backend.hpp>
#include <surety/execution/entropy_source.hpp>
#include <surety/schema/key/registry_keys.hpp>
#include <surety/testing/common.hpp>

#include <algorithm>
#include <set>

namespace {

using encoder_t = surety::execution::encoder_t;

bool starts_with(const surety::schema::bytes_t& value,
                 const surety::schema::bytes_t& prefix) {
  return value.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(value));
}

}  // namespace

TEST(registry_keys, keyspaces_are_distinct) {
  auto keyspaces = std::set<std::string_view>{
      std::begin(surety::schema::key::kRegistryKeyspaces),
      std::end(surety::schema::key::kRegistryKeyspaces)};
  EXPECT_EQ(keyspaces.size(), surety::schema::key::kRegistryKeyspaces.size());
}

TEST(registry_keys, claim_keys_share_the_flight_prefix) {
  auto encoder = encoder_t{};
  auto flight = surety::testing::make_hash(40);
  auto other_flight = surety::testing::make_hash(41);
  auto passenger = surety::testing::make_account(7);

  auto prefix = surety::schema::key::make_claim_prefix_key(encoder, flight);
  EXPECT_TRUE(starts_with(
      surety::schema::key::make_claim_key(encoder, flight, passenger), prefix));
  EXPECT_FALSE(starts_with(
      surety::schema::key::make_claim_key(encoder, other_flight, passenger),
      prefix));
}

TEST(registry_keys, same_account_maps_to_different_keys_per_component) {
  auto encoder = encoder_t{};
  auto account = surety::testing::make_account(3);
  auto keys = std::set<surety::schema::bytes_t>{
      surety::schema::key::make_authorized_key(encoder, account),
      surety::schema::key::make_airline_key(encoder, account),
      surety::schema::key::make_vote_key(encoder, account),
      surety::schema::key::make_credit_key(encoder, account),
      surety::schema::key::make_oracle_key(encoder, account)};
  EXPECT_EQ(keys.size(), 5u);
}

TEST(registry_keys, flight_key_depends_on_every_component) {
  auto encoder = encoder_t{};
  auto airline = surety::testing::make_account(10);
  auto other_airline = surety::testing::make_account(11);

  auto key = surety::schema::key::make_flight_key(encoder, airline, "SU100",
                                                  1'700'000'000);
  EXPECT_EQ(key, surety::schema::key::make_flight_key(encoder, airline, "SU100",
                                                      1'700'000'000));
  EXPECT_NE(key, surety::schema::key::make_flight_key(encoder, other_airline,
                                                      "SU100", 1'700'000'000));
  EXPECT_NE(key, surety::schema::key::make_flight_key(encoder, airline, "SU101",
                                                      1'700'000'000));
  EXPECT_NE(key, surety::schema::key::make_flight_key(encoder, airline, "SU100",
                                                      1'700'000'001));
}

TEST(entropy_source, index_uses_little_endian_prefix) {
  auto entropy = surety::schema::make_zero_hash();
  entropy[0] = 7;
  EXPECT_EQ(surety::execution::index_from_entropy(entropy, 10), 7u);

  // 0x0100 == 256, 256 % 10 == 6
  entropy[0] = 0;
  entropy[1] = 1;
  EXPECT_EQ(surety::execution::index_from_entropy(entropy, 10), 6u);

  // Bytes past the first eight are ignored.
  entropy[1] = 0;
  entropy[8] = 0xFF;
  EXPECT_EQ(surety::execution::index_from_entropy(entropy, 10), 0u);
}

TEST(entropy_source, seeded_source_is_deterministic_per_input) {
  auto source =
      surety::execution::make_seeded_entropy_source(surety::testing::make_hash(1));
  auto same_seed =
      surety::execution::make_seeded_entropy_source(surety::testing::make_hash(1));
  auto other_seed =
      surety::execution::make_seeded_entropy_source(surety::testing::make_hash(2));
  auto account = surety::testing::make_account(5);

  EXPECT_EQ(source(account, 0), same_seed(account, 0));
  EXPECT_NE(source(account, 0), source(account, 1));
  EXPECT_NE(source(account, 0), source(surety::testing::make_account(6), 0));
  EXPECT_NE(source(account, 0), other_seed(account, 0));
}
