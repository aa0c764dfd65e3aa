#include <gtest/gtest.h>
#include <surety/execution/fund_ledger.hpp>
#include <surety/testing/engine_harness.hpp>

#include <vector>

using surety::schema::error_code;
using surety::schema::kEther;

namespace {

void expect_conserved(const surety::schema::ledger_state_t& totals) {
  EXPECT_EQ(totals.airline_escrow + totals.insurance_pool + totals.oracle_fees +
                totals.credit_total,
            totals.total_received - totals.total_paid_out);
}

}  // namespace

TEST(fund_ledger, deposits_land_in_their_own_balances) {
  auto harness = surety::testing::store_harness{"surety_ledger_deposits"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};

  ledger.deposit_escrow(10 * kEther);
  ledger.deposit_pool(2 * kEther);
  ledger.deposit_oracle_fee(1 * kEther);

  auto totals = ledger.totals();
  EXPECT_EQ(totals.airline_escrow, 10 * kEther);
  EXPECT_EQ(totals.insurance_pool, 2 * kEther);
  EXPECT_EQ(totals.oracle_fees, 1 * kEther);
  EXPECT_EQ(totals.credit_total, 0u);
  EXPECT_EQ(totals.total_received, 13 * kEther);
  expect_conserved(totals);
}

TEST(fund_ledger, payout_draws_on_the_pool_first) {
  auto harness = surety::testing::store_harness{"surety_ledger_pool"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};
  auto passenger = surety::testing::make_account(20);

  ledger.deposit_escrow(10 * kEther);
  ledger.deposit_pool(2 * kEther);
  EXPECT_FALSE(ledger.credit_payout(passenger, kEther / 2).has_value());
  EXPECT_EQ(ledger.credit_of(passenger), kEther / 2);
  EXPECT_EQ(ledger.totals().insurance_pool, kEther + kEther / 2);
  EXPECT_EQ(ledger.totals().airline_escrow, 10 * kEther);
  expect_conserved(ledger.totals());
}

TEST(fund_ledger, payout_shortfall_comes_from_airline_escrow) {
  auto harness = surety::testing::store_harness{"surety_ledger_shortfall"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};
  auto passenger = surety::testing::make_account(20);

  ledger.deposit_escrow(10 * kEther);
  ledger.deposit_pool(kEther);
  EXPECT_FALSE(
      ledger.credit_payout(passenger, kEther + kEther / 2).has_value());
  EXPECT_EQ(ledger.credit_of(passenger), kEther + kEther / 2);
  auto totals = ledger.totals();
  EXPECT_EQ(totals.insurance_pool, 0u);
  EXPECT_EQ(totals.airline_escrow, 9 * kEther + kEther / 2);
  EXPECT_EQ(totals.credit_total, kEther + kEther / 2);
  expect_conserved(totals);
}

TEST(fund_ledger, payout_refuses_what_pool_and_escrow_lack) {
  auto harness = surety::testing::store_harness{"surety_ledger_underfunded"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};
  auto passenger = surety::testing::make_account(20);

  ledger.deposit_escrow(kEther);
  ledger.deposit_pool(kEther / 2);
  EXPECT_EQ(ledger.credit_payout(passenger, 2 * kEther),
            error_code::pool_underfunded);
  EXPECT_EQ(ledger.credit_of(passenger), 0u);
  EXPECT_EQ(ledger.totals().insurance_pool, kEther / 2);
  EXPECT_EQ(ledger.totals().airline_escrow, kEther);
  expect_conserved(ledger.totals());
}

TEST(fund_ledger, withdraw_debits_before_the_transfer_runs) {
  auto harness = surety::testing::store_harness{"surety_ledger_withdraw"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};
  auto passenger = surety::testing::make_account(20);
  ledger.deposit_pool(2 * kEther);
  ASSERT_FALSE(ledger.credit_payout(passenger, 2 * kEther).has_value());

  auto observed = std::vector<surety::schema::amount_t>{};
  auto sink = [&](const surety::schema::account_id_t& recipient,
                  const surety::schema::amount_t amount) {
    EXPECT_EQ(recipient, passenger);
    EXPECT_EQ(amount, kEther);
    observed.push_back(ledger.credit_of(passenger));
    return true;
  };

  EXPECT_FALSE(ledger.withdraw(passenger, kEther, sink).has_value());
  ASSERT_EQ(observed.size(), 1u);
  EXPECT_EQ(observed[0], kEther);
  EXPECT_EQ(ledger.credit_of(passenger), kEther);
  EXPECT_EQ(ledger.totals().total_paid_out, kEther);
  expect_conserved(ledger.totals());

  EXPECT_EQ(ledger.withdraw(passenger, 2 * kEther, sink),
            error_code::insufficient_credit);
  EXPECT_EQ(observed.size(), 1u);
}

TEST(fund_ledger, refused_withdraw_restores_credit) {
  auto harness = surety::testing::store_harness{"surety_ledger_refused"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};
  auto passenger = surety::testing::make_account(20);
  ledger.deposit_pool(kEther);
  ASSERT_FALSE(ledger.credit_payout(passenger, kEther).has_value());

  auto refuse = [](const surety::schema::account_id_t&,
                   surety::schema::amount_t) { return false; };
  EXPECT_EQ(ledger.withdraw(passenger, kEther, refuse),
            error_code::transfer_failed);
  EXPECT_EQ(ledger.credit_of(passenger), kEther);
  EXPECT_EQ(ledger.totals().total_paid_out, 0u);
  expect_conserved(ledger.totals());
}

TEST(fund_ledger, refused_refund_becomes_credit) {
  auto harness = surety::testing::store_harness{"surety_ledger_refund"};
  auto ledger =
      surety::execution::fund_ledger{harness.encoder, *harness.storage};
  auto payer = surety::testing::make_account(21);

  auto refunded = surety::schema::amount_t{};
  ledger.refund(payer, 3 * kEther,
                [&](const surety::schema::account_id_t&,
                    const surety::schema::amount_t amount) {
                  refunded += amount;
                  return true;
                });
  EXPECT_EQ(refunded, 3 * kEther);
  EXPECT_EQ(ledger.credit_of(payer), 0u);

  ledger.refund(payer, 2 * kEther,
                [](const surety::schema::account_id_t&,
                   surety::schema::amount_t) { return false; });
  EXPECT_EQ(ledger.credit_of(payer), 2 * kEther);
  EXPECT_EQ(ledger.totals().credit_total, 2 * kEther);
  expect_conserved(ledger.totals());
}
