#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <surety/blake3/hash.hpp>
#include <surety/execution/engine.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace surety::schema;

namespace {

account_id_t parse_account(const std::string& value) {
  auto account = try_make_hash32(value);
  if (!account) {
    throw std::invalid_argument{"expected 64 hex characters, got '" + value +
                                "'"};
  }
  return *account;
}

uint64_t parse_unsigned(const std::string& value) {
  auto parsed = try_parse_uint64(value);
  if (!parsed) {
    throw std::invalid_argument{"expected an unsigned integer, got '" + value +
                                "'"};
  }
  return *parsed;
}

flight_status_t parse_status(const std::string& value) {
  if (auto status = try_flight_status_from_string(value)) {
    return *status;
  }
  auto code = try_parse_uint64(value);
  if (code && *code <= 255) {
    if (auto status =
            try_flight_status_from_code(static_cast<uint8_t>(*code))) {
      return *status;
    }
  }
  throw std::invalid_argument{"unknown flight status '" + value + "'"};
}

const std::string& argument(const std::vector<std::string>& args,
                            const size_t position,
                            const std::string_view name) {
  if (position >= args.size()) {
    throw std::invalid_argument{"missing argument <" + std::string{name} + ">"};
  }
  return args[position];
}

int report(const call_result_t& result) {
  if (result.ok()) {
    std::cout << "ok" << std::endl;
  } else {
    std::cout << "error " << to_string(static_cast<error_code>(result.code))
              << " (" << result.codespace << ")" << std::endl;
  }
  if (!result.info.empty()) {
    std::cout << "  info: " << result.info << std::endl;
  }
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << std::endl;
  }
  return result.ok() ? 0 : 3;
}

void print_totals(const ledger_state_t& totals) {
  std::cout << "airline escrow:  " << totals.airline_escrow << std::endl
            << "insurance pool:  " << totals.insurance_pool << std::endl
            << "oracle fees:     " << totals.oracle_fees << std::endl
            << "passenger credit:" << totals.credit_total << std::endl
            << "total received:  " << totals.total_received << std::endl
            << "total paid out:  " << totals.total_paid_out << std::endl;
}

int run_command(surety::execution::engine& registry,
                const std::string& command,
                const std::vector<std::string>& args,
                const call_context_t& ctx) {
  if (command == "status") {
    std::cout << "operational: " << std::boolalpha
              << registry.is_operational() << std::endl
              << "registered airlines: " << registry.registered_airline_count()
              << std::endl;
    print_totals(registry.ledger_totals());
    return 0;
  }
  if (command == "authorize") {
    return report(registry.authorize(
        ctx.sender, parse_account(argument(args, 0, "account"))));
  }
  if (command == "revoke") {
    return report(registry.revoke(ctx.sender,
                                  parse_account(argument(args, 0, "account"))));
  }
  if (command == "set-operational") {
    auto flag = argument(args, 0, "true|false");
    if (flag != "true" && flag != "false") {
      throw std::invalid_argument{"expected true or false, got '" + flag + "'"};
    }
    return report(registry.set_operational(ctx.sender, flag == "true"));
  }
  if (command == "register-airline") {
    return report(registry.register_airline(
        ctx, parse_account(argument(args, 0, "airline"))));
  }
  if (command == "pay-fund") {
    return report(registry.pay_membership_fund(ctx));
  }
  if (command == "register-flight") {
    return report(registry.register_flight(
        ctx, argument(args, 0, "code"),
        parse_unsigned(argument(args, 1, "timestamp"))));
  }
  if (command == "set-flight-status") {
    return report(registry.set_flight_status(
        ctx, argument(args, 0, "code"),
        parse_unsigned(argument(args, 1, "timestamp")),
        parse_status(argument(args, 2, "status"))));
  }
  if (command == "buy-insurance") {
    return report(registry.buy_insurance(
        ctx, parse_account(argument(args, 0, "passenger")),
        parse_account(argument(args, 1, "airline")), argument(args, 2, "code"),
        parse_unsigned(argument(args, 3, "timestamp")),
        parse_unsigned(argument(args, 4, "amount"))));
  }
  if (command == "register-oracle") {
    auto result = registry.register_oracle(ctx);
    if (auto indexes = registry.oracle_indexes(ctx.sender)) {
      std::cout << "indexes: " << static_cast<int>((*indexes)[0]) << " "
                << static_cast<int>((*indexes)[1]) << " "
                << static_cast<int>((*indexes)[2]) << std::endl;
    }
    return report(result);
  }
  if (command == "request-status") {
    return report(registry.request_flight_status(
        ctx, parse_account(argument(args, 0, "airline")),
        argument(args, 1, "code"),
        parse_unsigned(argument(args, 2, "timestamp"))));
  }
  if (command == "submit-response") {
    auto index = parse_unsigned(argument(args, 0, "index"));
    if (index > 255) {
      throw std::invalid_argument{"index out of range"};
    }
    return report(registry.submit_response(
        ctx, static_cast<uint8_t>(index),
        parse_account(argument(args, 1, "airline")), argument(args, 2, "code"),
        parse_unsigned(argument(args, 3, "timestamp")),
        parse_status(argument(args, 4, "status"))));
  }
  if (command == "withdraw") {
    return report(
        registry.withdraw(ctx, parse_unsigned(argument(args, 0, "amount"))));
  }
  if (command == "balance") {
    auto passenger = parse_account(argument(args, 0, "passenger"));
    std::cout << registry.passenger_balance(passenger) << std::endl;
    return 0;
  }
  if (command == "flight") {
    auto flight = registry.find_flight(
        parse_account(argument(args, 0, "airline")), argument(args, 1, "code"),
        parse_unsigned(argument(args, 2, "timestamp")));
    if (!flight) {
      std::cout << "unknown flight" << std::endl;
      return 3;
    }
    std::cout << "key: " << to_hex(flight->key) << std::endl
              << "status: " << to_string(flight->status) << std::endl
              << "oracle resolved: " << std::boolalpha
              << flight->oracle_resolved << std::endl;
    return 0;
  }

  throw std::invalid_argument{"unknown command '" + command + "'"};
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("surety.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "surety", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto db_path = std::string{};
  auto owner = std::string{};
  auto first_airline = std::string{};
  auto seed = std::string{};
  auto caller = std::string{};
  auto sender = std::string{};
  auto value = std::string{"0"};
  auto command = std::string{};
  auto args = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Surety"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "surety.db"),
      "Path of the registry store")(
      "owner,o", boost::program_options::value<std::string>(&owner),
      "Owner identity used when the store is created")(
      "first-airline,f",
      boost::program_options::value<std::string>(&first_airline),
      "Airline admitted when the store is created")(
      "seed,s", boost::program_options::value<std::string>(&seed),
      "Entropy seed for oracle index assignment")(
      "caller,c", boost::program_options::value<std::string>(&caller),
      "Authorized front end identity")(
      "sender,a", boost::program_options::value<std::string>(&sender),
      "Acting airline, passenger, oracle or owner")(
      "value,x",
      boost::program_options::value<std::string>(&value)->default_value("0"),
      "Payment attached to the call, in gwei")(
      "verbose,v", "Enable verbose output");

  auto hidden = boost::program_options::options_description{};
  hidden.add_options()("command",
                       boost::program_options::value<std::string>(&command))(
      "args", boost::program_options::value<std::vector<std::string>>(&args));
  auto all = boost::program_options::options_description{};
  all.add(description).add(hidden);
  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .run(),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "usage: surety_cli [options] <command> [args...]" << std::endl
              << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto exit_code = 0;
  try {
    auto config = surety::execution::engine_config{};
    config.owner = owner.empty() ? make_zero_hash() : parse_account(owner);
    config.first_airline =
        first_airline.empty() ? make_zero_hash() : parse_account(first_airline);

    auto ctx = call_context_t{};
    ctx.caller = caller.empty() ? make_zero_hash() : parse_account(caller);
    ctx.sender = sender.empty() ? make_zero_hash() : parse_account(sender);
    ctx.value = parse_unsigned(value);

    auto encoder = surety::execution::encoder_t{};
    auto storage =
        surety::storage::make_storage<surety::storage::rocksdb_storage_tag>(
            db_path);
    auto entropy = surety::execution::make_seeded_entropy_source(
        seed.empty() ? make_zero_hash() : surety::blake3::hash(seed));
    auto registry = surety::execution::engine{
        encoder, storage, config, entropy,
        [](const account_id_t& recipient, const amount_t amount) {
          spdlog::info("Transfer {} gwei to {}", amount, to_hex(recipient));
          return true;
        }};

    exit_code = run_command(registry, command, args, ctx);
  } catch (const std::invalid_argument& e) {
    spdlog::error("{}", e.what());
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
