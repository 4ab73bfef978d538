#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <bulletin/host/ledger_host.hpp>
#include <bulletin/host/script.hpp>
#include <bulletin/schema/bulletin_event.hpp>
#include <bulletin/schema/quorum_policy.hpp>
#include <string>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto db_path = std::string{};
  auto script_path = std::string{};
  auto owner_token = std::string{};
  auto timeout = bulletin::schema::clock_tick_t{};
  auto quorum_policy = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Bulletin"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "bulletin.db"),
      "RocksDB directory holding the bulletin state")(
      "script,s",
      boost::program_options::value<std::string>(&script_path)->default_value(
          "-"),
      "Script to run, '-' for stdin")(
      "owner,o",
      boost::program_options::value<std::string>(&owner_token)->default_value(
          std::string(64, '0')),
      "Owner identity (64 hex digits or a name)")(
      "timeout,t",
      boost::program_options::value<bulletin::schema::clock_tick_t>(&timeout)
          ->default_value(0),
      "Approval timeout in clock ticks for a fresh database")(
      "quorum-policy,q",
      boost::program_options::value<std::string>(&quorum_policy)
          ->default_value("small_committee"),
      "Quorum formula: small_committee or majority")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "bulletin.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "bulletin", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto policy =
      bulletin::schema::try_from_string<bulletin::schema::quorum_policy_t>(
          quorum_policy);
  if (!policy) {
    spdlog::error("Unknown quorum policy '{}'", quorum_policy);
    spdlog::shutdown();
    return 1;
  }

  auto options = bulletin::execution::engine_options{};
  options.owner =
      bulletin::host::resolve_identity(owner_token, bulletin::schema::member_id_t{});
  options.timeout = timeout;
  options.quorum_policy = *policy;

  auto host = bulletin::host::ledger_host{options, db_path};
  host.subscribe([](const bulletin::schema::bulletin_event_t& event) {
    std::cout << bulletin::schema::describe(event) << std::endl;
  });

  auto file = std::ifstream{};
  if (script_path != "-") {
    file.open(script_path);
    if (!file) {
      spdlog::error("Unable to open script '{}'", script_path);
      spdlog::shutdown();
      return 1;
    }
  }
  auto& input = script_path == "-" ? std::cin : static_cast<std::istream&>(file);

  auto line = std::string{};
  auto line_number = size_t{0};
  auto failures = size_t{0};
  while (!shutdown_requested() && std::getline(input, line)) {
    ++line_number;
    auto error = std::string{};
    auto command =
        bulletin::host::parse_script_line(line, options.owner, error);
    if (!command) {
      if (!error.empty()) {
        ++failures;
        spdlog::warn("Script line {}: {}", line_number, error);
      }
      continue;
    }
    bulletin::host::execute(host, *command, std::cout);
  }

  spdlog::info("Processed {} script line(s), {} rejected by the parser",
               line_number, failures);
  spdlog::shutdown();
  return 0;
}
