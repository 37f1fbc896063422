#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <google/protobuf/util/json_util.h>

#include "internal/config/config_loader.hpp"
#include "internal/events/event_log.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reservation/reservation_table.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

using capacity::observability::StringField;
using capacity::observability::UintField;
using capacity::runtime::Server;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cerr << "usage: capacity-manager [--check] <config.yaml>\n"
               "       capacity-manager [--check] --config <config.yaml>\n"
               "  --check  load and validate the configuration, print it with defaults applied, exit\n";
}

void ShutdownObservability() {
  capacity::observability::ShutdownLogging();
  capacity::observability::ShutdownMetrics();
  capacity::observability::ShutdownTracing();
}

int PrintEffectiveConfig(const capacity::runtime::config::RuntimeConfig& config) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(config, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render configuration: " << status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  bool        check_only = false;
  std::string config_path;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && !arg.empty() && arg[0] != '-') {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = capacity::config::ConfigLoader::LoadFromYaml(config_path);
    if (check_only) {
      return PrintEffectiveConfig(config);
    }

    capacity::observability::InitializeTracing(config);
    capacity::observability::InitializeMetrics(config);
    capacity::observability::InitializeLogging(config);

    auto app = capacity::factory::Build(config);

    CAPACITY_LOG_INFO("capacity parameters",
                      {UintField("auction_duration_ms", capacity::util::ToMillis(config.auction().duration())),
                       UintField("minimal_bid", config.auction().minimal_bid()),
                       UintField("reference_call_cost", config.quota().reference_call_cost()),
                       UintField("daily_utps", config.quota().daily_utps()),
                       StringField("lock_ratio", std::to_string(config.lock().asset_to_tps_ratio().numerator()) + "/" +
                                                     std::to_string(config.lock().asset_to_tps_ratio().denominator())),
                       StringField("custodial_account", config.lock().custodial_account())});

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // handlers go in before Start so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    // Reservations expire lazily; touching the table once per tick keeps
    // abandoned pre-dispatch holds from piling up between requests.
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      (void)app.reservations->Size();
    }

    CAPACITY_LOG_INFO("shutting down capacity manager", {UintField("open_reservations", app.reservations->Size()),
                                                         UintField("undrained_events", app.events->Size()),
                                                         UintField("dropped_events", app.events->Dropped())});

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    CAPACITY_LOG_ERROR("fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
