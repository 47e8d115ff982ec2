// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "node.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <boost/asio/io_context.hpp>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {

constexpr int MAX_DEVICES = 254;

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Runs a set of simulated devices, discovers them with Who-Is from the\n"
      << "first one and sends each discovered device one confirmed request.\n"
      << "\n"
      << "Options:\n"
      << "  --devices=<n>        Number of simulated devices, 2-" << MAX_DEVICES
      << " (default: 4)\n"
      << "  --timeout=<ms>       APDU timeout for confirmed requests (default: 3000)\n"
      << "  --json               Print the results as JSON\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: app, cache, stack, all\n"
      << "                       Can be comma-separated: --debug=app,cache\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

struct ProbeResult {
  std::string device;
  std::string address;
  std::string state;
  std::string outcome;
};

ProbeResult DescribeProbe(const std::string &device, const bacstack::app::IOCB &iocb) {
  ProbeResult result;
  result.device = device;
  result.address = iocb.request()->destination().ToString();
  result.state = bacstack::app::ToString(iocb.state());
  const auto &outcome = iocb.state() == bacstack::app::IOState::COMPLETED ? iocb.response()
                                                                           : iocb.error();
  result.outcome = outcome ? outcome->ToString() : std::string("-");
  return result;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    int device_count = 4;
    int timeout_ms = 3000;
    bool json_output = false;
    std::string log_level = "warn";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << bacstack::GetFullVersionString() << std::endl;
        std::cout << bacstack::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--devices=") == 0) {
        auto devices_opt = bacstack::util::SafeParseInt(arg.substr(10), 2, MAX_DEVICES);
        if (!devices_opt) {
          std::cerr << "Error: Invalid device count: " << arg.substr(10) << std::endl;
          std::cerr << "Device count must be a number between 2 and " << MAX_DEVICES
                    << std::endl;
          return 1;
        }
        device_count = *devices_opt;
      } else if (arg.find("--timeout=") == 0) {
        auto timeout_opt = bacstack::util::SafeParseInt(arg.substr(10), 1, 600000);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of milliseconds between 1 and 600000"
                    << std::endl;
          return 1;
        }
        timeout_ms = *timeout_opt;
      } else if (arg == "--json") {
        json_output = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=app,cache
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    bacstack::util::LogManager::Initialize(log_level, false);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        bacstack::util::LogManager::SetLogLevel("trace");
      } else {
        bacstack::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    nlohmann::json report;
    std::vector<ProbeResult> probes;

    // IMPORTANT: nested scope so every node is gone before LogManager::Shutdown()
    {
      boost::asio::io_context io_context;
      bacstack::sim::SimulatedNetwork network(io_context);

      std::vector<std::unique_ptr<bacstack::node::Node>> nodes;
      for (int i = 0; i < device_count; ++i) {
        bacstack::node::NodeConfig config;
        config.device_instance = 1000 + static_cast<uint32_t>(i);
        config.device_name = "device-" + std::to_string(i);
        config.apdu_timeout = std::chrono::milliseconds(timeout_ms);
        auto address =
            bacstack::pdu::Address::LocalStation({static_cast<uint8_t>(i + 1)});
        nodes.push_back(std::make_unique<bacstack::node::Node>(config, network, address));
      }

      auto &client = *nodes.front();

      // Discovery
      client.device_services().who_is();
      io_context.run();

      auto &cache = client.application().device_info_cache();
      LOG_INFO("Discovered {} device(s)", cache.size());

      // One confirmed probe per discovered device. None of the simulated
      // devices implements ReadProperty, so each answers with a Reject.
      for (const auto &info : cache.records()) {
        if (!info->address || !info->device_identifier) {
          continue;
        }
        auto probe = std::make_shared<bacstack::apdu::ConfirmedRequest>(
            bacstack::apdu::ConfirmedServiceChoice::READ_PROPERTY);
        probe->set_destination(*info->address);

        std::string device = info->device_identifier->ToString();
        auto iocb = client.send_confirmed(probe);
        iocb->add_callback([&probes, device](const bacstack::app::IOCB &done) {
          probes.push_back(DescribeProbe(device, done));
        });
      }

      io_context.restart();
      io_context.run();

      const auto &stats = network.stats();
      report["network"] = {{"sent", stats.sent},
                           {"delivered", stats.delivered},
                           {"dropped", stats.dropped}};
      report["devices"] = cache.Snapshot();
      report["services_supported"] = client.application().get_services_supported().ToString();
    }

    report["probes"] = nlohmann::json::array();
    for (const auto &probe : probes) {
      report["probes"].push_back({{"device", probe.device},
                                  {"address", probe.address},
                                  {"state", probe.state},
                                  {"outcome", probe.outcome}});
    }

    if (json_output) {
      std::cout << report.dump(2) << std::endl;
    } else {
      std::cout << "Devices:\n";
      for (const auto &device : report["devices"]) {
        std::cout << "  " << device["device_identifier"].dump() << " at "
                  << device["address"].dump()
                  << " max-apdu=" << device["max_apdu_length_accepted"].get<uint32_t>()
                  << " segmentation=" << device["segmentation_supported"].get<std::string>()
                  << "\n";
      }
      std::cout << "Probes:\n";
      for (const auto &probe : probes) {
        std::cout << "  " << probe.device << " (" << probe.address << "): " << probe.state
                  << " " << probe.outcome << "\n";
      }
      std::cout << "Network: sent=" << report["network"]["sent"].get<uint64_t>()
                << " delivered=" << report["network"]["delivered"].get<uint64_t>()
                << " dropped=" << report["network"]["dropped"].get<uint64_t>() << std::endl;
    }

    // Shutdown logging AFTER the nodes are destroyed
    bacstack::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    bacstack::util::LogManager::Shutdown();
    return 1;
  }
}
