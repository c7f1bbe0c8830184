#include <oocsi/oocsi.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

std::atomic<bool> running{true};

void on_signal(int) { running.store(false); }

} // namespace

// Usage: oocsi_echo [--uri tcp://host:port] [--host h] [--port p] [--handle name]
int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  oocsi::client_config cfg;
  oocsi::parsed_uri endpoint;
  try {
    cfg = oocsi::parse_flags(args);
    endpoint = oocsi::parse_uri(cfg.uri);
  } catch (const std::invalid_argument &e) {
    spdlog::error("{}", e.what());
    return 2;
  }

  oocsi::client_options options;
  options.auto_reconnect = true;

  oocsi::client client(
      endpoint.host, endpoint.port, cfg.handle,
      [](const std::string &sender, const std::string &, const oocsi::json &data) {
        spdlog::info("direct message from {}: {}", sender, data.dump());
      },
      options);
  if (!client.is_connected()) {
    spdlog::error("could not connect to {}", cfg.uri);
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  client.subscribe("testchannel", [](const std::string &sender,
                                     const std::string &, const oocsi::json &data) {
    spdlog::info("from {} -> {}", sender, data.dump());
  });
  client.register_responder("echoService", "echo",
                            [](const oocsi::json &request) { return request; });

  bool announced =
      client.hey_oocsi()
          .add_property("description", "echo responder")
          .add_sensor("uptime", client.handle() + "/uptime", "duration", "s", 0)
          .submit();
  if (!announced)
    spdlog::warn("device description not sent");

  oocsi::variable<double> uptime(client, client.handle() + "/uptime", "uptime");
  auto started = std::chrono::steady_clock::now();
  auto next_beat = started;
  while (running.load()) {
    client.pump_for(200);
    auto now = std::chrono::steady_clock::now();
    if (now >= next_beat && client.is_connected()) {
      uptime.set(std::chrono::duration<double>(now - started).count());
      next_beat = now + std::chrono::seconds(5);
    }
  }

  client.stop();
  return 0;
}
