#include "DeviceMonitor.hpp"
#include "FakeHdcServer.hpp"
#include "TestHeaders.hpp"

using namespace hdc;

namespace {
ClientConfig monitorConfig() {
  ClientConfig config;
  config.connectTimeoutMs = 2000;
  config.commandTimeoutMs = 2000;
  return config;
}
}  // namespace

TEST_CASE("Reports only changes to the device list", "[DeviceMonitor]") {
  FakeHdcServer server;
  server.addCommandConnection({"devA\ndevB\n"});
  server.addCommandConnection({"devA\ndevB\n"});
  server.addCommandConnection({"devA\n"});

  ClientConfig config = monitorConfig();
  DeviceMonitor monitor(server.getSocketHandler(), config.getEndpoint(),
                        config);
  vector<vector<string>> reported;
  monitor.run(10, [&](const vector<string>& devices) {
    reported.push_back(devices);
    return reported.size() < 2;
  });

  REQUIRE(reported.size() == 2);
  REQUIRE(reported[0] == vector<string>{"devA", "devB"});
  REQUIRE(reported[1] == vector<string>{"devA"});
  REQUIRE(monitor.getLastDevices() == vector<string>{"devA"});
  REQUIRE(server.getConnectionCount() == 3);
  REQUIRE(server.getReceivedCommands() ==
          vector<string>(3, "list targets"));
}

TEST_CASE("An empty list matches the initial state", "[DeviceMonitor]") {
  FakeHdcServer server;
  server.addCommandConnection({"[Empty]\n"});

  ClientConfig config = monitorConfig();
  DeviceMonitor monitor(server.getSocketHandler(), config.getEndpoint(),
                        config);
  int calls = 0;
  REQUIRE_FALSE(monitor.pollOnce([&](const vector<string>&) {
    ++calls;
    return false;
  }));
  REQUIRE(calls == 0);
}

TEST_CASE("Failed polls are skipped", "[DeviceMonitor]") {
  FakeHdcServer server;

  ClientConfig config = monitorConfig();
  DeviceMonitor monitor(server.getSocketHandler(), config.getEndpoint(),
                        config);
  int calls = 0;
  auto callback = [&](const vector<string>&) {
    ++calls;
    return false;
  };
  // Nothing is listening
  REQUIRE_FALSE(monitor.pollOnce(callback));
  REQUIRE(calls == 0);

  server.addCommandConnection({"devA\n"});
  REQUIRE(monitor.pollOnce(callback));
  REQUIRE(calls == 1);
}

TEST_CASE("A throwing callback stops the monitor", "[DeviceMonitor]") {
  FakeHdcServer server;
  server.addCommandConnection({"devA\n"});

  ClientConfig config = monitorConfig();
  DeviceMonitor monitor(server.getSocketHandler(), config.getEndpoint(),
                        config);
  REQUIRE_NOTHROW(monitor.run(10, [](const vector<string>&) -> bool {
    throw std::runtime_error("listener failed");
  }));
  REQUIRE(monitor.getLastDevices() == vector<string>{"devA"});
}

TEST_CASE("Sessions delegate monitoring to fresh connections",
          "[DeviceMonitor]") {
  FakeHdcServer server;
  server.addCommandConnection({"devZ\n"});

  HdcSession session(server.getSocketHandler(), monitorConfig());
  vector<string> seen;
  session.monitorDevices(10, [&](const vector<string>& devices) {
    seen = devices;
    return false;
  });
  REQUIRE(seen == vector<string>{"devZ"});
  REQUIRE_FALSE(session.isConnected());
}
