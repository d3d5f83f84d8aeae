#include "FakeHdcServer.hpp"
#include "HdcSession.hpp"
#include "TestHeaders.hpp"

using namespace hdc;
using Catch::Matchers::Contains;

namespace {
ClientConfig fastConfig() {
  ClientConfig config;
  config.connectTimeoutMs = 2000;
  config.commandTimeoutMs = 2000;
  config.shellTimeoutMs = 1000;
  config.installTimeoutMs = 300;
  config.transferTimeoutMs = 300;
  config.hilogTimeoutMs = 300;
  config.streamTimeoutMs = 300;
  config.waitTimeoutMs = 2000;
  return config;
}

string withPrefix(uint16_t code, const string& text) {
  string payload;
  payload.push_back(char(code & 0xFF));
  payload.push_back(char((code >> 8) & 0xFF));
  return payload + text;
}

template <typename F>
bool waitUntil(F condition) {
  for (int i = 0; i < 250; ++i) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return condition();
}
}  // namespace

TEST_CASE("Operations require a completed handshake", "[HdcSession]") {
  FakeHdcServer server;
  HdcSession session(server.getSocketHandler(), fastConfig());

  REQUIRE_FALSE(session.isConnected());
  REQUIRE(getThrownKind([&] { session.checkServer(); }) ==
          HdcErrorKind::NOT_CONNECTED);
  REQUIRE(getThrownKind([&] { session.shell("ls"); }) ==
          HdcErrorKind::NOT_CONNECTED);
  REQUIRE(server.getConnectionCount() == 0);
}

TEST_CASE("Unreachable server is an I/O error", "[HdcSession]") {
  FakeHdcServer server;
  HdcSession session(server.getSocketHandler(), fastConfig());

  REQUIRE(getThrownKind([&] { session.connect(); }) == HdcErrorKind::IO);
  REQUIRE_FALSE(session.isConnected());
}

TEST_CASE("Handshake echoes the full form", "[HdcSession]") {
  FakeHdcServer server;
  FakeConnectionScript script;
  script.handshake = FakeHdcServer::makeHandshake(0xCAFE, true, "Ver: 3.1.0e");
  script.responses = {withPrefix(13, "Ver: 3.1.0e")};
  server.addConnection(script);

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();

  REQUIRE(session.isConnected());
  REQUIRE(session.getChannelId() == 0xCAFE);
  REQUIRE(session.getServerVersion() == "Ver: 3.1.0e");
  REQUIRE(session.isStableBuffer());
  REQUIRE_FALSE(session.getConnectKey().has_value());
  REQUIRE(session.checkServer() == "Ver: 3.1.0e");

  auto handshakes = server.getReceivedHandshakes();
  REQUIRE(handshakes.size() == 1);
  REQUIRE(handshakes[0].length() == 108);
  REQUIRE(handshakes[0].substr(0, 8) == "OHOS HDC");
  // No device: the union field is all zeros
  REQUIRE(handshakes[0].substr(12, 32) == string(32, '\0'));
  REQUIRE(server.getReceivedCommands() == vector<string>{"checkserver"});
}

TEST_CASE("Handshake reply matches a short server handshake",
          "[HdcSession]") {
  FakeHdcServer server;
  FakeConnectionScript script;
  script.handshake = FakeHdcServer::makeHandshake(7, false);
  script.responses = {"ok"};
  server.addConnection(script);

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connectDevice("SERIAL-1");
  REQUIRE(session.checkServer() == "ok");

  auto handshakes = server.getReceivedHandshakes();
  REQUIRE(handshakes.size() == 1);
  REQUIRE(handshakes[0].length() == 44);
  REQUIRE(handshakes[0].substr(12, 8) == "SERIAL-1");
  REQUIRE(handshakes[0].substr(20) == string(24, '\0'));
}

TEST_CASE("Rejects a server with the wrong banner", "[HdcSession]") {
  FakeHdcServer server;
  FakeConnectionScript script;
  script.handshake = FakeHdcServer::makeHandshake(1, true);
  script.handshake.replace(0, 4, "ABCD");
  server.addConnection(script);

  HdcSession session(server.getSocketHandler(), fastConfig());
  REQUIRE_THROWS_AS(session.connect(), InvalidBannerException);
  REQUIRE_FALSE(session.isConnected());
}

TEST_CASE("Rejects a truncated handshake", "[HdcSession]") {
  FakeHdcServer server;
  FakeConnectionScript script;
  script.handshake = FakeHdcServer::makeHandshake(1, false).substr(0, 40);
  server.addConnection(script);

  HdcSession session(server.getSocketHandler(), fastConfig());
  REQUIRE(getThrownKind([&] { session.connect(); }) ==
          HdcErrorKind::MALFORMED_HANDSHAKE);
}

TEST_CASE("Lists targets without blanks or the empty marker",
          "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"dev1\r\n\n  dev2 \n"});
  server.addCommandConnection({"[Empty]\n"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.listTargets() == vector<string>{"dev1", "dev2"});

  session.connect();
  REQUIRE(session.listTargets().empty());
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"list targets", "list targets"});
}

TEST_CASE("Shell reconnects to the selected device", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({withPrefix(2001, "hello\n")}, true);
  server.addHandshakeOnlyConnection();

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connectDevice("SER1");
  REQUIRE(session.shell("echo hello") == "hello\n");

  REQUIRE(server.getReceivedCommands() == vector<string>{"shell echo hello"});
  REQUIRE(server.getConnectionCount() == 2);
  REQUIRE(session.isConnected());
  REQUIRE(session.getConnectKey() == optional<string>("SER1"));
  REQUIRE(waitUntil([&] { return server.getReceivedHandshakes().size() == 2; }));
  for (const auto& handshake : server.getReceivedHandshakes()) {
    REQUIRE(handshake.substr(12, 5) == string("SER1\0", 5));
  }
}

TEST_CASE("Shell output survives a failed reconnect", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"result"}, true);

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connectDevice("SER1");
  REQUIRE(session.shell("ls") == "result");
  REQUIRE_FALSE(session.isConnected());
  REQUIRE(server.getConnectionCount() == 1);
}

TEST_CASE("Shell without a device does not reconnect", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"[Fail]ExecuteCommand need connect-key?"});
  server.addHandshakeOnlyConnection();

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE_THAT(session.shell("ls"), Contains("connect-key"));
  REQUIRE(server.getConnectionCount() == 1);
  REQUIRE(server.getPendingScripts() == 1);
}

TEST_CASE("Shell output is decoded lossily", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"a\xFF" "b"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.shell("cat bin") == "a\xEF\xBF\xBD" "b");
}

TEST_CASE("Shell times out without a response", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connectDevice("SER1");
  REQUIRE(getThrownKind([&] { session.shell("sleep 100"); }) ==
          HdcErrorKind::TIMEOUT);
  REQUIRE_FALSE(session.isConnected());
  REQUIRE(server.getConnectionCount() == 1);
}

TEST_CASE("A late reply is never read by the next command", "[HdcSession]") {
  FakeHdcServer server;
  FakeConnectionScript script;
  script.handshake = FakeHdcServer::makeHandshake(1, true);
  script.responses = {"Ver: 3.1.0e"};
  script.delayBeforeResponsesMs = 400;
  server.addConnection(script);

  ClientConfig config = fastConfig();
  config.commandTimeoutMs = 200;
  HdcSession session(server.getSocketHandler(), config);
  session.connect();

  REQUIRE(getThrownKind([&] { session.checkServer(); }) ==
          HdcErrorKind::TIMEOUT);
  REQUIRE_FALSE(session.isConnected());
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  REQUIRE(getThrownKind([&] { session.listTargets(); }) ==
          HdcErrorKind::NOT_CONNECTED);
  REQUIRE(server.getReceivedCommands() == vector<string>{"checkserver"});
}

TEST_CASE("Other commands do not strip text that is not a prefix",
          "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"hi there"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.checkServer() == "hi there");
}

TEST_CASE("Single responses must be valid UTF-8", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"bad \xC3"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(getThrownKind([&] { session.checkServer(); }) ==
          HdcErrorKind::TEXT_DECODE);
}

TEST_CASE("A zero-length frame is a protocol violation", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({""});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(getThrownKind([&] { session.checkServer(); }) ==
          HdcErrorKind::MALFORMED_FRAME);
}

TEST_CASE("A closed channel is an I/O error", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({}, true);

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(getThrownKind([&] { session.checkServer(); }) == HdcErrorKind::IO);
}

TEST_CASE("Install stops at the completion marker", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({withPrefix(3503, "Installing\n"),
                               "progress 50%\n",
                               "AppMod finish, install bundle Success\n",
                               "never read\n"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  InstallOptions options;
  options.replace = true;
  string output = session.install({"a.hap", "b.hap"}, options);

  REQUIRE(output ==
          "Installing\nprogress 50%\nAppMod finish, install bundle Success\n");
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"install -r a.hap b.hap"});
}

TEST_CASE("Install with no response times out", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(getThrownKind([&] { session.install({"a.hap"}, InstallOptions()); }) ==
          HdcErrorKind::TIMEOUT);
  REQUIRE_FALSE(session.isConnected());
}

TEST_CASE("Transfers return partial output after a quiet period",
          "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"chunk1 ", "chunk2"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  FileTransferOptions options;
  options.holdTimestamp = true;
  options.compress = true;
  REQUIRE(session.fileSend("local.txt", "/data/remote.txt", options) ==
          "chunk1 chunk2");
  // Anything still in flight belongs to the abandoned command
  REQUIRE_FALSE(session.isConnected());
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"file send -a -z local.txt /data/remote.txt"});
}

TEST_CASE("Transfers stop on a failure marker", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection(
      {withPrefix(3004, "[Fail]Error opening file"), "ignored"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.fileRecv("/data/missing", "out.txt",
                           FileTransferOptions()) ==
          "[Fail]Error opening file");
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"file recv /data/missing out.txt"});
}

TEST_CASE("Multi-frame reads stop on an empty chunk", "[HdcSession]") {
  FakeHdcServer server;
  // A bare prefix decodes to empty text
  server.addCommandConnection({"line1\n", withPrefix(2001, ""), "line2\n"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.hilog("-t app") == "line1\n");
  REQUIRE(session.isConnected());
  REQUIRE(server.getReceivedCommands() == vector<string>{"hilog -t app"});
}

TEST_CASE("Empty arguments fail before anything is sent", "[HdcSession]") {
  FakeHdcServer server;
  server.addHandshakeOnlyConnection();

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();

  REQUIRE(getThrownKind([&] {
            session.install(vector<string>(), InstallOptions());
          }) == HdcErrorKind::COMMAND_FAILED);
  REQUIRE(getThrownKind([&] {
            session.uninstall("", UninstallOptions());
          }) == HdcErrorKind::COMMAND_FAILED);
  REQUIRE(getThrownKind([&] {
            session.fileSend("", "/data/x", FileTransferOptions());
          }) == HdcErrorKind::COMMAND_FAILED);
  REQUIRE(getThrownKind([&] {
            session.fileRecv(string("/data/a\0b", 9), "x",
                             FileTransferOptions());
          }) == HdcErrorKind::COMMAND_FAILED);
  REQUIRE(getThrownKind([&] { session.connectDevice(""); }) ==
          HdcErrorKind::COMMAND_FAILED);

  REQUIRE(session.isConnected());
  REQUIRE(server.getReceivedCommands().empty());
}

TEST_CASE("Uninstall sends flags before the package", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"AppMod finish"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  UninstallOptions options;
  options.keepData = true;
  REQUIRE(session.uninstall("com.example.app", options) == "AppMod finish");
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"uninstall -k com.example.app"});
}

TEST_CASE("Forward commands use canonical node strings", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"Forwardport result:OK"});
  server.addCommandConnection({"Forwardport result:OK"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.fport(ForwardNode::tcp(8080), ForwardNode::tcp(8081)) ==
          "Forwardport result:OK");
  session.connect();
  session.rport(ForwardNode::parse("tcp:9000"), ForwardNode::parse("tcp:9001"));

  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"fport tcp:8080 tcp:8081", "rport tcp:9000 tcp:9001"});
}

TEST_CASE("Forward listing uses a fresh connection without a device",
          "[HdcSession]") {
  FakeHdcServer server;
  server.addHandshakeOnlyConnection();
  server.addCommandConnection(
      {"tcp:1 tcp:2    [Forward]\n\n  tcp:3 tcp:4    [Reverse]\n"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connectDevice("SER1");
  auto tasks = session.fportList();

  REQUIRE(tasks == vector<string>{"tcp:1 tcp:2    [Forward]",
                                  "tcp:3 tcp:4    [Reverse]"});
  REQUIRE(server.getReceivedCommands() == vector<string>{"fport ls"});
  REQUIRE(waitUntil([&] { return server.getReceivedHandshakes().size() == 2; }));
  int anonymous = 0;
  for (const auto& handshake : server.getReceivedHandshakes()) {
    if (handshake.substr(12, 32) == string(32, '\0')) {
      ++anonymous;
    }
  }
  REQUIRE(anonymous == 1);
  // The device session is untouched
  REQUIRE(session.isConnected());
  REQUIRE(session.getConnectKey() == optional<string>("SER1"));
}

TEST_CASE("Forward listing reports server failures", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"[Fail]Forward list failed"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  REQUIRE(getThrownKind([&] { session.fportList(); }) ==
          HdcErrorKind::COMMAND_FAILED);
}

TEST_CASE("Removes a forward by task string", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"Remove forward ruler success"});
  server.addCommandConnection({"[Fail]Remove forward ruler failed"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  auto task = ForwardTask::forward(ForwardNode::tcp(1), ForwardNode::tcp(2));
  REQUIRE(session.fportRemove(task.taskString()) ==
          "Remove forward ruler success");
  REQUIRE_THROWS_WITH(session.fportRemove(task.taskString()),
                      Contains("ruler failed"));
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"fport rm tcp:1 tcp:2", "fport rm tcp:1 tcp:2"});
}

TEST_CASE("Wait returns the device identifier", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"Wait for connected target is SER123\n"});
  server.addCommandConnection({"  no target \n"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.waitForDevice() == "SER123");
  session.connect();
  REQUIRE(session.waitForDevice() == "no target");
  REQUIRE(server.getReceivedCommands() == vector<string>{"wait", "wait"});
}

TEST_CASE("Target commands select the device first", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"pid 1\npid 2\n"});
  server.addCommandConnection({"Mount finish"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  REQUIRE(session.targetCommand("SER9", "jpid") == "pid 1\npid 2\n");
  REQUIRE(session.getConnectKey() == optional<string>("SER9"));
  session.connectDevice("SER9");
  REQUIRE(session.remount() == "Mount finish");
  REQUIRE(server.getReceivedCommands() ==
          vector<string>{"jpid", "target mount"});
}

TEST_CASE("Lists debuggable processes", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"1234\n5678\n"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  REQUIRE(session.listJdwp() == "1234\n5678\n");
  REQUIRE(server.getReceivedCommands() == vector<string>{"jpid"});
}

TEST_CASE("Log streaming stops when the callback declines", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"a", "b", "c"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  vector<string> chunks;
  session.hilogStream("", [&](const string& chunk) {
    chunks.push_back(chunk);
    return chunks.size() < 2;
  });

  REQUIRE(chunks == vector<string>{"a", "b"});
  REQUIRE(server.getReceivedCommands() == vector<string>{"hilog"});
}

TEST_CASE("A throwing stream callback stops the stream", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"a", "b"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  int calls = 0;
  REQUIRE_NOTHROW(session.hilogStream("-x", [&](const string&) -> bool {
    ++calls;
    throw std::runtime_error("consumer failed");
  }));
  REQUIRE(calls == 1);
}

TEST_CASE("Log streaming ends quietly when the device goes silent",
          "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"only chunk"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  vector<string> chunks;
  session.hilogStream("", [&](const string& chunk) {
    chunks.push_back(chunk);
    return true;
  });
  REQUIRE(chunks == vector<string>{"only chunk"});
}

TEST_CASE("Response streams can be consumed directly", "[HdcSession]") {
  FakeHdcServer server;
  server.addCommandConnection({"one", withPrefix(2001, "two"), "\xC3"});

  HdcSession session(server.getSocketHandler(), fastConfig());
  session.connect();
  auto stream = session.openStream("hilog -t app", 300);
  string chunk;
  REQUIRE(stream.next(&chunk));
  REQUIRE(chunk == "one");
  REQUIRE(stream.next(&chunk));
  REQUIRE(chunk == "two");
  REQUIRE(getThrownKind([&] { stream.next(&chunk); }) ==
          HdcErrorKind::TEXT_DECODE);
  REQUIRE(stream.isFinished());
  REQUIRE_FALSE(stream.next(&chunk));
  REQUIRE(stream.getChunkCount() == 2);
}
