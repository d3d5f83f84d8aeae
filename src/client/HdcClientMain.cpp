#include <cxxopts.hpp>

#include "ClientConfig.hpp"
#include "ForwardNode.hpp"
#include "HdcSession.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "TcpSocketHandler.hpp"
#include "TransferOptions.hpp"

using namespace hdc;

namespace {
const char* USAGE =
    "[OPTION...] <command> [args...]\n\n"
    "  Commands:\n"
    "    list                       List connected devices\n"
    "    checkserver                Print the server version\n"
    "    wait                       Block until a device connects\n"
    "    shell <cmd...>             Run a shell command on the device\n"
    "    fport <local> <remote>     Forward a local node to the device\n"
    "    rport <remote> <local>     Forward a device node to the host\n"
    "    fport-ls                   List forward tasks\n"
    "    fport-rm <local> <remote>  Remove a forward task\n"
    "    install <paths...>         Install application packages\n"
    "    uninstall <package>        Uninstall an application\n"
    "    send <local> <remote>      Send a file to the device\n"
    "    recv <remote> <local>      Receive a file from the device\n"
    "    hilog [args...]            Dump device logs\n"
    "    hilog-stream [args...]     Follow device logs\n"
    "    monitor                    Report device list changes\n"
    "    jpid                       List debuggable processes\n\n"
    "  Use -- before arguments that start with a dash, e.g.\n"
    "  hdc-client -t SERIAL -- shell ls -l";

void requireArgs(const string& command, const vector<string>& args,
                 size_t count) {
  if (args.size() != count) {
    throw HdcException(HdcErrorKind::COMMAND_FAILED,
                       "'" + command + "' expects " + to_string(count) +
                           " argument(s), got " + to_string(args.size()));
  }
}

// Commands that run on their own connections
bool needsSessionConnection(const string& command) {
  return command != "fport-ls" && command != "fport-rm" &&
         command != "monitor";
}

void printLines(const vector<string>& lines) {
  for (const auto& line : lines) {
    CLOG(INFO, "stdout") << line << endl;
  }
}

int runCommand(HdcSession* session, const ClientConfig& config,
               const cxxopts::ParseResult& result, const string& command,
               const vector<string>& args) {
  if (command == "list") {
    auto devices = session->listTargets();
    if (devices.empty()) {
      CLOG(INFO, "stdout") << "[Empty]" << endl;
    }
    printLines(devices);
  } else if (command == "checkserver") {
    CLOG(INFO, "stdout") << session->checkServer() << endl;
  } else if (command == "wait") {
    CLOG(INFO, "stdout") << session->waitForDevice() << endl;
  } else if (command == "shell") {
    if (args.empty()) {
      throw HdcException(HdcErrorKind::COMMAND_FAILED,
                         "'shell' expects a command");
    }
    CLOG(INFO, "stdout") << session->shell(joinStrings(args, " ")) << endl;
  } else if (command == "fport") {
    requireArgs(command, args, 2);
    CLOG(INFO, "stdout") << session->fport(ForwardNode::parse(args[0]),
                                           ForwardNode::parse(args[1]))
                         << endl;
  } else if (command == "rport") {
    requireArgs(command, args, 2);
    CLOG(INFO, "stdout") << session->rport(ForwardNode::parse(args[0]),
                                           ForwardNode::parse(args[1]))
                         << endl;
  } else if (command == "fport-ls") {
    printLines(session->fportList());
  } else if (command == "fport-rm") {
    requireArgs(command, args, 2);
    auto task = ForwardTask::forward(ForwardNode::parse(args[0]),
                                     ForwardNode::parse(args[1]));
    CLOG(INFO, "stdout") << session->fportRemove(task.taskString()) << endl;
  } else if (command == "install") {
    InstallOptions options;
    options.replace = result.count("replace") > 0;
    options.shared = result.count("shared") > 0;
    CLOG(INFO, "stdout") << session->install(args, options) << endl;
  } else if (command == "uninstall") {
    requireArgs(command, args, 1);
    UninstallOptions options;
    options.keepData = result.count("keep") > 0;
    options.shared = result.count("shared") > 0;
    CLOG(INFO, "stdout") << session->uninstall(args[0], options) << endl;
  } else if (command == "send" || command == "recv") {
    requireArgs(command, args, 2);
    FileTransferOptions options;
    options.holdTimestamp = result.count("hold-timestamp") > 0;
    options.syncMode = result.count("sync") > 0;
    options.compress = result.count("compress") > 0;
    options.modeSync = result.count("mode-sync") > 0;
    options.debugDir = result.count("debug-dir") > 0;
    if (command == "send") {
      CLOG(INFO, "stdout") << session->fileSend(args[0], args[1], options)
                           << endl;
    } else {
      CLOG(INFO, "stdout") << session->fileRecv(args[0], args[1], options)
                           << endl;
    }
  } else if (command == "hilog") {
    CLOG(INFO, "stdout") << session->hilog(joinStrings(args, " ")) << endl;
  } else if (command == "hilog-stream") {
    session->hilogStream(joinStrings(args, " "), [](const string& chunk) {
      CLOG(INFO, "stdout") << chunk;
      return true;
    });
  } else if (command == "monitor") {
    session->monitorDevices(
        config.monitorIntervalMs, [](const vector<string>& devices) {
          CLOG(INFO, "stdout") << "Devices (" << devices.size()
                               << "): " << joinStrings(devices, ", ") << endl;
          return true;
        });
  } else if (command == "jpid") {
    CLOG(INFO, "stdout") << session->listJdwp() << endl;
  } else {
    CLOG(INFO, "stdout") << "Unknown command: " << command << endl;
    return 1;
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  hdc::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, hdc::InterruptSignalHandler);

  cxxopts::Options options("hdc-client",
                           "Command-line client for the HDC server");
  try {
    options.positional_help("");
    options.custom_help(USAGE);

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "HDC server host",
         cxxopts::value<std::string>())  //
        ("port", "HDC server port",
         cxxopts::value<int>())  //
        ("t,target", "Connect key of the device to address",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())      //
        ("logtostdout", "Write log to stdout")  //
        ("interval", "Device monitor polling interval in milliseconds",
         cxxopts::value<int64_t>())                               //
        ("r,replace", "install: replace an existing application")  //
        ("shared", "install/uninstall: shared bundle")             //
        ("k,keep", "uninstall: keep data and cache")               //
        ("a,hold-timestamp", "send/recv: keep file timestamps")    //
        ("sync", "send/recv: only transfer newer files")           //
        ("z,compress", "send/recv: compress during transfer")      //
        ("m,mode-sync", "send/recv: sync file mode")               //
        ("b,debug-dir", "send/recv: use the debug app directory")  //
        ("command", "Command to run", cxxopts::value<std::string>())  //
        ("args", "Command arguments",
         cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"command", "args"});
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "hdc-client version " << HDC_CLIENT_VERSION
                           << endl;
      exit(0);
    }
    if (!result.count("command")) {
      CLOG(INFO, "stdout") << "Missing command" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    ClientConfig config;
    if (result.count("cfgfile")) {
      config.loadFromIni(result["cfgfile"].as<string>());
    }
    // Command line options take priority over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }
    if (result.count("interval")) {
      config.monitorIntervalMs = result["interval"].as<int64_t>();
    }
    config.validate();

    el::Loggers::setVerboseLevel(config.verbose);
    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "hdc-client",
                              config.logToStdout, config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("client-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    string command = result["command"].as<string>();
    vector<string> args;
    if (result.count("args")) {
      args = result["args"].as<vector<string>>();
    }

    shared_ptr<SocketHandler> clientSocket(new TcpSocketHandler());
    HdcSession session(clientSocket, config);
    if (needsSessionConnection(command)) {
      if (result.count("target")) {
        session.connectDevice(result["target"].as<string>());
      } else {
        session.connect();
      }
    }
    int rc = runCommand(&session, config, result, command, args);
    session.close();
    return rc;
  } catch (const HdcException& e) {
    CLOG(INFO, "stdout") << "Error (" << errorKindToString(e.getKind())
                         << "): " << e.what() << endl;
    exit(1);
  } catch (const cxxopts::exceptions::exception& e) {
    CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
