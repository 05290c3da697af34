#include <cxxopts.hpp>

#include "DaemonCreator.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "RenderServer.hpp"
#include "SessionPaths.hpp"
#include "TabbyConfig.hpp"
#include "TmuxControl.hpp"
#include "WindowListCoordinator.hpp"

using namespace tabby;

namespace {
volatile sig_atomic_t stopRequested = 0;
volatile sig_atomic_t broadcastRequested = 0;

void stopSignalHandler(int) { stopRequested = 1; }
void broadcastSignalHandler(int) { broadcastRequested = 1; }
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tabby::HandleTerminate();

  cxxopts::Options options("tabby-daemon",
                           "Sidebar coordinator for one tmux session");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("session", "tmux session id",
         cxxopts::value<string>()->default_value(""))  //
        ("daemon", "Detach from the launching process")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tabby-daemon version " << TABBY_VERSION
                           << endl;
      exit(0);
    }

    TabbyConfig config;
    string cfgfile = result["cfgfile"].as<string>();
    try {
      config = TabbyConfig::load(
          cfgfile.empty() ? TabbyConfig::defaultPath() : cfgfile,
          !cfgfile.empty());
    } catch (const std::runtime_error &ex) {
      CLOG(INFO, "stdout") << ex.what() << endl;
      exit(1);
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }

    string session = result["session"].as<string>();
    SessionPaths paths;

    if (result.count("daemon")) {
      if (DaemonCreator::create(true) == -1) {
        STFATAL << "Error creating daemon: " << strerror(GetErrno());
      }
    }

    LogHandler::setupLogFiles(
        &defaultConf, LogHandler::defaultLogDirectory(),
        "tabby-daemon-" + SessionPaths::sanitizeSessionId(session),
        config.logToStdout, !config.logToStdout, true);
    LogHandler::apply(defaultConf, "tabby-daemon-main");
    LogHandler::setVerbosity(config.verbose);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    ::signal(SIGINT, stopSignalHandler);
    ::signal(SIGTERM, stopSignalHandler);
    ::signal(SIGHUP, stopSignalHandler);
    ::signal(SIGUSR1, broadcastSignalHandler);
    ::signal(SIGPIPE, SIG_IGN);

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    shared_ptr<TmuxControl> tmux(
        new TmuxControl(shared_ptr<SubprocessUtils>(new SubprocessUtils())));

    RenderServer server(socketHandler, paths.endpoint(session),
                        paths.pidPath(session));
    WindowListCoordinator coordinator(tmux, session);
    coordinator.attach(&server);

    try {
      server.start();
    } catch (const std::runtime_error &ex) {
      LOG(ERROR) << "Could not start: " << ex.what();
      CLOG(INFO, "stdout") << "tabby-daemon: " << ex.what() << endl;
      exit(1);
    }

    int64_t idleSince = nowMs();
    while (!stopRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      if (broadcastRequested) {
        broadcastRequested = 0;
        server.broadcastRender();
      }
      if (!server.ownsSessionFiles()) {
        LOG(INFO) << "Session files were taken over or removed, exiting";
        break;
      }
      if (server.clientCount() > 0) {
        idleSince = nowMs();
      } else if (config.idleShutdownSeconds > 0 &&
                 nowMs() - idleSince >
                     int64_t(config.idleShutdownSeconds) * 1000) {
        LOG(INFO) << "No renderers for " << config.idleShutdownSeconds
                  << "s, exiting";
        break;
      }
    }

    server.stop();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
