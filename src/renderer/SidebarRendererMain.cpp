#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "RendererClient.hpp"
#include "SessionPaths.hpp"
#include "TabbyConfig.hpp"
#include "TerminalConsole.hpp"
#include "TmuxControl.hpp"

using namespace tabby;

namespace {
RendererClient *globalClient = NULL;

void stopSignalHandler(int) {
  if (globalClient) {
    globalClient->shutdown();
  }
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tabby::HandleTerminate();

  cxxopts::Options options("sidebar-renderer",
                           "Draws one tabby surface inside a tmux pane");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("session", "tmux session id",
         cxxopts::value<string>()->default_value(""))  //
        ("window", "Window id this sidebar belongs to",
         cxxopts::value<string>()->default_value(""))  //
        ("pane", "Pane id, for a pane header surface",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("terminal-bg", "Background color of the loading screen",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sidebar-renderer version " << TABBY_VERSION
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
    if (result.count("terminal-bg")) {
      config.renderer.terminalBg = result["terminal-bg"].as<string>();
    }

    setlocale(LC_CTYPE, "");

    shared_ptr<TmuxControl> tmux(
        new TmuxControl(shared_ptr<SubprocessUtils>(new SubprocessUtils())));

    const char *tmuxPane = ::getenv("TMUX_PANE");
    string paneId = tmuxPane ? tmuxPane : "";
    if (paneId.empty()) {
      paneId = tmux->currentPaneId();
    }

    string clientId = result["window"].as<string>();
    if (clientId.empty() && !result["pane"].as<string>().empty()) {
      clientId = "header:" + result["pane"].as<string>();
    }
    if (clientId.empty()) {
      clientId = tmux->currentWindowId();
    }
    if (clientId.empty()) {
      clientId = "renderer-" + to_string(getpid());
    }

    string session = result["session"].as<string>();
    string safeClientId = clientId;
    for (auto &c : safeClientId) {
      if (!isalnum((unsigned char)c) && c != '-' && c != '_') {
        c = '_';
      }
    }
    // Never log to the terminal this process draws on
    LogHandler::setupLogFiles(&defaultConf, LogHandler::defaultLogDirectory(),
                              "sidebar-renderer-" + safeClientId, false, true,
                              true);
    LogHandler::apply(defaultConf, "sidebar-renderer-main");
    LogHandler::setVerbosity(config.verbose);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    ::signal(SIGPIPE, SIG_IGN);

    SessionPaths paths;
    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    shared_ptr<RendererConnection> connection(new RendererConnection(
        socketHandler, paths.endpoint(session),
        config.renderer.connectAttempts, config.renderer.connectBackoffMs));
    shared_ptr<Console> console(new TerminalConsole());

    LOG(INFO) << "Renderer " << clientId << " for pane " << paneId
              << " starting";
    RendererClient client(config, clientId, paneId, console, connection, tmux,
                          TerminalConsole::detectColorProfile());
    globalClient = &client;
    ::signal(SIGINT, stopSignalHandler);
    ::signal(SIGTERM, stopSignalHandler);
    ::signal(SIGHUP, stopSignalHandler);
    client.run();
    globalClient = NULL;
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
