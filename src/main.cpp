#include "steamlink/config.hpp"
#include "steamlink/diagnostics.hpp"
#include "steamlink/library_discovery.hpp"
#include "steamlink/logger.hpp"
#include "steamlink/path_manager.hpp"
#include "steamlink/prompter.hpp"
#include "steamlink/relocator.hpp"
#include "steamlink/version.hpp"
#include <algorithm>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void showHelp() {
  std::cout
      << "steamlink - move Steam download folders to another drive\n\n"
      << "Usage: steamlink [command] [args...]\n\n"
      << "Commands:\n"
      << "  list                          List discovered steamapps "
         "directories (Default)\n"
      << "  status [steamapps]            Show the state of downloading/temp "
         "in one or all libraries\n"
      << "  link [steamapps] [dest]       Move downloading (and temp) to "
         "<dest>/<library>_symlink and link back\n"
      << "  help                          Show this help message\n\n"
      << "Flags:\n"
      << "  --dest DIR     Destination base for status\n"
      << "  --temp         Also handle steamapps/temp\n"
      << "  --no-temp      Leave steamapps/temp alone\n"
      << "  -y, --yes      Answer yes to every confirmation\n"
      << "  -v, --verbose  Enable verbose logging to stdout\n";
}

bool takeFlag(std::vector<std::string> &args,
              std::initializer_list<const char *> names) {
  auto it = std::find_if(args.begin(), args.end(), [&](const std::string &arg) {
    return std::any_of(names.begin(), names.end(),
                       [&](const char *name) { return arg == name; });
  });
  if (it == args.end())
    return false;
  args.erase(it);
  return true;
}

std::string takeOption(std::vector<std::string> &args,
                       const std::string &name) {
  auto it = std::find(args.begin(), args.end(), name);
  if (it == args.end())
    return "";
  std::string value;
  if (it + 1 != args.end()) {
    value = *(it + 1);
    args.erase(it, it + 2);
  } else {
    args.erase(it);
  }
  return value;
}

int listLibraries() {
  steamlink::LibraryDiscovery discovery;
  auto dirs = discovery.discover();
  if (dirs.empty()) {
    std::cout << "No steamapps directories found.\n";
    return 1;
  }
  for (const auto &dir : dirs) {
    std::cout << dir.string() << "\n";
  }
  return 0;
}

int showStatus(const std::vector<std::string> &args, const std::string &dest,
               bool linkTemp) {
  std::vector<std::filesystem::path> dirs;
  if (args.size() > 1) {
    dirs.push_back(steamlink::PathManager::expand(args[1]));
  } else {
    dirs = steamlink::LibraryDiscovery().discover();
  }

  if (dirs.empty()) {
    std::cout << "No steamapps directories found.\n";
    return 1;
  }

  steamlink::Diagnostics diag;
  diag.runChecks(dirs, dest.empty() ? std::filesystem::path()
                                    : steamlink::PathManager::expand(dest),
                 linkTemp);

  std::string category;
  for (const auto &[name, status] : diag.getResults()) {
    if (status.category != category) {
      category = status.category;
      std::cout << category << "\n";
    }
    std::cout << "  [" << (status.ok ? " OK " : "----") << "] "
              << status.message << ": " << status.detail << "\n";
  }
  return diag.failureCount() == 0 ? 0 : 1;
}

int runLink(const std::vector<std::string> &args, bool assumeYes,
            bool linkTemp) {
  auto &cfg = steamlink::Config::instance();
  auto &general = cfg.getGeneral();

  steamlink::RelocationRequest request;
  request.linkTemp = linkTemp;

  if (args.size() > 1) {
    request.steamapps = steamlink::PathManager::expand(args[1]).string();
  } else if (!general.lastSteamapps.empty()) {
    request.steamapps = general.lastSteamapps;
  } else {
    auto dirs = steamlink::LibraryDiscovery().discover();
    if (!dirs.empty())
      request.steamapps = dirs.front().string();
  }

  if (args.size() > 2) {
    request.destinationBase = steamlink::PathManager::expand(args[2]).string();
  } else if (!general.lastDestination.empty()) {
    request.destinationBase = general.lastDestination;
  } else {
    request.destinationBase =
        steamlink::Relocator::suggestDestinationBase().string();
  }

  LOG_INFO("Link requested: " + request.steamapps + " -> " +
           request.destinationBase);

  std::unique_ptr<steamlink::Prompter> prompter;
  if (assumeYes) {
    prompter = std::make_unique<steamlink::AutoApprovePrompter>();
  } else {
    prompter = std::make_unique<steamlink::ConsolePrompter>();
  }

  steamlink::Relocator relocator(*prompter);
  auto report = relocator.run(request, [](const std::string &line) {
    std::cout << line << "\n";
  });

  if (report.status == steamlink::RunStatus::COMPLETED) {
    general.lastSteamapps = report.plan.steamapps.string();
    general.lastDestination = request.destinationBase;
    general.linkTemp = request.linkTemp;
    cfg.save();
  }

  return report.ok() || report.status == steamlink::RunStatus::CANCELLED ? 0
                                                                         : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty()) {
      args.push_back(arg);
    }
  }

  if (!args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return 0;
  }

  if (!args.empty() && (args[0] == "--version" || args[0] == "-version")) {
    std::cout << "steamlink v" << steamlink::STEAMLINK_VERSION_STRING << "\n";
    return 0;
  }

  bool verbose = takeFlag(args, {"-v", "--verbose"});
  bool assumeYes = takeFlag(args, {"-y", "--yes"});
  bool withTemp = takeFlag(args, {"--temp"});
  bool withoutTemp = takeFlag(args, {"--no-temp"});
  std::string dest = takeOption(args, "--dest");

  steamlink::PathManager::instance().init();
  auto &pathMgr = steamlink::PathManager::instance();

  steamlink::Logger::instance().init(pathMgr.currentLog(), verbose);

  steamlink::Config::instance().load(pathMgr.configFile());

  bool linkTemp = steamlink::Config::instance().getGeneral().linkTemp;
  if (withTemp)
    linkTemp = true;
  if (withoutTemp)
    linkTemp = false;

  std::string command = args.empty() ? "list" : args[0];
  LOG_INFO("Command: " + command);

  int rc = 1;
  try {
    if (command == "list") {
      rc = listLibraries();
    } else if (command == "status") {
      rc = showStatus(args, dest, linkTemp);
    } else if (command == "link") {
      rc = runLink(args, assumeYes, linkTemp);
    } else {
      showHelp();
    }
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected error: " + std::string(e.what()));
    rc = 1;
  }

  LOG_DEBUG("Exit code " + std::to_string(rc));
  steamlink::Logger::instance().shutdown();
  return rc;
}
