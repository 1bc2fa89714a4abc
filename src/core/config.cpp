#include "steamlink/config.hpp"
#include "steamlink/logger.hpp"
#include <fstream>

namespace steamlink {

using json = nlohmann::json;

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::reset() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_.clear();
  general_ = GeneralConfig{};
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;

    if (j.contains("general")) {
      auto &g = j["general"];
      general_.lastSteamapps = g.value("last_steamapps", "");
      general_.lastDestination = g.value("last_destination", "");
      general_.linkTemp = g.value("link_temp", true);

      general_.extraLibraryRoots.clear();
      if (g.contains("extra_library_roots") &&
          g["extra_library_roots"].is_array()) {
        for (const auto &root : g["extra_library_roots"]) {
          if (root.is_string())
            general_.extraLibraryRoots.push_back(root.get<std::string>());
        }
      }
    }

    LOG_INFO("Configuration loaded from " + path.string());

  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
  }
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
  }

  json j;
  j["general"] = {{"last_steamapps", general_.lastSteamapps},
                  {"last_destination", general_.lastDestination},
                  {"link_temp", general_.linkTemp}};

  j["general"]["extra_library_roots"] = json::array();
  for (const auto &root : general_.extraLibraryRoots) {
    j["general"]["extra_library_roots"].push_back(root);
  }

  std::ofstream file(configPath_);
  if (!file) {
    LOG_ERROR("Failed to write config file: " + configPath_.string());
    return;
  }
  file << j.dump(4);
  LOG_INFO("Configuration saved to " + configPath_.string());
}

} // namespace steamlink
