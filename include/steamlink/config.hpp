#ifndef STEAMLINK_CONFIG_HPP
#define STEAMLINK_CONFIG_HPP

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace steamlink {

struct GeneralConfig {
  // Last values used by a successful "link" run; reused as CLI defaults
  std::string lastSteamapps = "";
  std::string lastDestination = "";
  bool linkTemp = true;

  // Library roots that are not listed in any libraryfolders.vdf
  std::vector<std::string> extraLibraryRoots;
};

class Config {
public:
  static Config &instance();

  void load(const std::filesystem::path &configPath);
  void save();

  // Resets to defaults and forgets the backing file
  void reset();

  GeneralConfig &getGeneral() { return general_; }
  std::recursive_mutex &getMutex() { return mutex_; }

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  GeneralConfig general_;

  std::recursive_mutex mutex_;
};

} // namespace steamlink

#endif // STEAMLINK_CONFIG_HPP
