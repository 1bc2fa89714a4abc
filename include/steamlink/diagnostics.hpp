#ifndef STEAMLINK_DIAGNOSTICS_HPP
#define STEAMLINK_DIAGNOSTICS_HPP

#include "steamlink/path_state.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace steamlink {

struct HealthStatus {
    bool ok;
    PathState state;
    std::string message;
    std::string detail;

    std::string category = "General"; // the steamapps directory checked
};

// Read-only report of how each relocation target currently looks
class Diagnostics {
public:
    // destinationBase may be empty; existing links are then only checked
    // for being resolvable. Returns true if all checks are OK.
    bool runChecks(const std::vector<std::filesystem::path>& steamappsDirs,
                   const std::filesystem::path& destinationBase, bool linkTemp);

    const std::vector<std::pair<std::string, HealthStatus>>& getResults() const { return results_; }

    // Returns number of failing checks
    int failureCount() const;

private:
    std::vector<std::pair<std::string, HealthStatus>> results_;

    void checkTarget(const std::filesystem::path& steamapps, const std::string& name,
                     const std::filesystem::path& destinationBase);
};

} // namespace steamlink

#endif // STEAMLINK_DIAGNOSTICS_HPP
