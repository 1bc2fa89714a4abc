#include "steamlink/library_folders.hpp"
#include "steamlink/logger.hpp"
#include "steamlink/path_manager.hpp"
#include <fstream>
#include <regex>
#include <sstream>

namespace steamlink {

std::vector<std::string> LibraryFolders::extractPathValues(const std::string& text) {
    static const std::regex pathEntry("\"path\"\\s+\"([^\"]+)\"");

    std::vector<std::string> values;
    auto begin = std::sregex_iterator(text.begin(), text.end(), pathEntry);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        values.push_back((*it)[1].str());
    }
    return values;
}

std::vector<std::filesystem::path> LibraryFolders::parse(const std::string& text) {
    std::vector<std::filesystem::path> roots;
    for (const auto& value : extractPathValues(text)) {
        std::filesystem::path root = PathManager::expand(value);
        std::error_code ec;
        if (std::filesystem::exists(root, ec)) {
            roots.push_back(root);
        } else {
            LOG_DEBUG("Library root listed but not present: " + root.string());
        }
    }
    return roots;
}

std::vector<std::filesystem::path> LibraryFolders::parseFile(const std::filesystem::path& vdfPath) {
    std::ifstream file(vdfPath, std::ios::binary);
    if (!file) {
        LOG_DEBUG("Could not read " + vdfPath.string() + ", treating as empty");
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LOG_DEBUG("Read error on " + vdfPath.string() + ", treating as empty");
        return {};
    }

    auto roots = parse(buffer.str());
    LOG_DEBUG("Parsed " + std::to_string(roots.size()) + " library root(s) from " + vdfPath.string());
    return roots;
}

} // namespace steamlink
