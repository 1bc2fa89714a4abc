#include "steamlink/prompter.hpp"
#include "steamlink/logger.hpp"
#include <algorithm>
#include <cctype>

namespace steamlink {

bool AutoApprovePrompter::confirm(const std::string& title, const std::string& message) {
    LOG_DEBUG("Auto-approved \"" + title + "\": " + message);
    return true;
}

void AutoApprovePrompter::alert(const std::string& title, const std::string& message) {
    LOG_ERROR(title + ": " + message);
}

void AutoApprovePrompter::notify(const std::string& title, const std::string& message) {
    LOG_INFO(title + ": " + message);
}

ScriptedPrompter::ScriptedPrompter(std::vector<bool> answers, bool fallback)
    : answers_(answers.begin(), answers.end()), fallback_(fallback) {}

bool ScriptedPrompter::confirm(const std::string& title, const std::string& message) {
    confirmations_.emplace_back(title, message);
    if (answers_.empty()) return fallback_;
    bool answer = answers_.front();
    answers_.pop_front();
    return answer;
}

void ScriptedPrompter::alert(const std::string& title, const std::string& message) {
    alerts_.emplace_back(title, message);
}

void ScriptedPrompter::notify(const std::string& title, const std::string& message) {
    notices_.emplace_back(title, message);
}

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

bool ConsolePrompter::confirm(const std::string& title, const std::string& message) {
    out_ << "\n== " << title << " ==\n" << message << "\n[y/N] " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        // EOF counts as "no"
        out_ << "\n";
        return false;
    }

    line.erase(std::remove_if(line.begin(), line.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               line.end());
    std::transform(line.begin(), line.end(), line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return line == "y" || line == "yes";
}

void ConsolePrompter::alert(const std::string& title, const std::string& message) {
    err_ << "\n!! " << title << " !!\n" << message << "\n";
}

void ConsolePrompter::notify(const std::string& title, const std::string& message) {
    out_ << "\n" << title << ": " << message << "\n";
}

} // namespace steamlink
