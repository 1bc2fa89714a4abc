#ifndef STEAMLINK_PROMPTER_HPP
#define STEAMLINK_PROMPTER_HPP

#include <deque>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace steamlink {

// Whatever sits in front of the user. confirm() blocks until answered.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual bool confirm(const std::string& title, const std::string& message) = 0;
    virtual void alert(const std::string& title, const std::string& message) = 0;
    virtual void notify(const std::string& title, const std::string& message) = 0;
};

// Says yes to everything; alerts only go to the log
class AutoApprovePrompter : public Prompter {
public:
    bool confirm(const std::string& title, const std::string& message) override;
    void alert(const std::string& title, const std::string& message) override;
    void notify(const std::string& title, const std::string& message) override;
};

// Answers from a fixed queue and records every request. Once the queue is
// empty it answers with the fallback.
class ScriptedPrompter : public Prompter {
public:
    explicit ScriptedPrompter(std::vector<bool> answers = {}, bool fallback = false);

    bool confirm(const std::string& title, const std::string& message) override;
    void alert(const std::string& title, const std::string& message) override;
    void notify(const std::string& title, const std::string& message) override;

    const std::vector<std::pair<std::string, std::string>>& confirmations() const { return confirmations_; }
    const std::vector<std::pair<std::string, std::string>>& alerts() const { return alerts_; }
    const std::vector<std::pair<std::string, std::string>>& notices() const { return notices_; }

private:
    std::deque<bool> answers_;
    bool fallback_;
    std::vector<std::pair<std::string, std::string>> confirmations_;
    std::vector<std::pair<std::string, std::string>> alerts_;
    std::vector<std::pair<std::string, std::string>> notices_;
};

// Terminal front-end: "[y/N]" questions on in/out, alerts on err
class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in = std::cin, std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    bool confirm(const std::string& title, const std::string& message) override;
    void alert(const std::string& title, const std::string& message) override;
    void notify(const std::string& title, const std::string& message) override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace steamlink

#endif // STEAMLINK_PROMPTER_HPP
