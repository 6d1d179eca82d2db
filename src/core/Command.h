#pragma once
#include <string>
#include <vector>
#include <memory>

namespace port_census {

enum class CommandStatus { Ok, NonZeroExit, SpawnFailed };

struct CommandResult {
    CommandStatus status = CommandStatus::SpawnFailed;
    int exit_code = -1;
    std::string output; // stdout
    std::string command;
    bool ok() const { return status == CommandStatus::Ok; }
    std::string describe() const;

    static CommandResult success(std::string out, std::string cmd = ""){ CommandResult r; r.status = CommandStatus::Ok; r.exit_code = 0; r.output = std::move(out); r.command = std::move(cmd); return r; }
    static CommandResult failure(int code, std::string cmd = ""){ CommandResult r; r.status = CommandStatus::NonZeroExit; r.exit_code = code; r.command = std::move(cmd); return r; }
};

// Shell boundary. Implementations must be callable from several threads at once.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::string& cmd) = 0;
};

using CommandRunnerPtr = std::shared_ptr<CommandRunner>;

// popen based runner; stderr is discarded and output is capped.
class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(size_t max_output = 8*1024*1024) : max_output_(max_output) {}
    CommandResult run(const std::string& cmd) override;
private:
    size_t max_output_;
};

// Runs each command in order and returns the first success, with `command` naming the
// one that ran. When every command fails the result of the last attempt is returned.
CommandResult run_first_success(CommandRunner& runner, const std::vector<std::string>& cmds);

}
