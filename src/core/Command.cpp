#include "Command.h"
#include "Logging.h"
#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace port_census {

std::string CommandResult::describe() const {
    switch(status){
        case CommandStatus::Ok: return "ok";
        case CommandStatus::NonZeroExit: return "'" + command + "' exited with status " + std::to_string(exit_code);
        case CommandStatus::SpawnFailed: return "'" + command + "' could not be started";
    }
    return "unknown";
}

CommandResult ShellCommandRunner::run(const std::string& cmd){
    CommandResult r; r.command = cmd;
    std::string full = cmd + " 2>/dev/null";
    FILE* f = popen(full.c_str(), "r");
    if(!f){ r.status = CommandStatus::SpawnFailed; return r; }
    std::array<char,4096> buf{};
    while(fgets(buf.data(), buf.size(), f)){ r.output += buf.data(); if(r.output.size() > max_output_) break; }
    int st = pclose(f);
    if(st == -1){ r.status = CommandStatus::SpawnFailed; return r; }
    r.exit_code = WIFEXITED(st) ? WEXITSTATUS(st) : -1;
    // 127 is the shell's "command not found"
    if(r.exit_code == 127){ r.status = CommandStatus::SpawnFailed; return r; }
    r.status = r.exit_code == 0 ? CommandStatus::Ok : CommandStatus::NonZeroExit;
    Logger::instance().trace("exec '" + cmd + "' -> " + std::to_string(r.exit_code) + " (" + std::to_string(r.output.size()) + " bytes)");
    return r;
}

CommandResult run_first_success(CommandRunner& runner, const std::vector<std::string>& cmds){
    CommandResult last;
    for(const auto& c : cmds){
        last = runner.run(c);
        if(last.command.empty()) last.command = c;
        if(last.ok()) return last;
        Logger::instance().debug("Command failed, trying next fallback: " + last.describe());
    }
    return last;
}

}
