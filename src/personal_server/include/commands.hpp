#pragma once
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

struct CommandResult {
    std::string cmd;
    bool ok = false;
    std::optional<int> code;   // empty on timeout or if the command never started
    std::string stdout_text;
    std::string stderr_text;
    double duration_sec = 0;

    Json::Value to_json(bool with_cmd = false) const;
};

struct BatchResult {
    bool ok = true;
    std::vector<CommandResult> results;
    double duration_sec = 0;

    Json::Value to_json() const;
};

// Runs `cmd` with /bin/sh -c, capturing stdout and stderr separately.
// A non-zero exit is a normal result; a process killed by a signal reports
// the negated signal number. On timeout the whole process group is killed.
CommandResult run_command(const std::string& cmd,
                          std::optional<double> timeout_sec = std::nullopt,
                          const std::string& cwd = "");

// Runs each command in turn. With stop_on_error the first failure ends the batch.
BatchResult run_commands(const std::vector<std::string>& cmds,
                         std::optional<double> timeout_sec,
                         const std::string& cwd,
                         bool stop_on_error);
