#pragma once

#include "mcpc/error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpc {

class CommandValidator;

// ─────────────────────────────────────────────────────────────────────────────
// ValidatedCommand
// ─────────────────────────────────────────────────────────────────────────────
// Proof that a command line passed CommandValidator. ProcessSupervisor::spawn
// only accepts this type, and only CommandValidator can construct one, so a
// stdio server cannot be started from an unchecked string.

class ValidatedCommand {
public:
    [[nodiscard]] const std::string& command() const noexcept { return command_; }
    [[nodiscard]] const std::vector<std::string>& args() const noexcept { return args_; }

    /// Shell-like rendering for log lines and error messages.
    [[nodiscard]] std::string display() const;

private:
    friend class CommandValidator;

    ValidatedCommand(std::string command, std::vector<std::string> args)
        : command_(std::move(command)), args_(std::move(args)) {}

    std::string command_;
    std::vector<std::string> args_;
};

struct CommandValidatorConfig {
    /// When set, tokens that traverse with ".." must stay inside this directory.
    std::optional<std::filesystem::path> allowed_root;
};

// ─────────────────────────────────────────────────────────────────────────────
// CommandValidator
// ─────────────────────────────────────────────────────────────────────────────
// Rejects injection attempts before anything is spawned. The whole command line
// is checked; the first offending token is reported in Error::evidence.

class CommandValidator {
public:
    explicit CommandValidator(CommandValidatorConfig config = {});

    [[nodiscard]] Result<ValidatedCommand> validate(std::string command,
                                                    std::vector<std::string> args) const;

    [[nodiscard]] const CommandValidatorConfig& config() const noexcept { return config_; }

    /// Characters that are never accepted in a command or argument.
    [[nodiscard]] static std::string_view disallowed_characters() noexcept;

private:
    [[nodiscard]] std::optional<Error> check_metacharacters(std::string_view token,
                                                            std::string_view role) const;
    [[nodiscard]] std::optional<Error> check_traversal(std::string_view token,
                                                       std::string_view role) const;
    [[nodiscard]] bool path_escapes(std::string_view text) const;

    CommandValidatorConfig config_;
};

}  // namespace mcpc
