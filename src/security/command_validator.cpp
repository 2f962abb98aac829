#include "mcpc/security/command_validator.hpp"

#include "mcpc/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpc {

namespace {

// ; & | ` $ LF CR NUL
constexpr char kDisallowed[] = {';', '&', '|', '`', '$', '\n', '\r', '\0'};
constexpr std::string_view kDisallowedView{kDisallowed, sizeof(kDisallowed)};

[[nodiscard]] std::string printable(char c) {
    switch (c) {
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\0': return "\\0";
        default:   return std::string(1, c);
    }
}

[[nodiscard]] bool has_parent_segment(const std::filesystem::path& path) {
    return std::any_of(path.begin(), path.end(),
                       [](const std::filesystem::path& part) { return part == ".."; });
}

// True when `candidate` is `root` or lies beneath it. Both must be normalized.
[[nodiscard]] bool is_within(const std::filesystem::path& root,
                             const std::filesystem::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++cand_it) {
        if (root_it->empty()) {
            // Trailing separator on the root yields an empty final element.
            continue;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string ValidatedCommand::display() const {
    std::string out = command_;
    for (const auto& arg : args_) {
        out += ' ';
        const bool needs_quotes = arg.empty() || arg.find(' ') != std::string::npos;
        if (needs_quotes) {
            out += '"';
            out += arg;
            out += '"';
        } else {
            out += arg;
        }
    }
    return out;
}

CommandValidator::CommandValidator(CommandValidatorConfig config)
    : config_(std::move(config)) {
    if (config_.allowed_root.has_value()) {
        config_.allowed_root = config_.allowed_root->lexically_normal();
    }
}

std::string_view CommandValidator::disallowed_characters() noexcept {
    return kDisallowedView;
}

Result<ValidatedCommand> CommandValidator::validate(std::string command,
                                                    std::vector<std::string> args) const {
    const bool blank = std::all_of(command.begin(), command.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return tl::unexpected(Error::validation("Command is empty", command));
    }

    // Every token is checked before anything is accepted.
    if (auto err = check_metacharacters(command, "command")) {
        return tl::unexpected(std::move(*err));
    }
    if (auto err = check_traversal(command, "command")) {
        return tl::unexpected(std::move(*err));
    }
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto role = std::format("argument {}", i + 1);
        if (auto err = check_metacharacters(args[i], role)) {
            return tl::unexpected(std::move(*err));
        }
        if (auto err = check_traversal(args[i], role)) {
            return tl::unexpected(std::move(*err));
        }
    }

    return ValidatedCommand(std::move(command), std::move(args));
}

std::optional<Error> CommandValidator::check_metacharacters(std::string_view token,
                                                            std::string_view role) const {
    const auto pos = token.find_first_of(kDisallowedView);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    get_logger().warn_fmt("Rejected {} containing '{}'", role, printable(token[pos]));
    return Error::validation(
        std::format("The {} contains the disallowed character '{}'", role, printable(token[pos])),
        std::string(token));
}

std::optional<Error> CommandValidator::check_traversal(std::string_view token,
                                                       std::string_view role) const {
    if (token.find("..") == std::string_view::npos) {
        return std::nullopt;
    }

    // A flag may carry a path: "--dir=../x" and "-d../x" are checked both
    // whole and as the embedded path, since the server resolves the latter.
    bool escapes = path_escapes(token);
    if (escapes == false) {
        const auto eq = token.find('=');
        if (eq != std::string_view::npos) {
            escapes = path_escapes(token.substr(eq + 1));
        }
    }
    if (escapes == false) {
        const auto head_end = token.find_first_of("/\\");
        const auto head = token.substr(0, head_end);
        if (head.size() > 2 && head.ends_with("..")) {
            escapes = path_escapes(token.substr(head.size() - 2));
        }
    }

    if (escapes == false) {
        return std::nullopt;
    }

    get_logger().warn_fmt("Rejected {} with directory traversal: {}", role, token);
    return Error::validation(
        std::format("The {} traverses outside the allowed directory", role),
        std::string(token));
}

bool CommandValidator::path_escapes(std::string_view text) const {
    const std::filesystem::path raw{std::string(text)};
    if (has_parent_segment(raw) == false) {
        // "a..b" or "--range=1..5": no parent-directory component.
        return false;
    }

    if (config_.allowed_root.has_value()) {
        const auto& root = *config_.allowed_root;
        const auto resolved = raw.is_absolute()
            ? raw.lexically_normal()
            : (root / raw).lexically_normal();
        return is_within(root, resolved) == false;
    }
    const auto normalized = raw.lexically_normal();
    return normalized.empty() == false && *normalized.begin() == "..";
}

}  // namespace mcpc
