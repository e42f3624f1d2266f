#pragma once
#include <string>
#include <string_view>
#include <sieve/core/types.h>

namespace sieve::cli {

/**
 * Actionable hints for CLI errors, chosen from the error code and message.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * @param code The ErrorCode enum value
 * @param message The error message (used for pattern matching)
 * @param command The command that was executing (for context)
 * @return An ErrorHint with actionable suggestions
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    ErrorHint hint;

    // Pattern-based hints (check message content first for specificity)
    if (message.find("Fusion weights") != std::string_view::npos) {
        hint.hint = "fusion.weight_lexical + fusion.weight_dense must equal 1.0";
        hint.command = "sieve " + std::string(command.empty() ? "run" : command) +
                       " --w-lexical 0.5 --w-dense 0.5 ...";
        return hint;
    }

    if (message.find("K_A") != std::string_view::npos ||
        message.find("K_B") != std::string_view::npos ||
        message.find("K values") != std::string_view::npos) {
        hint.hint = "Funnel widths must satisfy K_A >= K_B >= K_C >= 1";
        return hint;
    }

    if (message.find("calibration reference") != std::string_view::npos) {
        hint.hint = "Check calibration.reference in the config or the --calibration path";
        return hint;
    }

    if (message.find("chunks.jsonl") != std::string_view::npos) {
        hint.hint = "Point the corpus argument at a chunks.jsonl file or a directory containing one";
        return hint;
    }

    // Error code-based hints (fallback)
    switch (code) {
        case ErrorCode::ConfigurationError:
            hint.hint = "Check the config file (--config, SIEVE_CONFIG or "
                        "~/.config/sieve/config.toml) and command line overrides";
            break;

        case ErrorCode::FileNotFound:
            hint.hint = "Verify the file path exists and is accessible";
            break;

        case ErrorCode::PermissionDenied:
        case ErrorCode::WriteError:
            hint.hint = "Check file/directory permissions for the output directory";
            break;

        case ErrorCode::NotFound:
            hint.hint = "Stage inputs must come from the same corpus snapshot";
            break;

        case ErrorCode::ScorerFailure:
            hint.hint = "Re-run with -v to see which scorer failed";
            break;

        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = command.empty() ? "sieve --help"
                                           : "sieve " + std::string(command) + " --help";
            break;

        default:
            // No specific hint available
            break;
    }

    return hint;
}

/**
 * Format an error message with an actionable hint.
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    auto hint = getErrorHint(code, message, command);

    std::string result(message);

    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }

    return result;
}

} // namespace sieve::cli
