#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace txcopy {

// ---------------------------------------------------------------------------
// Status codes (HTTP-like)
// ---------------------------------------------------------------------------

constexpr int STATUS_OK                  = 200; ///< Step applicable / applied.
constexpr int STATUS_NOT_MODIFIED        = 304; ///< Desired state already reached.
constexpr int STATUS_BAD_REQUEST         = 400; ///< Caller bug, not retried.
constexpr int STATUS_PRECONDITION_FAILED = 412; ///< Unfixable state.
constexpr int STATUS_ERROR               = 500; ///< External tool failed.

// ---------------------------------------------------------------------------
// Action names
// ---------------------------------------------------------------------------

constexpr const char* ACTION_CP      = "txcopy::cp";
constexpr const char* ACTION_TRASH   = "txcopy::trash";
constexpr const char* ACTION_UNTRASH = "txcopy::untrash";

// ---------------------------------------------------------------------------
// TxAction / TxFlags
// ---------------------------------------------------------------------------

/// The phase an orchestrator asks a step to run.
enum class TxAction : uint8_t {
    CheckState, ///< Decide applicability and declare undo actions.
    FixState,   ///< Perform the mutation.
};

/// Parse "check_state" / "fix_state". Returns nullopt for anything else.
inline std::optional<TxAction> tx_action_from_string(const std::string& s) {
    if (s == "check_state") return TxAction::CheckState;
    if (s == "fix_state")   return TxAction::FixState;
    return std::nullopt;
}

inline const char* tx_action_to_string(TxAction a) {
    switch (a) {
        case TxAction::CheckState: return "check_state";
        case TxAction::FixState:   return "fix_state";
    }
    return "check_state"; // unreachable
}

/// Control flags supplied by the orchestrator with every call.
struct TxFlags {
    std::optional<TxAction> action;   ///< nullopt = missing or unknown phase.
    bool                    dry_run  = false;
    bool                    recovery = false; ///< Replay after an interruption.
    bool                    rollback = false; ///< Running as part of a rollback.
};

// ---------------------------------------------------------------------------
// UndoAction / StepResult
// ---------------------------------------------------------------------------

/// A declared reversal: an action name plus its string arguments.
struct UndoAction {
    std::string                        action;
    std::map<std::string, std::string> args;

    bool operator==(const UndoAction& o) const {
        return action == o.action && args == o.args;
    }
    bool operator!=(const UndoAction& o) const { return !(*this == o); }
};

/// Outcome of one check_state or fix_state call.
struct StepResult {
    int                     status = STATUS_OK;
    std::string             message;
    std::vector<UndoAction> undo_actions; ///< Only set by a successful check.

    /// 200 or 304: orchestrators treat both as success.
    bool ok() const {
        return status == STATUS_OK || status == STATUS_NOT_MODIFIED;
    }
    bool not_modified() const { return status == STATUS_NOT_MODIFIED; }
};

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

/// Arguments of the copy step.
struct CopyRequest {
    std::string                source;
    /// Full destination path. cp("/dir", "/a") copies /dir to /a;
    /// cp("/dir", "/a/dir") copies it to /a/dir.
    std::string                target;
    std::optional<std::string> target_owner;
    std::optional<std::string> target_group;
    std::vector<std::string>   rsync_opts = {"-a"};
    TxFlags                    tx;
};

/// Arguments of the trash and untrash steps.
struct TrashRequest {
    std::string                path;
    std::optional<std::string> suffix; ///< Disambiguates the trash entry name.
    TxFlags                    tx;
};

// ---------------------------------------------------------------------------
// ToolResult
// ---------------------------------------------------------------------------

/// Result of an external tool invocation.
struct ToolResult {
    bool        ok = true;
    std::string diagnostic; ///< Explanation plus the tool's own output.

    static ToolResult success() { return ToolResult{true, {}}; }
    static ToolResult failure(std::string why) {
        return ToolResult{false, std::move(why)};
    }
};

// ---------------------------------------------------------------------------
// TrashEntry
// ---------------------------------------------------------------------------

/// One item in the trash directory.
struct TrashEntry {
    std::string name;          ///< File name under <trash>/files.
    std::string original_path; ///< Absolute path it was trashed from.
    std::string deletion_date; ///< "YYYY-MM-DDThh:mm:ss", local time.
};

// ---------------------------------------------------------------------------
// ToolOptions
// ---------------------------------------------------------------------------

/// Programs used by RsyncTool and ChownTool. Looked up on PATH
/// unless they contain a slash.
struct ToolOptions {
    std::string rsync_program = "rsync";
    std::string chown_program = "chown";
};

// ---------------------------------------------------------------------------
// TrashOptions
// ---------------------------------------------------------------------------

/// Options for Trash.
struct TrashOptions {
    /// Trash root. Default: $XDG_DATA_HOME/Trash, else ~/.local/share/Trash.
    std::optional<std::filesystem::path> trash_dir;
};

} // namespace txcopy
