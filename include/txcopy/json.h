#pragma once

/// @file json.h
/// nlohmann::json conversions for requests and enveloped results.
///
/// Requests use the argument-bag layout orchestrators send:
/// @code
///     {"source": "/srv/skel", "target": "/home/alice",
///      "target_owner": "alice", "rsync_opts": ["-a", "--delete"],
///      "-tx_action": "check_state", "-tx_recovery": true}
/// @endcode
///
/// Results are envelopes: `[status, message, null, {"undo_actions":
/// [["txcopy::trash", {"path": "/home/alice"}]]}]`.  The metadata object
/// is omitted when there are no undo actions.

#include "types.h"

#include <nlohmann/json.hpp>

namespace txcopy {

// -- Control flags (keys "-tx_action", "-dry_run", "-tx_recovery",
//    "-tx_rollback"), read from / written into an argument bag -------------

/// An unknown "-tx_action" string yields `action == nullopt`.
/// @throws InvalidRequestError on wrong value types.
void from_json(const nlohmann::json& j, TxFlags& flags);
void to_json(nlohmann::json& j, const TxFlags& flags);

// -- Undo actions: ["name", {args}] -----------------------------------------

void to_json(nlohmann::json& j, const UndoAction& a);
/// @throws InvalidRequestError on malformed input.
void from_json(const nlohmann::json& j, UndoAction& a);

// -- Enveloped results ------------------------------------------------------

void to_json(nlohmann::json& j, const StepResult& r);
/// @throws InvalidRequestError on malformed input.
void from_json(const nlohmann::json& j, StepResult& r);

// -- Requests ---------------------------------------------------------------

/// Missing "source"/"target" are left empty (the step answers 400).
/// "rsync_opts" may be a single string or an array of strings.
/// @throws InvalidRequestError on wrong value types.
void from_json(const nlohmann::json& j, CopyRequest& req);
void to_json(nlohmann::json& j, const CopyRequest& req);

void from_json(const nlohmann::json& j, TrashRequest& req);
void to_json(nlohmann::json& j, const TrashRequest& req);

} // namespace txcopy
