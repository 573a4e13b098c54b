#pragma once

/// @file copy_step.h
/// Copy a file or directory with rsync, with undo support.

#include "context.h"
#include "types.h"

namespace txcopy {

// ---------------------------------------------------------------------------
// CopyStep
// ---------------------------------------------------------------------------

/// Transactional copy of `source` to `target`.
///
/// States, judged on existence only (content and sizes are not checked):
///   - fixed:     `source` and `target` exist
///   - fixable:   `source` exists, `target` does not
///   - unfixable: `source` does not exist
///
/// check_state declares one undo action, `txcopy::trash {path: target}`,
/// so a rollback moves the copy into the trash instead of deleting it.
///
/// During recovery or rollback an existing `target` is accepted and
/// re-synced, since a previous fix may have been interrupted mid-transfer.
///
/// @code
///     txcopy::CopyStep step(txcopy::StepContext::local());
///     txcopy::CopyRequest req;
///     req.source = "/srv/skel";
///     req.target = "/home/alice";
///     req.target_owner = "alice";
///     req.tx.action = txcopy::TxAction::CheckState;
///     auto res = step.run(req);          // 200, undo = trash /home/alice
///     req.tx.action = txcopy::TxAction::FixState;
///     res = step.run(req);               // 200 "OK"
/// @endcode
class CopyStep {
public:
    explicit CopyStep(StepContext ctx);

    /// Validate the request and dispatch on `req.tx.action`.
    /// Returns 400 for a missing source/target or an unknown phase.
    StepResult run(const CopyRequest& req) const;

    /// The check phase.  Assumes source/target are non-empty.
    StepResult check_state(const CopyRequest& req) const;

    /// The fix phase.  Does not re-check existence.
    StepResult fix_state(const CopyRequest& req) const;

    const StepContext& context() const { return ctx_; }

private:
    StepContext ctx_;
};

} // namespace txcopy
