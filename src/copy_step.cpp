#include "txcopy/copy_step.h"
#include "txcopy/error.h"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace txcopy {

CopyStep::CopyStep(StepContext ctx) : ctx_(ctx.with_defaults()) {}

StepResult CopyStep::run(const CopyRequest& req) const {
    if (req.source.empty()) return {STATUS_BAD_REQUEST, "missing source", {}};
    if (req.target.empty()) return {STATUS_BAD_REQUEST, "missing target", {}};

    if (!req.tx.action) return {STATUS_BAD_REQUEST, "Invalid tx action", {}};
    switch (*req.tx.action) {
        case TxAction::CheckState: return check_state(req);
        case TxAction::FixState:   return fix_state(req);
    }
    return {STATUS_BAD_REQUEST, "Invalid tx action", {}};
}

// ---------------------------------------------------------------------------
// check_state
// ---------------------------------------------------------------------------

StepResult CopyStep::check_state(const CopyRequest& req) const {
    const auto& source = req.source;
    const auto& target = req.target;

    if (!ctx_.probe->exists(source)) {
        return {STATUS_PRECONDITION_FAILED,
                "Source " + source + " does not exist", {}};
    }

    bool target_exists = ctx_.probe->exists(target);

    // In recovery or rollback we may have to continue an interrupted
    // transfer, so an existing target is allowed there.
    if (target_exists && !req.tx.recovery && !req.tx.rollback) {
        return {STATUS_NOT_MODIFIED, "Target " + target + " already exists", {}};
    }

    if (req.tx.dry_run) {
        ctx_.logger->info("(DRY) {} {} -> {} ...",
                          target_exists ? "Syncing" : "Copying", source, target);
    }

    StepResult res;
    res.status  = STATUS_OK;
    res.message = source + " needs to be " +
                  (target_exists ? "synced" : "copied") + " to " + target;
    res.undo_actions.push_back({ACTION_TRASH, {{"path", target}}});
    return res;
}

// ---------------------------------------------------------------------------
// fix_state
// ---------------------------------------------------------------------------

StepResult CopyStep::fix_state(const CopyRequest& req) const {
    const auto& source = req.source;
    const auto& target = req.target;

    ctx_.logger->info("Rsync-ing {} -> {} ...", source, target);
    ToolResult synced;
    try {
        synced = ctx_.sync->sync(source, target, req.rsync_opts);
    } catch (const TxcopyError& e) {
        synced = ToolResult::failure(e.what());
    }
    if (!synced.ok) {
        return {STATUS_ERROR, "Can't rsync: " + synced.diagnostic, {}};
    }

    if (req.target_owner || req.target_group) {
        if (ctx_.is_superuser()) {
            ctx_.logger->info("Chown-ing {} ...", target);
            ToolResult chowned;
            try {
                chowned = ctx_.owner->chown(target, req.target_owner,
                                            req.target_group);
            } catch (const TxcopyError& e) {
                chowned = ToolResult::failure(e.what());
            }
            if (!chowned.ok) {
                return {STATUS_ERROR, "Can't chown: " + chowned.diagnostic, {}};
            }
        } else {
            ctx_.logger->debug("Not running as root, not doing chown");
        }
    }

    return {STATUS_OK, "OK", {}};
}

} // namespace txcopy
