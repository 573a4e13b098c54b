#include "txcopy/transaction.h"
#include "txcopy/error.h"
#include "txcopy/json.h"
#include "txcopy/log.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace txcopy {

namespace {

/// The failure that triggered a rollback, noting if the rollback failed too.
StepResult with_rollback(StepResult failure, const StepResult& undone) {
    if (!undone.ok()) failure.message += " (" + undone.message + ")";
    return failure;
}

} // anonymous namespace

Transaction::Transaction(const ActionRegistry& registry,
                         TransactionOptions opts,
                         std::shared_ptr<spdlog::logger> logger)
    : registry_(registry)
    , opts_(opts)
    , logger_(logger ? std::move(logger) : default_logger())
{}

Transaction& Transaction::add(const std::string& action, nlohmann::json args) {
    if (committed_ || rolled_back_) throw TransactionClosedError();
    calls_.emplace_back(action, std::move(args));
    return *this;
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------

StepResult Transaction::commit() {
    if (committed_) throw TransactionClosedError();
    committed_ = true;

    bool changed = false;
    for (auto& [name, args] : calls_) {
        TxFlags check;
        check.action  = TxAction::CheckState;
        check.dry_run = opts_.dry_run;
        auto check_args = args;
        to_json(check_args, check);

        auto res = registry_.call(name, check_args);
        if (res.not_modified()) {
            logger_->debug("{}: {}", name, res.message);
            continue;
        }
        if (res.status != STATUS_OK) {
            logger_->warn("{}: check failed ({} {}), rolling back",
                          name, res.status, res.message);
            rolled_back_ = true;
            return with_rollback(std::move(res), run_undo());
        }
        changed = true;
        if (opts_.dry_run) continue;

        // Recorded before fixing so an interrupted fix can still be undone.
        undo_.insert(undo_.begin(), res.undo_actions.begin(), res.undo_actions.end());

        TxFlags fix;
        fix.action = TxAction::FixState;
        auto fix_args = args;
        to_json(fix_args, fix);

        auto fixed = registry_.call(name, fix_args);
        if (!fixed.ok()) {
            logger_->warn("{}: fix failed ({} {}), rolling back",
                          name, fixed.status, fixed.message);
            rolled_back_ = true;
            return with_rollback(std::move(fixed), run_undo());
        }
    }

    if (!changed) return {STATUS_NOT_MODIFIED, "Nothing to do", {}};
    return {STATUS_OK, "OK", {}};
}

// ---------------------------------------------------------------------------
// Rollback
// ---------------------------------------------------------------------------

StepResult Transaction::rollback() {
    if (!committed_ || rolled_back_) throw TransactionClosedError();
    rolled_back_ = true;
    return run_undo();
}

StepResult Transaction::run_undo() {
    for (auto& ua : undo_) {
        TxFlags check;
        check.action   = TxAction::CheckState;
        check.rollback = true;
        auto res = registry_.call(ua, check);
        if (res.not_modified()) continue;
        if (res.status != STATUS_OK) {
            logger_->error("rollback: {} failed: {} {}", ua.action,
                           res.status, res.message);
            return {res.status, "Rollback failed: " + res.message, {}};
        }

        TxFlags fix;
        fix.action   = TxAction::FixState;
        fix.rollback = true;
        auto fixed = registry_.call(ua, fix);
        if (!fixed.ok()) {
            logger_->error("rollback: {} failed: {} {}", ua.action,
                           fixed.status, fixed.message);
            return {fixed.status, "Rollback failed: " + fixed.message, {}};
        }
    }
    return {STATUS_OK, "Rolled back", {}};
}

} // namespace txcopy
