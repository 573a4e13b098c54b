#pragma once

#include "registry.h"
#include "types.h"

#include <spdlog/logger.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace txcopy {

// ---------------------------------------------------------------------------
// Transaction: in-memory driver of the check/fix protocol
// ---------------------------------------------------------------------------

/// Options for Transaction.
struct TransactionOptions {
    bool dry_run = false; ///< Run only check_state (with "-dry_run").
};

/// Stages action calls and applies them with commit(); rollback()
/// replays the declared undo actions in reverse.
///
/// Nothing is persisted: a process that dies mid-commit leaves recovery
/// to whoever replays the steps with the recovery flag.
///
/// @code
///     txcopy::Transaction tx(registry);
///     tx.add("txcopy::cp", {{"source", "/srv/skel"}, {"target", "/home/alice"}});
///     auto res = tx.commit();        // rolled back automatically on failure
///     ...
///     tx.rollback();                 // trashes /home/alice
/// @endcode
class Transaction {
public:
    explicit Transaction(const ActionRegistry& registry,
                         TransactionOptions opts = {},
                         std::shared_ptr<spdlog::logger> logger = nullptr);

    /// The registry is held by reference and must outlive the transaction.
    Transaction(ActionRegistry&&,
                TransactionOptions = {},
                std::shared_ptr<spdlog::logger> = nullptr) = delete;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = default;
    Transaction& operator=(Transaction&&) = delete;

    /// Stage `action` with `args` (control keys are added when run).
    /// @throws TransactionClosedError after commit() or rollback().
    Transaction& add(const std::string& action, nlohmann::json args);

    /// Run every staged call: check_state, then fix_state when the check
    /// answers 200.  304 steps are skipped.  The first failure rolls back
    /// the steps already applied and is returned; otherwise 200 "OK"
    /// (or 304 when nothing needed doing).
    /// @throws TransactionClosedError if called twice.
    StepResult commit();

    /// Undo a committed transaction: each collected undo action, newest
    /// first, is checked and fixed with the rollback flag.
    /// @throws TransactionClosedError if not committed or already rolled back.
    StepResult rollback();

    // -- State ---------------------------------------------------------------

    bool committed()   const { return committed_; }
    bool rolled_back() const { return rolled_back_; }
    size_t pending()   const { return calls_.size(); }

    /// Undo actions collected so far, in the order they will be run.
    const std::vector<UndoAction>& undo_log() const { return undo_; }

private:
    StepResult run_undo();

    const ActionRegistry&                                     registry_;
    TransactionOptions                                        opts_;
    std::shared_ptr<spdlog::logger>                           logger_;
    std::vector<std::pair<std::string, nlohmann::json>>       calls_;
    std::vector<UndoAction>                                   undo_;
    bool                                                      committed_   = false;
    bool                                                      rolled_back_ = false;
};

} // namespace txcopy
