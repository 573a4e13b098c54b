#pragma once

/// @file registry.h
/// Name-based dispatch of transactional actions, as used by orchestrators
/// to invoke steps and declared undo actions.

#include "context.h"
#include "types.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace txcopy {

/// Handler for one action: takes the full argument bag (including the
/// "-tx_*" control keys) and returns the step's result.
using ActionHandler = std::function<StepResult(const nlohmann::json& args)>;

// ---------------------------------------------------------------------------
// ActionRegistry
// ---------------------------------------------------------------------------

/// Maps action names such as "txcopy::cp" to handlers.
///
/// @code
///     auto reg = txcopy::ActionRegistry::builtin(txcopy::StepContext::local());
///     auto res = reg.call("txcopy::cp", {{"source", "s"}, {"target", "t"},
///                                        {"-tx_action", "check_state"}});
/// @endcode
class ActionRegistry {
public:
    ActionRegistry() = default;

    /// Register (or replace) the handler for `name`.
    ActionRegistry& add(const std::string& name, ActionHandler handler);

    bool contains(const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

    /// Invoke `name` with `args`.  Unknown actions and argument bags the
    /// handler rejects (InvalidRequestError) come back as 400.
    StepResult call(const std::string& name, const nlohmann::json& args) const;

    /// Invoke a declared undo action with the given control flags merged
    /// into its arguments.
    StepResult call(const UndoAction& action, const TxFlags& flags) const;

    /// A registry with "txcopy::cp", "txcopy::trash" and "txcopy::untrash".
    static ActionRegistry builtin(StepContext ctx = {}, TrashOptions trash_opts = {});

private:
    std::map<std::string, ActionHandler> handlers_;
};

} // namespace txcopy
