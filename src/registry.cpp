#include "txcopy/registry.h"
#include "txcopy/copy_step.h"
#include "txcopy/error.h"
#include "txcopy/json.h"
#include "txcopy/trash.h"

#include <utility>

namespace txcopy {

ActionRegistry& ActionRegistry::add(const std::string& name,
                                    ActionHandler handler) {
    handlers_[name] = std::move(handler);
    return *this;
}

bool ActionRegistry::contains(const std::string& name) const {
    return handlers_.count(name) != 0;
}

std::vector<std::string> ActionRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (auto& [name, handler] : handlers_) out.push_back(name);
    return out;
}

StepResult ActionRegistry::call(const std::string& name,
                                const nlohmann::json& args) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return {STATUS_BAD_REQUEST, "Unknown action " + name, {}};
    }
    try {
        return it->second(args);
    } catch (const InvalidRequestError& e) {
        return {STATUS_BAD_REQUEST, e.what(), {}};
    }
}

StepResult ActionRegistry::call(const UndoAction& action,
                                const TxFlags& flags) const {
    nlohmann::json args = nlohmann::json::object();
    for (auto& [k, v] : action.args) args[k] = v;
    to_json(args, flags);
    return call(action.action, args);
}

ActionRegistry ActionRegistry::builtin(StepContext ctx, TrashOptions trash_opts) {
    auto full = ctx.with_defaults();
    CopyStep cp(full);
    TrashStep trash(full, trash_opts);
    UntrashStep untrash(full, trash_opts);

    ActionRegistry reg;
    reg.add(ACTION_CP, [cp](const nlohmann::json& args) {
        return cp.run(args.get<CopyRequest>());
    });
    reg.add(ACTION_TRASH, [trash](const nlohmann::json& args) {
        return trash.run(args.get<TrashRequest>());
    });
    reg.add(ACTION_UNTRASH, [untrash](const nlohmann::json& args) {
        return untrash.run(args.get<TrashRequest>());
    });
    return reg;
}

} // namespace txcopy
