#include "txcopy/json.h"
#include "txcopy/error.h"

#include <optional>
#include <string>
#include <vector>

namespace txcopy {

using json = nlohmann::json;

namespace {

void require_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw InvalidRequestError(std::string(what) + " must be a JSON object");
    }
}

/// Absent or null -> nullopt.
std::optional<std::string> opt_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw InvalidRequestError(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

/// Absent or null -> false.  Integers count as flags (0 = false).
bool opt_flag(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number_integer()) return it->get<long long>() != 0;
    throw InvalidRequestError(std::string("'") + key + "' must be a boolean");
}

std::vector<std::string> string_list(const json& j, const char* key) {
    if (j.is_string()) return {j.get<std::string>()};
    if (!j.is_array()) {
        throw InvalidRequestError(std::string("'") + key +
                                  "' must be a string or an array of strings");
    }
    std::vector<std::string> out;
    for (auto& v : j) {
        if (!v.is_string()) {
            throw InvalidRequestError(std::string("'") + key +
                                      "' must contain only strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// TxFlags
// ---------------------------------------------------------------------------

void from_json(const json& j, TxFlags& flags) {
    require_object(j, "argument bag");
    auto action = opt_string(j, "-tx_action");
    flags.action   = action ? tx_action_from_string(*action) : std::nullopt;
    flags.dry_run  = opt_flag(j, "-dry_run");
    flags.recovery = opt_flag(j, "-tx_recovery");
    flags.rollback = opt_flag(j, "-tx_rollback");
}

void to_json(json& j, const TxFlags& flags) {
    if (!j.is_object()) j = json::object();
    if (flags.action) j["-tx_action"] = tx_action_to_string(*flags.action);
    if (flags.dry_run)  j["-dry_run"] = true;
    if (flags.recovery) j["-tx_recovery"] = true;
    if (flags.rollback) j["-tx_rollback"] = true;
}

// ---------------------------------------------------------------------------
// UndoAction
// ---------------------------------------------------------------------------

void to_json(json& j, const UndoAction& a) {
    json args = json::object();
    for (auto& [k, v] : a.args) args[k] = v;
    j = json::array({a.action, args});
}

void from_json(const json& j, UndoAction& a) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_string()) {
        throw InvalidRequestError("undo action must be [name, {args}]");
    }
    a.action = j[0].get<std::string>();
    a.args.clear();
    if (j[1].is_null()) return;
    require_object(j[1], "undo action arguments");
    for (auto& [k, v] : j[1].items()) {
        if (v.is_string()) {
            a.args[k] = v.get<std::string>();
        } else if (!v.is_null()) {
            a.args[k] = v.dump();
        }
    }
}

// ---------------------------------------------------------------------------
// StepResult
// ---------------------------------------------------------------------------

void to_json(json& j, const StepResult& r) {
    j = json::array({r.status, r.message});
    if (!r.undo_actions.empty()) {
        j.push_back(nullptr);
        j.push_back(json{{"undo_actions", r.undo_actions}});
    }
}

void from_json(const json& j, StepResult& r) {
    if (!j.is_array() || j.empty() || !j[0].is_number_integer()) {
        throw InvalidRequestError("result must be [status, message, ...]");
    }
    r.status = j[0].get<int>();
    r.message = (j.size() > 1 && j[1].is_string()) ? j[1].get<std::string>() : "";
    r.undo_actions.clear();
    if (j.size() > 3 && j[3].is_object()) {
        auto it = j[3].find("undo_actions");
        if (it != j[3].end() && it->is_array()) {
            for (auto& ua : *it) r.undo_actions.push_back(ua.get<UndoAction>());
        }
    }
}

// ---------------------------------------------------------------------------
// CopyRequest
// ---------------------------------------------------------------------------

void from_json(const json& j, CopyRequest& req) {
    require_object(j, "argument bag");
    req.source       = opt_string(j, "source").value_or("");
    req.target       = opt_string(j, "target").value_or("");
    req.target_owner = opt_string(j, "target_owner");
    req.target_group = opt_string(j, "target_group");

    auto it = j.find("rsync_opts");
    if (it != j.end() && !it->is_null()) {
        req.rsync_opts = string_list(*it, "rsync_opts");
    } else {
        req.rsync_opts = {"-a"};
    }

    from_json(j, req.tx);
}

void to_json(json& j, const CopyRequest& req) {
    j = json{{"source", req.source}, {"target", req.target},
             {"rsync_opts", req.rsync_opts}};
    if (req.target_owner) j["target_owner"] = *req.target_owner;
    if (req.target_group) j["target_group"] = *req.target_group;
    to_json(j, req.tx);
}

// ---------------------------------------------------------------------------
// TrashRequest
// ---------------------------------------------------------------------------

void from_json(const json& j, TrashRequest& req) {
    require_object(j, "argument bag");
    req.path   = opt_string(j, "path").value_or("");
    req.suffix = opt_string(j, "suffix");
    from_json(j, req.tx);
}

void to_json(json& j, const TrashRequest& req) {
    j = json{{"path", req.path}};
    if (req.suffix) j["suffix"] = *req.suffix;
    to_json(j, req.tx);
}

} // namespace txcopy
