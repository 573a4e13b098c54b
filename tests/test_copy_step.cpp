#include <catch2/catch.hpp>
#include <txcopy/txcopy.h>

#include "test_helpers.h"

#include <string>
#include <vector>

using txcopy::TxAction;

// ---------------------------------------------------------------------------
// Request validation
// ---------------------------------------------------------------------------

TEST_CASE("CopyStep: missing source is a bad request", "[copy_step]") {
    FakeEnv env;
    txcopy::CopyStep step(env.context());

    auto res = step.run(copy_request("", "t", TxAction::CheckState));
    CHECK(res.status == txcopy::STATUS_BAD_REQUEST);
    CHECK(res.message == "missing source");
    CHECK(res.undo_actions.empty());
}

TEST_CASE("CopyStep: missing target is a bad request", "[copy_step]") {
    FakeEnv env;
    txcopy::CopyStep step(env.context());

    auto res = step.run(copy_request("s", "", TxAction::FixState));
    CHECK(res.status == txcopy::STATUS_BAD_REQUEST);
    CHECK(res.message == "missing target");
    CHECK(env.sync->calls.empty());
}

TEST_CASE("CopyStep: unknown phase is a bad request", "[copy_step]") {
    FakeEnv env;
    env.probe->present = {"s"};
    txcopy::CopyStep step(env.context());

    txcopy::CopyRequest req;
    req.source = "s";
    req.target = "t";
    auto res = step.run(req);
    CHECK(res.status == txcopy::STATUS_BAD_REQUEST);
    CHECK(res.message == "Invalid tx action");
    CHECK(env.sync->calls.empty());
}

// ---------------------------------------------------------------------------
// check_state
// ---------------------------------------------------------------------------

TEST_CASE("CopyStep: check fails when source is missing", "[copy_step]") {
    FakeEnv env;
    txcopy::CopyStep step(env.context());

    SECTION("plain") {
        auto res = step.run(copy_request("s", "t", TxAction::CheckState));
        CHECK(res.status == txcopy::STATUS_PRECONDITION_FAILED);
        CHECK(res.message == "Source s does not exist");
    }
    SECTION("target present, recovery, dry run, ownership") {
        env.probe->present = {"t"};
        auto req = copy_request("s", "t", TxAction::CheckState);
        req.tx.recovery = true;
        req.tx.rollback = true;
        req.tx.dry_run = true;
        req.target_owner = "root";
        auto res = step.run(req);
        CHECK(res.status == txcopy::STATUS_PRECONDITION_FAILED);
        CHECK(res.undo_actions.empty());
    }
}

TEST_CASE("CopyStep: check is a no-op when target exists", "[copy_step]") {
    FakeEnv env;
    env.probe->present = {"s", "t"};
    txcopy::CopyStep step(env.context());

    auto res = step.run(copy_request("s", "t", TxAction::CheckState));
    CHECK(res.status == txcopy::STATUS_NOT_MODIFIED);
    CHECK(res.message == "Target t already exists");
    CHECK(res.ok());
    CHECK(res.undo_actions.empty());
    CHECK(env.sync->calls.empty());
}

TEST_CASE("CopyStep: check declares trash of target", "[copy_step]") {
    FakeEnv env;
    env.probe->present = {"s"};
    txcopy::CopyStep step(env.context());

    auto res = step.run(copy_request("s", "t", TxAction::CheckState));
    CHECK(res.status == txcopy::STATUS_OK);
    CHECK(res.message == "s needs to be copied to t");
    REQUIRE(res.undo_actions.size() == 1);
    CHECK(res.undo_actions[0].action == "txcopy::trash");
    CHECK(res.undo_actions[0].args.at("path") == "t");
    CHECK(res.undo_actions[0].args.size() == 1);
    // check never mutates
    CHECK(env.sync->calls.empty());
    CHECK(env.owner->calls.empty());
}

TEST_CASE("CopyStep: existing target is synced during recovery and rollback",
          "[copy_step]") {
    FakeEnv env;
    env.probe->present = {"s", "t"};
    txcopy::CopyStep step(env.context());

    auto req = copy_request("s", "t", TxAction::CheckState);
    SECTION("recovery") { req.tx.recovery = true; }
    SECTION("rollback") { req.tx.rollback = true; }

    auto res = step.run(req);
    CHECK(res.status == txcopy::STATUS_OK);
    CHECK(res.message == "s needs to be synced to t");
    txcopy::UndoAction expected{"txcopy::trash", {{"path", "t"}}};
    REQUIRE(res.undo_actions.size() == 1);
    CHECK(res.undo_actions[0] == expected);
}

TEST_CASE("CopyStep: dry-run check only logs", "[copy_step]") {
    FakeEnv env;
    txcopy::CopyStep step(env.context());

    SECTION("copying") {
        env.probe->present = {"s"};
        auto req = copy_request("s", "t", TxAction::CheckState);
        req.tx.dry_run = true;
        auto res = step.run(req);
        CHECK(res.status == txcopy::STATUS_OK);
        CHECK(res.undo_actions.size() == 1);
        CHECK(env.log.contains("info (DRY) Copying s -> t ..."));
    }
    SECTION("syncing during recovery") {
        env.probe->present = {"s", "t"};
        auto req = copy_request("s", "t", TxAction::CheckState);
        req.tx.dry_run = true;
        req.tx.recovery = true;
        auto res = step.run(req);
        CHECK(res.status == txcopy::STATUS_OK);
        CHECK(env.log.contains("info (DRY) Syncing s -> t ..."));
    }
    SECTION("no-op result matches the non-dry-run one") {
        env.probe->present = {"s", "t"};
        auto req = copy_request("s", "t", TxAction::CheckState);
        auto plain = step.run(req);
        req.tx.dry_run = true;
        auto dry = step.run(req);
        CHECK(dry.status == plain.status);
        CHECK(dry.message == plain.message);
        CHECK(dry.status == txcopy::STATUS_NOT_MODIFIED);
    }
    CHECK(env.sync->calls.empty());
    CHECK(env.owner->calls.empty());
}

TEST_CASE("CopyStep: check without dry run does not log the plan", "[copy_step]") {
    FakeEnv env;
    env.probe->present = {"s"};
    txcopy::CopyStep step(env.context());

    step.run(copy_request("s", "t", TxAction::CheckState));
    CHECK_FALSE(env.log.contains("(DRY)"));
}

// ---------------------------------------------------------------------------
// fix_state
// ---------------------------------------------------------------------------

TEST_CASE("CopyStep: fix syncs with default options", "[copy_step]") {
    FakeEnv env;
    txcopy::CopyStep step(env.context());

    auto res = step.run(copy_request("s", "t", TxAction::FixState));
    CHECK(res.status == txcopy::STATUS_OK);
    CHECK(res.message == "OK");
    CHECK(res.undo_actions.empty());

    REQUIRE(env.sync->calls.size() == 1);
    CHECK(env.sync->calls[0].source == "s");
    CHECK(env.sync->calls[0].target == "t");
    CHECK(env.sync->calls[0].options == std::vector<std::string>{"-a"});
    CHECK(env.owner->calls.empty());
    CHECK(env.log.contains("info Rsync-ing s -> t ..."));
}

TEST_CASE("CopyStep: fix passes custom rsync options in order", "[copy_step]") {
    FakeEnv env;
    txcopy::CopyStep step(env.context());

    auto req = copy_request("s", "t", TxAction::FixState);
    req.rsync_opts = {"-aH", "--delete", "--partial"};
    step.run(req);

    REQUIRE(env.sync->calls.size() == 1);
    CHECK(env.sync->calls[0].options ==
          std::vector<std::string>{"-aH", "--delete", "--partial"});
}

TEST_CASE("CopyStep: fix does not re-check existence", "[copy_step]") {
    FakeEnv env; // probe reports nothing
    txcopy::CopyStep step(env.context());

    auto res = step.run(copy_request("s", "t", TxAction::FixState));
    CHECK(res.status == txcopy::STATUS_OK);
    CHECK(env.sync->calls.size() == 1);
}

TEST_CASE("CopyStep: sync failure is an execution error", "[copy_step]") {
    FakeEnv env;
    env.superuser = true;
    env.sync->result = txcopy::ToolResult::failure("exited with code 23: partial transfer");
    txcopy::CopyStep step(env.context());

    auto req = copy_request("s", "t", TxAction::FixState);
    req.target_owner = "alice";
    auto res = step.run(req);
    CHECK(res.status == txcopy::STATUS_ERROR);
    CHECK(res.message == "Can't rsync: exited with code 23: partial transfer");
    CHECK_FALSE(res.ok());
    // no chown after a failed sync, and no retry
    CHECK(env.owner->calls.empty());
    CHECK(env.sync->calls.size() == 1);
}

TEST_CASE("CopyStep: sync tool exceptions become execution errors", "[copy_step]") {
    struct ThrowingSync : txcopy::SyncTool {
        txcopy::ToolResult sync(const std::string&, const std::string&,
                                const std::vector<std::string>&) override {
            throw txcopy::ProcessError("fork: Resource temporarily unavailable");
        }
    };
    FakeEnv env;
    auto ctx = env.context();
    ctx.sync = std::make_shared<ThrowingSync>();
    txcopy::CopyStep step(ctx);

    auto res = step.run(copy_request("s", "t", TxAction::FixState));
    CHECK(res.status == txcopy::STATUS_ERROR);
    CHECK(res.message.find("Can't rsync: process error: fork") == 0);
}

TEST_CASE("CopyStep: fix changes ownership when privileged", "[copy_step]") {
    FakeEnv env;
    env.superuser = true;
    txcopy::CopyStep step(env.context());

    auto req = copy_request("s", "t", TxAction::FixState);
    SECTION("owner and group") {
        req.target_owner = "alice";
        req.target_group = "staff";
        CHECK(step.run(req).status == txcopy::STATUS_OK);
        REQUIRE(env.owner->calls.size() == 1);
        CHECK(env.owner->calls[0].path == "t");
        CHECK(env.owner->calls[0].owner == std::optional<std::string>("alice"));
        CHECK(env.owner->calls[0].group == std::optional<std::string>("staff"));
    }
    SECTION("group only") {
        req.target_group = "staff";
        CHECK(step.run(req).status == txcopy::STATUS_OK);
        REQUIRE(env.owner->calls.size() == 1);
        CHECK_FALSE(env.owner->calls[0].owner.has_value());
        CHECK(env.owner->calls[0].group == std::optional<std::string>("staff"));
    }
    CHECK(env.log.contains("info Chown-ing t ..."));
}

TEST_CASE("CopyStep: fix skips ownership without privilege", "[copy_step]") {
    FakeEnv env;
    env.superuser = false;
    txcopy::CopyStep step(env.context());

    auto req = copy_request("s", "t", TxAction::FixState);
    req.target_owner = "alice";
    req.target_group = "staff";
    auto res = step.run(req);
    CHECK(res.status == txcopy::STATUS_OK);
    CHECK(res.message == "OK");
    CHECK(env.owner->calls.empty());
    CHECK(env.sync->calls.size() == 1);
    CHECK(env.log.contains("debug Not running as root, not doing chown"));
}

TEST_CASE("CopyStep: no ownership fields means no chown", "[copy_step]") {
    FakeEnv env;
    env.superuser = true;
    txcopy::CopyStep step(env.context());

    CHECK(step.run(copy_request("s", "t", TxAction::FixState)).status ==
          txcopy::STATUS_OK);
    CHECK(env.owner->calls.empty());
}

TEST_CASE("CopyStep: chown failure is an execution error", "[copy_step]") {
    FakeEnv env;
    env.superuser = true;
    env.owner->result = txcopy::ToolResult::failure(
        "exited with code 1: chown: invalid user: 'nobody-here'");
    txcopy::CopyStep step(env.context());

    auto req = copy_request("s", "t", TxAction::FixState);
    req.target_owner = "nobody-here";
    auto res = step.run(req);
    CHECK(res.status == txcopy::STATUS_ERROR);
    CHECK(res.message ==
          "Can't chown: exited with code 1: chown: invalid user: 'nobody-here'");
}

TEST_CASE("CopyStep: check then fix on fakes", "[copy_step]") {
    FakeEnv env;
    env.probe->present = {"s"};
    txcopy::CopyStep step(env.context());

    auto checked = step.run(copy_request("s", "t", TxAction::CheckState));
    REQUIRE(checked.status == txcopy::STATUS_OK);
    auto fixed = step.run(copy_request("s", "t", TxAction::FixState));
    REQUIRE(fixed.status == txcopy::STATUS_OK);

    // the orchestrator re-checks: the target now exists
    env.probe->present.insert("t");
    auto again = step.run(copy_request("s", "t", TxAction::CheckState));
    CHECK(again.status == txcopy::STATUS_NOT_MODIFIED);
}
