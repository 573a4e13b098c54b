#pragma once

#include "tools.h"
#include "types.h"

#include <spdlog/logger.h>

#include <functional>
#include <memory>

namespace txcopy {

// ---------------------------------------------------------------------------
// StepContext
// ---------------------------------------------------------------------------

/// Everything a step needs from its environment.  Passed explicitly so
/// tests can swap in fakes for the collaborators and the privilege query.
///
/// @code
///     auto ctx = txcopy::StepContext::local();
///     txcopy::CopyStep step(ctx);
/// @endcode
struct StepContext {
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<FileProbe>      probe;
    std::shared_ptr<SyncTool>       sync;
    std::shared_ptr<OwnershipTool>  owner;
    std::function<bool()>           is_superuser;

    /// Production collaborators: lstat probe, rsync, chown, geteuid()
    /// and default_logger().
    static StepContext local(ToolOptions opts = {});

    /// A copy with every unset member filled from local().
    StepContext with_defaults(ToolOptions opts = {}) const;
};

} // namespace txcopy
