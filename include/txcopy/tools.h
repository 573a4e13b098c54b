#pragma once

/// @file tools.h
/// Interfaces to the external collaborators of a step, and their
/// production implementations.

#include "types.h"

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace txcopy {

// ---------------------------------------------------------------------------
// Interfaces
// ---------------------------------------------------------------------------

/// Answers "does this path exist?".
class FileProbe {
public:
    virtual ~FileProbe() = default;

    /// True for any file type, including dangling symlinks.
    virtual bool exists(const std::string& path) const = 0;
};

/// Recursive, resumable mirroring of `source` into `target`.
class SyncTool {
public:
    virtual ~SyncTool() = default;

    /// Copy the contents of `source` into `target`, passing `options`
    /// through to the tool.  Must be safe to repeat on a partial target.
    virtual ToolResult sync(const std::string& source,
                            const std::string& target,
                            const std::vector<std::string>& options) = 0;
};

/// Recursive ownership change.
class OwnershipTool {
public:
    virtual ~OwnershipTool() = default;

    /// Change owner and/or group of `path` recursively.  A missing side
    /// is left unchanged.
    virtual ToolResult chown(const std::string& path,
                             const std::optional<std::string>& owner,
                             const std::optional<std::string>& group) = 0;
};

// ---------------------------------------------------------------------------
// Production implementations
// ---------------------------------------------------------------------------

/// lstat()-based existence check.
class LocalFileProbe : public FileProbe {
public:
    bool exists(const std::string& path) const override;
};

/// Runs `rsync <options...> -- <source>/ <target>/`.
///
/// Directory sources get a trailing separator on both sides so rsync
/// merges the contents into `target` instead of creating
/// `target/<basename>`.  Other sources are passed unchanged.
///
/// Each command line is logged at debug level before it runs.
class RsyncTool : public SyncTool {
public:
    /// A null `logger` means default_logger().
    explicit RsyncTool(ToolOptions opts = {},
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    ToolResult sync(const std::string& source,
                    const std::string& target,
                    const std::vector<std::string>& options) override;

    /// The argv sync() would run (exposed for logging and tests).
    std::vector<std::string> command(const std::string& source,
                                     const std::string& target,
                                     const std::vector<std::string>& options) const;

private:
    ToolOptions                     opts_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Runs `chown -Rh owner:group -- path`.
class ChownTool : public OwnershipTool {
public:
    explicit ChownTool(ToolOptions opts = {},
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    ToolResult chown(const std::string& path,
                     const std::optional<std::string>& owner,
                     const std::optional<std::string>& group) override;

    std::vector<std::string> command(const std::string& path,
                                     const std::optional<std::string>& owner,
                                     const std::optional<std::string>& group) const;

private:
    ToolOptions                     opts_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Build the "owner:group" specifier chown expects; either side may be
/// empty.
std::string owner_spec(const std::optional<std::string>& owner,
                       const std::optional<std::string>& group);

/// True when the effective uid is 0.
bool running_as_superuser();

} // namespace txcopy
