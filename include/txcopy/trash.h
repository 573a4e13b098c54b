#pragma once

/// @file trash.h
/// Recoverable deletion: a freedesktop.org-style trash directory and the
/// two-phase trash/untrash steps that undo a copy.

#include "context.h"
#include "types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace txcopy {

// ---------------------------------------------------------------------------
// Trash
// ---------------------------------------------------------------------------

/// A trash directory laid out as `<dir>/files/<name>` plus
/// `<dir>/info/<name>.trashinfo`.
///
/// Items are moved with rename(2).  When the trash is on another
/// filesystem they are copied (recursively, symlinks as symlinks) and the
/// original is then removed.
class Trash {
public:
    explicit Trash(TrashOptions opts = {});

    const std::filesystem::path& dir() const { return dir_; }

    /// Move `path` into the trash and return the new entry.  The entry is
    /// named after the basename of `path`, plus ".<suffix>" if given, plus
    /// ".N" if that name is taken.
    /// @throws InvalidRequestError if `path` names the root directory.
    /// @throws NotFoundError if `path` does not exist.
    /// @throws IoError if the move fails.
    TrashEntry trash(const std::string& path,
                     const std::optional<std::string>& suffix = std::nullopt) const;

    /// Move the most recently trashed entry for `path` back.
    /// @throws NotFoundError if there is no such entry.
    /// @throws ExistsError if `path` is occupied.
    /// @throws IoError if the move fails.
    void recover(const std::string& path,
                 const std::optional<std::string>& suffix = std::nullopt) const;

    /// Newest entry whose original location is `path` (and whose name
    /// carries `suffix`, when given).
    std::optional<TrashEntry> find(const std::string& path,
                                   const std::optional<std::string>& suffix = std::nullopt) const;

    /// All entries with a readable .trashinfo, sorted by name.
    std::vector<TrashEntry> list() const;

    /// Default trash root: $XDG_DATA_HOME/Trash or $HOME/.local/share/Trash.
    /// @throws IoError if neither variable is set.
    static std::filesystem::path default_dir();

private:
    std::filesystem::path files_dir() const { return dir_ / "files"; }
    std::filesystem::path info_dir()  const { return dir_ / "info"; }
    void ensure_dirs() const;

    std::filesystem::path dir_;
};

// ---------------------------------------------------------------------------
// TrashStep / UntrashStep
// ---------------------------------------------------------------------------

/// Two-phase "trash this path".  Undo: `txcopy::untrash`.
class TrashStep {
public:
    TrashStep(StepContext ctx, TrashOptions opts = {});

    StepResult run(const TrashRequest& req) const;

private:
    StepContext  ctx_;
    TrashOptions opts_;
};

/// Two-phase "restore this path from the trash".  Undo: `txcopy::trash`.
class UntrashStep {
public:
    UntrashStep(StepContext ctx, TrashOptions opts = {});

    StepResult run(const TrashRequest& req) const;

private:
    StepContext  ctx_;
    TrashOptions opts_;
};

} // namespace txcopy
