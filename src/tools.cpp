#include "txcopy/tools.h"
#include "txcopy/log.h"
#include "txcopy/process.h"
#include "internal.h"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace txcopy {

namespace {

/// Strip trailing newlines/blanks from tool output.
std::string rtrim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    return s;
}

ToolResult run_logged(spdlog::logger& logger, const std::vector<std::string>& argv) {
    logger.debug("Running {}", process::format_command(argv));
    auto pr = process::run(argv);
    if (pr.success()) return ToolResult::success();
    std::string why = process::explain(pr);
    logger.debug("{} {}", argv.front(), why);
    auto out = rtrim(pr.output);
    if (!out.empty()) why += ": " + out;
    return ToolResult::failure(std::move(why));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LocalFileProbe
// ---------------------------------------------------------------------------

bool LocalFileProbe::exists(const std::string& path) const {
    struct ::stat st;
    return ::lstat(path.c_str(), &st) == 0;
}

// ---------------------------------------------------------------------------
// RsyncTool
// ---------------------------------------------------------------------------

RsyncTool::RsyncTool(ToolOptions opts, std::shared_ptr<spdlog::logger> logger)
    : opts_(std::move(opts))
    , logger_(logger ? std::move(logger) : default_logger())
{}

std::vector<std::string>
RsyncTool::command(const std::string& source,
                   const std::string& target,
                   const std::vector<std::string>& options) const {
    std::vector<std::string> argv;
    argv.reserve(options.size() + 4);
    argv.push_back(opts_.rsync_program);
    argv.insert(argv.end(), options.begin(), options.end());
    argv.push_back("--");
    if (paths::is_directory(source)) {
        argv.push_back(paths::dir_form(source));
        argv.push_back(paths::dir_form(target));
    } else {
        argv.push_back(source);
        argv.push_back(target);
    }
    return argv;
}

ToolResult RsyncTool::sync(const std::string& source,
                           const std::string& target,
                           const std::vector<std::string>& options) {
    return run_logged(*logger_, command(source, target, options));
}

// ---------------------------------------------------------------------------
// ChownTool
// ---------------------------------------------------------------------------

ChownTool::ChownTool(ToolOptions opts, std::shared_ptr<spdlog::logger> logger)
    : opts_(std::move(opts))
    , logger_(logger ? std::move(logger) : default_logger())
{}

std::vector<std::string>
ChownTool::command(const std::string& path,
                   const std::optional<std::string>& owner,
                   const std::optional<std::string>& group) const {
    return {opts_.chown_program, "-Rh", owner_spec(owner, group), "--", path};
}

ToolResult ChownTool::chown(const std::string& path,
                            const std::optional<std::string>& owner,
                            const std::optional<std::string>& group) {
    return run_logged(*logger_, command(path, owner, group));
}

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------

std::string owner_spec(const std::optional<std::string>& owner,
                       const std::optional<std::string>& group) {
    return owner.value_or("") + ":" + group.value_or("");
}

bool running_as_superuser() {
    return ::geteuid() == 0;
}

} // namespace txcopy
