#include "txcopy/trash.h"
#include "txcopy/error.h"
#include "internal.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace txcopy {

// ---------------------------------------------------------------------------
// trashinfo helpers
// ---------------------------------------------------------------------------

namespace trashinfo {

std::string percent_encode(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    result.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            c == '/') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

std::string percent_decode(const std::string& s) {
    auto hexval = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexval(s[i + 1]), lo = hexval(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

std::string now_string() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

std::string format(const std::string& original_path,
                   const std::string& deletion_date) {
    return "[Trash Info]\nPath=" + percent_encode(original_path) +
           "\nDeletionDate=" + deletion_date + "\n";
}

std::optional<TrashEntry> parse(const std::string& name,
                                const std::string& body) {
    std::istringstream iss(body);
    std::string line;
    bool header = false;
    TrashEntry entry;
    entry.name = name;
    bool have_path = false;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (line[0] == '[') {
            header = (line == "[Trash Info]");
            continue;
        }
        if (!header) continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = line.substr(0, eq);
        auto val = line.substr(eq + 1);
        if (key == "Path") {
            entry.original_path = percent_decode(val);
            have_path = true;
        } else if (key == "DeletionDate") {
            entry.deletion_date = val;
        }
    }
    if (!have_path) return std::nullopt;
    return entry;
}

} // namespace trashinfo

namespace {

constexpr const char* INFO_EXT = ".trashinfo";

bool lexists(const std::filesystem::path& p) {
    struct ::stat st;
    return ::lstat(p.c_str(), &st) == 0;
}

[[noreturn]] void throw_io(const std::string& ctx) {
    throw IoError(ctx + ": " + std::strerror(errno));
}

/// Does trash entry `name` belong to basename `base` with `suffix`?
/// Accepts "<base>.<suffix>" and "<base>.<suffix>.<N>".
bool name_matches_suffix(const std::string& name,
                         const std::string& base,
                         const std::string& suffix) {
    std::string stem = base + "." + suffix;
    if (name == stem) return true;
    if (name.size() <= stem.size() + 1 ||
        name.compare(0, stem.size(), stem) != 0 ||
        name[stem.size()] != '.') {
        return false;
    }
    auto tail = name.substr(stem.size() + 1);
    return std::all_of(tail.begin(), tail.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

/// Ordering used to pick the newest entry: deletion date, then the
/// collision counter (shorter names were created first).
bool older_than(const TrashEntry& a, const TrashEntry& b) {
    if (a.deletion_date != b.deletion_date) return a.deletion_date < b.deletion_date;
    if (a.name.size() != b.name.size()) return a.name.size() < b.name.size();
    return a.name < b.name;
}

/// rename(2) `from` to `to`; across filesystems, copy then remove.
/// `to` must not exist.
void move_path(const std::string& from, const std::filesystem::path& to) {
    namespace fs = std::filesystem;
    if (::rename(from.c_str(), to.c_str()) == 0) return;
    if (errno != EXDEV) throw_io("cannot move " + from + " to " + to.string());

    std::error_code ec;
    fs::copy(from, to,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(to, cleanup);
        throw IoError("cannot copy " + from + " to " + to.string() + ": " +
                      ec.message());
    }
    fs::remove_all(from, ec);
    if (ec) {
        throw IoError("copied " + from + " to " + to.string() +
                      " but cannot remove it: " + ec.message());
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Trash
// ---------------------------------------------------------------------------

Trash::Trash(TrashOptions opts)
    : dir_(opts.trash_dir ? *opts.trash_dir : default_dir())
{}

std::filesystem::path Trash::default_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::filesystem::path(xdg) / "Trash";
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "Trash";
    }
    throw IoError("cannot locate trash: neither XDG_DATA_HOME nor HOME is set");
}

void Trash::ensure_dirs() const {
    std::error_code ec;
    std::filesystem::create_directories(files_dir(), ec);
    if (!ec) std::filesystem::create_directories(info_dir(), ec);
    if (ec) {
        throw IoError("cannot create trash directory " + dir_.string() +
                      ": " + ec.message());
    }
}

TrashEntry Trash::trash(const std::string& path,
                        const std::optional<std::string>& suffix) const {
    std::string abs = paths::absolute(path);
    std::string base = paths::basename(abs);
    if (base.empty() || base == "/") {
        throw InvalidRequestError("cannot trash " + path);
    }
    if (!lexists(abs)) throw NotFoundError(path);

    ensure_dirs();

    if (suffix) base += "." + *suffix;

    TrashEntry entry;
    entry.original_path = abs;
    entry.deletion_date = trashinfo::now_string();

    // Reserve the name by creating the info file exclusively.
    std::filesystem::path info_path;
    int fd = -1;
    for (unsigned n = 1; fd < 0; ++n) {
        entry.name = n == 1 ? base : base + "." + std::to_string(n);
        if (lexists(files_dir() / entry.name)) continue;
        info_path = info_dir() / (entry.name + INFO_EXT);
        fd = ::open(info_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0 && errno != EEXIST) {
            throw_io("cannot create " + info_path.string());
        }
    }

    std::string body = trashinfo::format(abs, entry.deletion_date);
    ssize_t written = ::write(fd, body.data(), body.size());
    int write_errno = errno;
    ::close(fd);
    if (written != static_cast<ssize_t>(body.size())) {
        std::error_code ec;
        std::filesystem::remove(info_path, ec);
        errno = write_errno;
        throw_io("cannot write " + info_path.string());
    }

    auto dest = files_dir() / entry.name;
    try {
        move_path(abs, dest);
    } catch (const IoError&) {
        // A partial cross-device move leaves the copy as a listable entry.
        if (!lexists(dest)) {
            std::error_code ec;
            std::filesystem::remove(info_path, ec);
        }
        throw;
    }
    return entry;
}

void Trash::recover(const std::string& path,
                    const std::optional<std::string>& suffix) const {
    std::string abs = paths::absolute(path);
    auto entry = find(abs, suffix);
    if (!entry) throw NotFoundError("trash entry for " + path);
    if (lexists(abs)) throw ExistsError(path);

    move_path((files_dir() / entry->name).string(), abs);

    std::error_code ec;
    std::filesystem::remove(info_dir() / (entry->name + INFO_EXT), ec);
    if (ec) {
        throw IoError("restored " + abs + " but cannot remove its trash info: " +
                      ec.message());
    }
}

std::optional<TrashEntry>
Trash::find(const std::string& path,
            const std::optional<std::string>& suffix) const {
    std::string abs = paths::absolute(path);
    std::string base = paths::basename(abs);

    std::optional<TrashEntry> best;
    for (auto& e : list()) {
        if (e.original_path != abs) continue;
        if (suffix && !name_matches_suffix(e.name, base, *suffix)) continue;
        if (!best || older_than(*best, e)) best = e;
    }
    return best;
}

std::vector<TrashEntry> Trash::list() const {
    namespace fs = std::filesystem;
    std::vector<TrashEntry> out;

    std::error_code ec;
    if (!fs::is_directory(info_dir(), ec)) return out;

    fs::directory_iterator it(info_dir(), ec);
    if (ec) {
        throw IoError("cannot list " + info_dir().string() + ": " + ec.message());
    }
    for (auto& de : it) {
        auto fname = de.path().filename().string();
        std::string ext(INFO_EXT);
        if (fname.size() <= ext.size() ||
            fname.compare(fname.size() - ext.size(), ext.size(), ext) != 0) {
            continue;
        }
        auto name = fname.substr(0, fname.size() - ext.size());
        // Info file without payload: reserved or half-removed entry.
        if (!lexists(files_dir() / name)) continue;

        std::ifstream ifs(de.path());
        if (!ifs) continue;
        std::stringstream ss;
        ss << ifs.rdbuf();
        auto entry = trashinfo::parse(name, ss.str());
        if (entry) out.push_back(std::move(*entry));
    }

    std::sort(out.begin(), out.end(),
              [](const TrashEntry& a, const TrashEntry& b) { return a.name < b.name; });
    return out;
}

// ---------------------------------------------------------------------------
// TrashStep
// ---------------------------------------------------------------------------

namespace {

std::map<std::string, std::string> trash_args(const TrashRequest& req) {
    std::map<std::string, std::string> args{{"path", req.path}};
    if (req.suffix) args["suffix"] = *req.suffix;
    return args;
}

} // anonymous namespace

TrashStep::TrashStep(StepContext ctx, TrashOptions opts)
    : ctx_(ctx.with_defaults())
    , opts_(std::move(opts))
{}

StepResult TrashStep::run(const TrashRequest& req) const {
    const auto& path = req.path;
    if (path.empty()) return {STATUS_BAD_REQUEST, "missing path", {}};
    if (!req.tx.action) return {STATUS_BAD_REQUEST, "Invalid tx action", {}};

    if (*req.tx.action == TxAction::CheckState) {
        if (!ctx_.probe->exists(path)) {
            return {STATUS_NOT_MODIFIED, "Path " + path + " already does not exist", {}};
        }
        if (req.tx.dry_run) {
            ctx_.logger->info("(DRY) Trashing {} ...", path);
        }
        return {STATUS_OK, "Path " + path + " needs to be trashed",
                {UndoAction{ACTION_UNTRASH, trash_args(req)}}};
    }

    ctx_.logger->info("Trashing {} ...", path);
    try {
        Trash trash(opts_);
        auto entry = trash.trash(path, req.suffix);
        ctx_.logger->debug("Trashed {} as {}", path,
                           (trash.dir() / "files" / entry.name).string());
    } catch (const InvalidRequestError& e) {
        return {STATUS_BAD_REQUEST, e.what(), {}};
    } catch (const TxcopyError& e) {
        return {STATUS_ERROR, std::string("Can't trash: ") + e.what(), {}};
    }
    return {STATUS_OK, "OK", {}};
}

// ---------------------------------------------------------------------------
// UntrashStep
// ---------------------------------------------------------------------------

UntrashStep::UntrashStep(StepContext ctx, TrashOptions opts)
    : ctx_(ctx.with_defaults())
    , opts_(std::move(opts))
{}

StepResult UntrashStep::run(const TrashRequest& req) const {
    const auto& path = req.path;
    if (path.empty()) return {STATUS_BAD_REQUEST, "missing path", {}};
    if (!req.tx.action) return {STATUS_BAD_REQUEST, "Invalid tx action", {}};

    if (*req.tx.action == TxAction::CheckState) {
        if (ctx_.probe->exists(path)) {
            return {STATUS_NOT_MODIFIED, "Path " + path + " already exists", {}};
        }
        try {
            Trash trash(opts_);
            if (!trash.find(path, req.suffix)) {
                return {STATUS_PRECONDITION_FAILED,
                        "No trashed entry for " + path, {}};
            }
        } catch (const TxcopyError& e) {
            return {STATUS_ERROR, std::string("Can't read trash: ") + e.what(), {}};
        }
        if (req.tx.dry_run) {
            ctx_.logger->info("(DRY) Untrashing {} ...", path);
        }
        return {STATUS_OK, "Path " + path + " needs to be untrashed",
                {UndoAction{ACTION_TRASH, trash_args(req)}}};
    }

    ctx_.logger->info("Untrashing {} ...", path);
    try {
        Trash trash(opts_);
        trash.recover(path, req.suffix);
    } catch (const TxcopyError& e) {
        return {STATUS_ERROR, std::string("Can't untrash: ") + e.what(), {}};
    }
    return {STATUS_OK, "OK", {}};
}

} // namespace txcopy
