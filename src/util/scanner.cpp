#include <knit/scanner.hpp>
#include <knit/glob.hpp>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace knit {

namespace fs = std::filesystem;

Result<int> parse_depth(const std::string& text) {
    bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
    if (digits) {
        errno = 0;
        long long d = std::strtoll(text.c_str(), nullptr, 10);
        if (errno != ERANGE && d <= INT_MAX) return Result<int>::ok(static_cast<int>(d));
    }
    return KnitError{KnitError::InvalidArg,
        "depth must be an integer from 0 to " + std::to_string(INT_MAX) +
        ", got '" + text + "'"};
}

bool should_exclude(const fs::path& manifest_path,
                    const std::vector<std::string>& patterns,
                    const fs::path& cwd) {
    if (patterns.empty()) return false;

    std::error_code ec;
    fs::path absolute = fs::absolute(manifest_path, ec).lexically_normal();
    if (ec) absolute = manifest_path;

    fs::path base = cwd;
    if (base.empty()) {
        base = fs::current_path(ec);
        if (ec) base.clear();
    }

    fs::path relative;
    if (!base.empty()) {
        relative = absolute.lexically_relative(base);
    }
    if (relative.empty()) relative = manifest_path;

    const std::string candidates[] = {
        absolute.generic_string(),
        relative.generic_string(),
        absolute.parent_path().generic_string(),
        relative.parent_path().generic_string(),
    };

    for (const auto& pattern : patterns) {
        for (const auto& candidate : candidates) {
            if (candidate.empty()) continue;
            if (glob_match_path_or_name(pattern, candidate)) return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// scan_workspace
// ---------------------------------------------------------------------------

namespace {

struct Scanner {
    const ScanOptions& options;
    log::Logger& logger;
    std::vector<fs::path> found;

    // Record dir's manifest if present and allowed. Returns false when the
    // directory is excluded and must not be searched further.
    bool consider(const fs::path& dir) {
        fs::path manifest = dir / options.manifest_name;
        std::error_code ec;
        bool present = fs::is_regular_file(manifest, ec);

        if (should_exclude(manifest, options.exclude, options.cwd)) {
            if (present) {
                logger.verbose("excluding %s (matches exclusion pattern)",
                               manifest.string().c_str());
            }
            return false;
        }
        if (present) {
            logger.verbose("found %s", manifest.string().c_str());
            found.push_back(std::move(manifest));
        }
        return true;
    }

    Status walk(const fs::path& dir, int remaining) {
        if (remaining <= 0) return ok_status();

        std::error_code ec;
        std::vector<fs::path> subdirs;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec)) {
                subdirs.push_back(it->path());
            }
        }
        if (ec) {
            return KnitError{KnitError::Scan,
                "cannot read directory " + dir.string() + ": " + ec.message()};
        }
        std::sort(subdirs.begin(), subdirs.end());

        for (const auto& sub : subdirs) {
            if (!consider(sub)) continue;

            // Symlinked directories are checked but not descended into
            std::error_code link_ec;
            if (remaining > 1 && !fs::is_symlink(sub, link_ec)) {
                KNIT_TRY(walk(sub, remaining - 1));
            }
        }
        return ok_status();
    }
};

} // namespace

Result<std::vector<fs::path>> scan_workspace(const fs::path& root,
                                             const ScanOptions& options,
                                             log::Logger& logger) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        logger.error("failed to scan directory %s: not a readable directory",
                     root.string().c_str());
        return KnitError{KnitError::Scan,
            "workspace directory does not exist: " + root.string(),
            "pass an existing directory with -C <dir>"};
    }
    if (options.depth < 0) {
        return KnitError{KnitError::InvalidArg,
            "scan depth must be >= 0, got " + std::to_string(options.depth)};
    }

    Scanner scanner{options, logger, {}};
    // An excluded root only loses its own manifest
    scanner.consider(root);
    auto status = scanner.walk(root, options.depth);
    if (status.is_err()) {
        logger.error("%s", status.error().message.c_str());
        return std::move(status).error();
    }

    logger.debug("scan of %s found %zu manifests",
                 root.string().c_str(), scanner.found.size());
    return Result<std::vector<fs::path>>::ok(std::move(scanner.found));
}

} // namespace knit
