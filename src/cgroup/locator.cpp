#include "cgroup/locator.hpp"
#include "core/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace vessel::cgroup {

namespace {

const char* const kSubtrees[] = {"system.slice", "user.slice"};

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

} // namespace

std::string short_id(const std::string& id) {
    return id.substr(0, std::min(id.size(), kShortIdLength));
}

CgroupLocator CgroupLocator::open(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw CgroupRootError("cgroupv2 not found at " + root.string());
    }
    return CgroupLocator(root);
}

CgroupLocator::CgroupLocator(fs::path root)
    : root_(std::move(root)) {}

fs::path CgroupLocator::locate(const std::string& canonical_id,
                               const std::string& requested_name) const {
    auto path = find(canonical_id);
    if (!path) {
        const std::string& shown = requested_name.empty() ? canonical_id : requested_name;
        throw NotFoundError("Container " + shown + " not found in cgroup hierarchy");
    }
    return *path;
}

std::optional<fs::path> CgroupLocator::find(const std::string& canonical_id) const {
    // The empty string is a substring of every name
    if (canonical_id.empty()) {
        return std::nullopt;
    }

    for (const char* subtree : kSubtrees) {
        fs::path base = root_ / subtree;
        if (!is_dir(base)) {
            continue;
        }
        auto found = find_in_subtree(base, canonical_id);
        if (found) {
            return found;
        }
    }
    return std::nullopt;
}

std::optional<fs::path> CgroupLocator::find_in_subtree(const fs::path& base,
                                                       const std::string& canonical_id) const {
    fs::path full = base / ("docker-" + canonical_id + ".scope");
    if (is_dir(full)) {
        spdlog::debug("Found cgroup for {} by full ID: {}", canonical_id, full.string());
        return full;
    }

    fs::path abbreviated = base / ("docker-" + short_id(canonical_id) + ".scope");
    if (is_dir(abbreviated)) {
        spdlog::debug("Found cgroup for {} by short ID: {}", canonical_id, abbreviated.string());
        return abbreviated;
    }

    SearchResult result = search(base, canonical_id);
    for (const auto& failure : result.suppressed) {
        spdlog::debug("Skipped unreadable cgroup branch {}: {}",
                      failure.path.string(), failure.error.message());
    }
    if (result.match) {
        spdlog::debug("Found cgroup for {} by search: {}", canonical_id, result.match->string());
    }
    return result.match;
}

SearchResult CgroupLocator::search(const fs::path& base, const std::string& canonical_id) const {
    SearchResult result;
    if (canonical_id.empty()) {
        return result;
    }
    search_dir(base, canonical_id, short_id(canonical_id), result);
    return result;
}

std::vector<fs::directory_entry> CgroupLocator::list_dir(const fs::path& dir,
                                                        std::error_code& ec) const {
    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return entries;
    }

    const fs::directory_iterator end;
    while (it != end) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    return entries;
}

bool CgroupLocator::search_dir(const fs::path& dir, const std::string& id,
                               const std::string& short_form, SearchResult& result) const {
    std::error_code ec;
    std::vector<fs::directory_entry> entries = list_dir(dir, ec);

    for (const auto& entry : entries) {
        std::error_code type_ec;
        // Symlinks are not followed, a cgroup tree never needs them and they can loop
        if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
            std::string name = entry.path().filename().string();
            if (name.find(id) != std::string::npos ||
                name.find(short_form) != std::string::npos) {
                result.match = entry.path();
                return true;
            }
            if (search_dir(entry.path(), id, short_form, result)) {
                return true;
            }
        }
    }

    if (ec) {
        // Whatever was not listed is lost, the parent carries on with siblings
        result.suppressed.push_back({dir, ec});
    }
    return false;
}

} // namespace vessel::cgroup
