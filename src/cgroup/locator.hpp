/**
 * Cgroup v2 directory discovery
 *
 * Finds the cgroup directory of a container under the unified hierarchy.
 * Runtimes name these directories differently depending on the init system
 * and on whether they run rootful (system.slice) or rootless (user.slice),
 * so several layouts are tried in turn:
 *
 *   1. <subtree>/docker-<id>.scope
 *   2. <subtree>/docker-<short id>.scope
 *   3. any directory below <subtree> whose name contains the id or short id
 *
 * for subtree = system.slice, then user.slice. Nothing is cached; every
 * call walks the hierarchy again.
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace vessel::cgroup {

// Conventional length of an abbreviated container ID.
inline constexpr size_t kShortIdLength = 12;

// First kShortIdLength characters of id, or all of it when shorter.
std::string short_id(const std::string& id);

// A subtree the search could not read. The rest of the walk continues.
struct BranchError {
    std::filesystem::path path;
    std::error_code error;
};

struct SearchResult {
    std::optional<std::filesystem::path> match;
    std::vector<BranchError> suppressed;
};

class CgroupLocator {
public:
    // Throws CgroupRootError if root does not exist.
    static CgroupLocator open(const std::filesystem::path& root);

    explicit CgroupLocator(std::filesystem::path root);
    virtual ~CgroupLocator() = default;

    CgroupLocator(const CgroupLocator&) = default;
    CgroupLocator& operator=(const CgroupLocator&) = default;
    CgroupLocator(CgroupLocator&&) = default;
    CgroupLocator& operator=(CgroupLocator&&) = default;

    // Path of the container's cgroup directory. Throws NotFoundError naming
    // requested_name (or canonical_id when requested_name is empty).
    std::filesystem::path locate(const std::string& canonical_id,
                                 const std::string& requested_name = "") const;

    // Same as locate() without the exception.
    std::optional<std::filesystem::path> find(const std::string& canonical_id) const;

    // Depth-first walk below base for a directory whose name contains canonical_id
    // or its short form. Unreadable branches are recorded in suppressed.
    SearchResult search(const std::filesystem::path& base, const std::string& canonical_id) const;

    const std::filesystem::path& root() const { return root_; }

protected:
    // Entries of dir in directory order. On failure ec is set and the entries
    // read before the failure are returned.
    virtual std::vector<std::filesystem::directory_entry> list_dir(const std::filesystem::path& dir,
                                                                   std::error_code& ec) const;

private:
    std::filesystem::path root_;

    std::optional<std::filesystem::path> find_in_subtree(const std::filesystem::path& base,
                                                         const std::string& canonical_id) const;
    bool search_dir(const std::filesystem::path& dir, const std::string& id,
                    const std::string& short_form, SearchResult& result) const;
};

} // namespace vessel::cgroup
