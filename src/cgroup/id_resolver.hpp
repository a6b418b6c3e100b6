/**
 * Container identifier resolution
 *
 * Maps a user-supplied container name or ID to the runtime's canonical ID.
 * Resolution never fails: when the runtime cannot answer, the input is
 * assumed to already be canonical and is returned unchanged.
 */
#pragma once
#include <string>
#include <unordered_map>

namespace vessel::cgroup {

class IdResolver {
public:
    virtual ~IdResolver() = default;

    // Returns the canonical ID for name_or_id, or name_or_id itself.
    virtual std::string resolve(const std::string& name_or_id) = 0;
};

// Asks the container runtime CLI: `<binary> inspect --format {{.Id}} <name>`.
class DockerIdResolver : public IdResolver {
public:
    explicit DockerIdResolver(std::string binary = "docker");

    std::string resolve(const std::string& name_or_id) override;

    const std::string& binary() const { return binary_; }

private:
    std::string binary_;
};

// Fixed name -> ID table; unknown names resolve to themselves.
class StaticIdResolver : public IdResolver {
public:
    StaticIdResolver() = default;
    explicit StaticIdResolver(std::unordered_map<std::string, std::string> ids)
        : ids_(std::move(ids)) {}

    void set(const std::string& name, const std::string& id) { ids_[name] = id; }

    std::string resolve(const std::string& name_or_id) override;

private:
    std::unordered_map<std::string, std::string> ids_;
};

} // namespace vessel::cgroup
