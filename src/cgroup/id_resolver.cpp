#include "cgroup/id_resolver.hpp"
#include "core/strings.hpp"
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <optional>

namespace vessel::cgroup {

namespace {

// Runs argv, capturing stdout. Returns nullopt unless the child exits with status 0.
std::optional<std::string> run_capture(const std::string& binary, const std::string& arg) {
    int stdout_pipe[2];
    if (pipe(stdout_pipe) < 0) {
        spdlog::debug("Failed to create pipe for {}: {}", binary, std::strerror(errno));
        return std::nullopt;
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::debug("Failed to fork {}: {}", binary, std::strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[1]);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        execlp(binary.c_str(), binary.c_str(), "inspect", "--format", "{{.Id}}",
               arg.c_str(), static_cast<char*>(nullptr));

        // If exec fails
        _exit(127);
    }

    close(stdout_pipe[1]);

    std::string output;
    char chunk[4096];
    bool read_failed = false;
    for (;;) {
        ssize_t n = read(stdout_pipe[0], chunk, sizeof(chunk));
        if (n > 0) {
            output.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            read_failed = true;
            break;
        }
    }
    close(stdout_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::nullopt;
        }
    }

    if (read_failed) {
        return std::nullopt;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }
    return output;
}

} // namespace

DockerIdResolver::DockerIdResolver(std::string binary)
    : binary_(std::move(binary)) {}

std::string DockerIdResolver::resolve(const std::string& name_or_id) {
    auto output = run_capture(binary_, name_or_id);
    if (!output) {
        spdlog::debug("{} inspect failed for {}, using it as the container ID", binary_, name_or_id);
        return name_or_id;
    }

    std::string id = core::trim(*output);
    if (id.empty()) {
        // An empty ID would match every cgroup directory by substring
        spdlog::debug("{} inspect returned no ID for {}, using it as the container ID",
                      binary_, name_or_id);
        return name_or_id;
    }
    return id;
}

std::string StaticIdResolver::resolve(const std::string& name_or_id) {
    auto it = ids_.find(name_or_id);
    if (it == ids_.end()) {
        return name_or_id;
    }
    return it->second;
}

} // namespace vessel::cgroup
