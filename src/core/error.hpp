#pragma once
#include <stdexcept>
#include <string>

namespace vessel {

// Base for every error vessel raises
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No cgroup directory matched the container after all search strategies
class NotFoundError : public Error {
public:
    using Error::Error;
};

// A mandatory accounting file was missing, unreadable or not numeric
class RequiredFileError : public Error {
public:
    RequiredFileError(const std::string& path, const std::string& reason)
        : Error("Failed to read " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// cgroup v2 mount root is absent
class CgroupRootError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class OutputError : public Error {
public:
    using Error::Error;
};

} // namespace vessel
