/**
 * Streams records into a single JSON array file.
 *
 * The file is truncated on open and flushed after every record, so a reader
 * tailing it sees complete objects. The closing bracket is only written by
 * close(); a file from a process that was killed is missing it.
 */
#pragma once
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace vessel::output {

class JsonArrayWriter {
public:
    // Throws OutputError if the file cannot be created.
    static JsonArrayWriter open(const std::filesystem::path& path);

    JsonArrayWriter(JsonArrayWriter&& other) noexcept;
    JsonArrayWriter& operator=(JsonArrayWriter&& other) = delete;
    ~JsonArrayWriter();

    // Non-copyable
    JsonArrayWriter(const JsonArrayWriter&) = delete;
    JsonArrayWriter& operator=(const JsonArrayWriter&) = delete;

    // Append one element and flush. Throws OutputError on write failure.
    void append(const nlohmann::ordered_json& record);

    // Terminate the array. Safe to call more than once.
    void close();

    const std::filesystem::path& path() const { return path_; }
    size_t count() const { return count_; }
    bool is_open() const { return open_; }

private:
    JsonArrayWriter(std::filesystem::path path, std::ofstream file);

    std::filesystem::path path_;
    std::ofstream file_;
    size_t count_ = 0;
    bool open_ = false;
};

} // namespace vessel::output
