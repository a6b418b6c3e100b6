#include "output/json_array_writer.hpp"
#include "core/error.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace vessel::output {

namespace {

// Pretty JSON with every line shifted right by two spaces
std::string indent_record(const nlohmann::ordered_json& record) {
    std::istringstream lines(record.dump(2));
    std::string out;
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!first) out += '\n';
        out += "  ";
        out += line;
        first = false;
    }
    return out;
}

} // namespace

JsonArrayWriter JsonArrayWriter::open(const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw OutputError("Failed to open output file: " + path.string());
    }
    file << "[\n";
    file.flush();
    if (!file) {
        throw OutputError("Failed to write output file: " + path.string());
    }
    return JsonArrayWriter(path, std::move(file));
}

JsonArrayWriter::JsonArrayWriter(std::filesystem::path path, std::ofstream file)
    : path_(std::move(path)), file_(std::move(file)), open_(true) {}

JsonArrayWriter::JsonArrayWriter(JsonArrayWriter&& other) noexcept
    : path_(std::move(other.path_)),
      file_(std::move(other.file_)),
      count_(other.count_),
      open_(other.open_) {
    other.open_ = false;
}

JsonArrayWriter::~JsonArrayWriter() {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Failed to finalize {}: {}", path_.string(), e.what());
    }
}

void JsonArrayWriter::append(const nlohmann::ordered_json& record) {
    if (!open_) {
        throw OutputError("Output file is closed: " + path_.string());
    }
    if (count_ > 0) {
        file_ << ",\n";
    }
    file_ << indent_record(record);
    file_.flush();
    if (!file_) {
        throw OutputError("Failed to write output file: " + path_.string());
    }
    ++count_;
}

void JsonArrayWriter::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    file_ << "\n]\n";
    file_.flush();
    bool ok = static_cast<bool>(file_);
    file_.close();
    if (!ok) {
        throw OutputError("Failed to write output file: " + path_.string());
    }
}

} // namespace vessel::output
