// modules/tail/live_tail.cpp
#include "modules/tail/live_tail.h"
#include "modules/parser/span_parser.h"
#include "common/utils/log.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace agenttrace {

namespace {

std::optional<uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

} // namespace

TailResult poll_trace_file(const std::string& path, uint64_t last_offset) {
    TailResult result;
    result.new_offset = last_offset;

    auto size = file_size(path);
    if (!size || *size <= last_offset) return result;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        log_debug("Live tail: cannot open " + path);
        return result;
    }
    file.seekg(static_cast<std::streamoff>(last_offset));
    if (!file) return result;

    std::string chunk(*size - last_offset, '\0');
    file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<std::size_t>(file.gcount()));

    auto last_newline = chunk.rfind('\n');
    if (last_newline == std::string::npos) return result;

    result.spans = SpanParser{}.parse_from_string(std::string_view(chunk).substr(0, last_newline + 1));
    result.new_offset = last_offset + last_newline + 1;
    return result;
}

LiveTailMonitor::LiveTailMonitor(std::string path) : path_(std::move(path)) {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) return;
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    offset_ = SpanParser{}.consumed_length(content);
}

LiveTailMonitor::LiveTailMonitor(std::string path, uint64_t start_offset)
    : path_(std::move(path)), offset_(start_offset) {}

std::vector<Span> LiveTailMonitor::poll() {
    auto result = poll_trace_file(path_, offset_);
    offset_ = result.new_offset;
    return std::move(result.spans);
}

} // namespace agenttrace
