/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace lineproto_csv {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::filesystem::create_directories(log_dir_);

    std::error_code ec;
    const auto existing = std::filesystem::file_size(active_path(), ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(active_path(), std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::active_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::generation_path(uint32_t generation) const {
    return log_dir_ / (prefix_ + "." + std::to_string(generation) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (max_file_size_bytes_ == 0 || current_size_ == 0) return;
    if (current_size_ + incoming <= max_file_size_bytes_) return;
    rotate();
}

void JsonFileSink::rotate() {
    current_file_.close();

    auto report = [this](const std::error_code& ec) {
        if (ec) {
            std::cerr << "log rotation failed for " << active_path().string()
                      << ": " << ec.message() << '\n';
        }
    };

    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(active_path(), ec);
        report(ec);
    } else {
        std::filesystem::remove(generation_path(max_files_), ec);
        report(ec);
        for (uint32_t gen = max_files_; gen > 1; --gen) {
            if (std::filesystem::exists(generation_path(gen - 1), ec)) {
                std::filesystem::rename(generation_path(gen - 1), generation_path(gen), ec);
                report(ec);
            }
        }
        std::filesystem::rename(active_path(), generation_path(1), ec);
        report(ec);
    }

    current_file_.open(active_path(), std::ios::trunc);
    current_size_ = 0;
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

// ── MemorySink ───────────────────────────────

void MemorySink::write(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    lines_.emplace_back(json_line);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(mutex_);
    return lines_;
}

size_t MemorySink::count_containing(std::string_view needle) const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& line : lines_) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

}  // namespace lineproto_csv
