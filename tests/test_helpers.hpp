#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "core/conflict/conflict_resolver.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace lazycp::testing {

/// Уникальный временный каталог, удаляется вместе с фикстурой.
class ScratchDir {
public:
    ScratchDir() {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() /
                fmt::format("lazycp-test-{:08x}{:08x}", rd(), rd());
        std::filesystem::create_directories(root_);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return root_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path { return root_ / rel; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

[[nodiscard]] inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream ifs(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

[[nodiscard]] inline auto all_bytes() -> std::string {
    std::string data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<char>(255 - i));
    }
    return data;
}

/// Логгер, пишущий в строковый буфер.
class CapturingLogger {
public:
    CapturingLogger()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_st>(stream_))
        , logger_(std::make_shared<spdlog::logger>("test", sink_))
    {
        sink_->set_pattern("[%l] %v");
        logger_->set_level(spdlog::level::debug);
    }

    [[nodiscard]] auto logger() const -> std::shared_ptr<spdlog::logger> { return logger_; }
    [[nodiscard]] auto text() const -> std::string { return stream_.str(); }
    [[nodiscard]] auto contains(const std::string& needle) const -> bool {
        return stream_.str().find(needle) != std::string::npos;
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_st> sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

class RecordingProgress final : public infra::ProgressReporter {
public:
    void begin(std::uint64_t total_bytes, std::string label) override {
        ++begins;
        active = true;
        total = total_bytes;
        transferred = 0;
        labels.push_back(std::move(label));
    }

    void advance(std::uint64_t bytes, double latency_ms) override {
        advances.push_back(bytes);
        latencies.push_back(latency_ms);
        transferred += bytes;
    }

    void end() override {
        if (active) ++ends;
        active = false;
    }

    int begins = 0;
    int ends = 0;
    bool active = false;
    std::uint64_t total = 0;
    std::uint64_t transferred = 0;
    std::vector<std::string> labels;
    std::vector<std::uint64_t> advances;
    std::vector<double> latencies;
};

/// Отдаёт решения по очереди; после исчерпания очереди повторяет последнее.
class ScriptedDecisions final : public core::DecisionProvider {
public:
    ScriptedDecisions(std::initializer_list<core::ConflictDecision> decisions)
        : decisions_(decisions)
    {}

    auto decide(const std::filesystem::path& dest) -> core::ConflictDecision override {
        asked.push_back(dest);
        if (decisions_.size() > 1) {
            auto next = decisions_.front();
            decisions_.pop_front();
            return next;
        }
        return decisions_.empty() ? core::ConflictDecision::Abort : decisions_.front();
    }

    std::vector<std::filesystem::path> asked;

private:
    std::deque<core::ConflictDecision> decisions_;
};

} // namespace lazycp::testing
