#pragma once

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

namespace langextract::test {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "langextract_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

// Base fixture: quiet logging, per-test scratch directory created on demand
class LangExtractTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    void TearDown() override {
        if (!tempDir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(tempDir_, ec);
        }
    }

    const std::filesystem::path& tempDir() {
        if (tempDir_.empty()) {
            tempDir_ = make_temp_dir();
        }
        return tempDir_;
    }

private:
    std::filesystem::path tempDir_;
};

} // namespace langextract::test
