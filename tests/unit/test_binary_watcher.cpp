#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <unistd.h>
#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include "wrappee/binary_watcher.hpp"

namespace {

using wrapmcp::core::errors::ErrorCategory;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::is_error;
using wrapmcp::testing::LineCollector;
using wrapmcp::wrappee::BinaryWatcher;
using wrapmcp::wrappee::FileChange;
using namespace std::chrono_literals;

class BinaryWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("wrapmcp_watch_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        target_ = dir_ / "server";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void write_target(const std::string& content) {
        std::ofstream out(target_, std::ios::trunc);
        out << content;
    }

    std::unique_ptr<BinaryWatcher> watch() {
        auto watcher = std::make_unique<BinaryWatcher>(
            target_,
            [events = events_](const FileChange change) {
                events->add(wrapmcp::wrappee::to_string(change));
            },
            20ms);
        EXPECT_FALSE(is_error(watcher->start()));
        return watcher;
    }

    std::filesystem::path dir_;
    std::filesystem::path target_;
    std::shared_ptr<LineCollector> events_ = std::make_shared<LineCollector>();
};

TEST_F(BinaryWatcherTest, RejectsRelativePath) {
    BinaryWatcher watcher("bin/server", [](FileChange) {});
    const auto started = watcher.start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::FileWatch);
    EXPECT_EQ(get_error(started).code, "relative_watch_path");
}

TEST_F(BinaryWatcherTest, RejectsMissingDirectory) {
    BinaryWatcher watcher(dir_ / "missing" / "server", [](FileChange) {});
    const auto started = watcher.start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "watch_dir_missing");
}

TEST_F(BinaryWatcherTest, ReportsCreation) {
    auto watcher = watch();
    write_target("v1");
    EXPECT_TRUE(events_->wait_for_line(wrapmcp::wrappee::to_string(FileChange::Created)));
}

TEST_F(BinaryWatcherTest, ReportsModificationAndRemoval) {
    write_target("v1");
    auto watcher = watch();

    write_target("version two");
    EXPECT_TRUE(events_->wait_for_line(wrapmcp::wrappee::to_string(FileChange::Modified)));

    std::filesystem::remove(target_);
    EXPECT_TRUE(events_->wait_for_line(wrapmcp::wrappee::to_string(FileChange::Removed)));
}

TEST_F(BinaryWatcherTest, QuietFileReportsNothing) {
    write_target("v1");
    auto watcher = watch();
    std::this_thread::sleep_for(150ms);
    watcher->stop();
    EXPECT_TRUE(events_->lines().empty());
}

}  // namespace
