#include "browser.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace lss {

using test::TempDir;

// Runs open_browser against a stand-in opener placed first on PATH, with
// log output captured in memory.
class OpenBrowserTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_path_ = env("PATH");
        saved_display_ = env("DISPLAY");
        saved_wayland_ = env("WAYLAND_DISPLAY");
        saved_logger_ = spdlog::default_logger();

        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
        sink_->set_pattern("%v");
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("browser-test", sink_));

        setenv("PATH", bin_.path().c_str(), 1);
        setenv("DISPLAY", ":99", 1);
        unsetenv("WAYLAND_DISPLAY");
    }

    void TearDown() override {
        restore("PATH", saved_path_);
        restore("DISPLAY", saved_display_);
        restore("WAYLAND_DISPLAY", saved_wayland_);
        spdlog::set_default_logger(saved_logger_);
    }

    void install_opener(const std::string& script) {
        fs::path p = bin_.write(kOpener, "#!/bin/sh\n" + script);
        fs::permissions(p, fs::perms::owner_all);
    }

    // True once a logged line contains `text`, polling for up to 5 s
    bool wait_for_log(const std::string& text) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            for (const auto& line : sink_->last_formatted()) {
                if (line.find(text) != std::string::npos) return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    static std::optional<std::string> env(const char* name) {
        const char* v = std::getenv(name);
        return v ? std::optional<std::string>(v) : std::nullopt;
    }

    static void restore(const char* name, const std::optional<std::string>& value) {
        if (value) {
            setenv(name, value->c_str(), 1);
        } else {
            unsetenv(name);
        }
    }

#if defined(__APPLE__)
    static constexpr const char* kOpener = "open";
#else
    static constexpr const char* kOpener = "xdg-open";
#endif

    TempDir bin_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> saved_logger_;
    std::optional<std::string> saved_path_;
    std::optional<std::string> saved_display_;
    std::optional<std::string> saved_wayland_;
};

TEST_F(OpenBrowserTest, OpenerReceivesUrl) {
    fs::path seen = bin_.path() / "seen-url";
    install_opener("echo \"$1\" > '" + seen.string() + "'\n");

    EXPECT_NO_THROW(open_browser("http://127.0.0.1:8765"));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!fs::exists(seen) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(fs::exists(seen));
}

TEST_F(OpenBrowserTest, FailingOpenerTellsUserWhereToGo) {
    install_opener("exit 3\n");

    EXPECT_NO_THROW(open_browser("http://127.0.0.1:8765"));
    EXPECT_TRUE(wait_for_log("exited with status 3"));
    EXPECT_TRUE(wait_for_log("Please open your browser and navigate to: http://127.0.0.1:8765"));
}

TEST_F(OpenBrowserTest, MissingOpenerThrows) {
    EXPECT_THROW(open_browser("http://127.0.0.1:8765"), BrowserError);
}

#if !defined(__APPLE__)
TEST_F(OpenBrowserTest, NoDisplayThrows) {
    install_opener("exit 0\n");
    unsetenv("DISPLAY");
    EXPECT_THROW(open_browser("http://127.0.0.1:8765"), BrowserError);
}
#endif

} // namespace lss
