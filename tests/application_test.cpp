#include "application.hpp"
#include "paths.hpp"
#include "signals.hpp"
#include "socket.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace lss {

using test::TempDir;
using test::http_get;

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_cwd_ = fs::current_path();
        dir_.write("index.html", "<h1>app</h1>");
        dir_.write("app.js", "console.log('app');");

        config_.server.port = 0;
        config_.server.root = dir_.path().string();
    }

    void TearDown() override {
        restore_default_handlers();
        shutdown_.store(true);
        if (result_.valid()) {
            result_.wait();
        }
        app_.reset();
        fs::current_path(saved_cwd_);
    }

    // Runs the application on a background thread and waits until it serves
    Application& start(BrowserOpener opener, const fs::path& default_root) {
        app_ = std::make_unique<Application>(config_, std::move(opener), default_root);
        Application& app = *app_;
        result_ = std::async(std::launch::async, [&app, this] { return app.run(shutdown_); });
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (app.port() == 0 && std::chrono::steady_clock::now() < deadline &&
               result_.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
        }
        return app;
    }

    // Requests shutdown and returns the exit code
    int finish() {
        shutdown_.store(true);
        if (result_.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            ADD_FAILURE() << "application did not stop";
            return -1;
        }
        return result_.get();
    }

    fs::path saved_cwd_;
    TempDir dir_;
    AppConfig config_;
    std::atomic<bool> shutdown_{false};
    std::unique_ptr<Application> app_;
    std::future<int> result_;
};

TEST_F(ApplicationTest, ServesAndShutsDownWithExitCodeZero) {
    std::string opened;
    Application& app = start([&opened](const std::string& url) { opened = url; }, dir_.path());
    uint16_t port = app.port();
    ASSERT_NE(port, 0);

    auto resp = http_get(port, "/app.js");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.header("content-type"), "application/javascript");
    EXPECT_EQ(resp.header("cache-control"), "public, max-age=0");
    EXPECT_EQ(resp.body, "console.log('app');");
    EXPECT_EQ(opened, "http://127.0.0.1:" + std::to_string(port));

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(finish(), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(app.port(), 0);

    // Socket released: the same port can be bound again right away
    EXPECT_FALSE(test::can_connect(port));
    EXPECT_NO_THROW(bind_listener("127.0.0.1", port, 1));
}

TEST_F(ApplicationTest, WorkingDirectoryBecomesRoot) {
    Application& app = start(nullptr, "/nonexistent");
    ASSERT_NE(app.port(), 0);
    EXPECT_EQ(fs::current_path(), dir_.path());

    EXPECT_EQ(finish(), 0);
}

TEST_F(ApplicationTest, EmptyRootFallsBackToProgramDirectory) {
    config_.server.root.clear();
    Application& app = start(nullptr, dir_.path());
    ASSERT_NE(app.port(), 0);
    EXPECT_EQ(http_get(app.port(), "/").body, "<h1>app</h1>");

    EXPECT_EQ(finish(), 0);
}

TEST_F(ApplicationTest, BrowserFailureDoesNotStopServing) {
    bool attempted = false;
    Application& app = start([&attempted](const std::string&) {
        attempted = true;
        throw BrowserError("no browser installed");
    }, dir_.path());
    ASSERT_NE(app.port(), 0);
    EXPECT_TRUE(attempted);

    EXPECT_EQ(http_get(app.port(), "/").status, 200);

    EXPECT_EQ(finish(), 0);
}

TEST_F(ApplicationTest, BrowserNotOpenedWhenDisabled) {
    config_.browser.open_on_start = false;
    bool attempted = false;
    Application& app = start([&attempted](const std::string&) { attempted = true; }, dir_.path());
    ASSERT_NE(app.port(), 0);
    EXPECT_FALSE(attempted);

    EXPECT_EQ(finish(), 0);
}

TEST_F(ApplicationTest, PortInUseExitsWithOne) {
    UniqueFd busy = bind_listener("127.0.0.1", 0, 1);
    config_.server.port = local_port(busy.get());

    bool attempted = false;
    Application& app = start([&attempted](const std::string&) { attempted = true; }, dir_.path());
    ASSERT_EQ(result_.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result_.get(), 1);
    EXPECT_EQ(app.port(), 0);
    EXPECT_FALSE(attempted);
}

TEST_F(ApplicationTest, MissingRootExitsWithOne) {
    config_.server.root = (dir_.path() / "missing").string();
    Application app(config_, nullptr, dir_.path());
    EXPECT_EQ(app.run(shutdown_), 1);
}

TEST_F(ApplicationTest, ConfiguredMimeOverridesReachHandler) {
    config_.mime.overrides[".js"] = "text/javascript";
    dir_.write("data.custom", "x");
    config_.mime.overrides[".custom"] = "application/x-custom";

    Application& app = start(nullptr, dir_.path());
    ASSERT_NE(app.port(), 0);
    EXPECT_EQ(http_get(app.port(), "/app.js").header("content-type"), "text/javascript");
    EXPECT_EQ(http_get(app.port(), "/data.custom").header("content-type"), "application/x-custom");

    EXPECT_EQ(finish(), 0);
}

TEST_F(ApplicationTest, InterruptSignalStopsWithExitCodeZero) {
    install_shutdown_handlers(shutdown_);
    Application& app = start(nullptr, dir_.path());
    uint16_t port = app.port();
    ASSERT_NE(port, 0);
    EXPECT_EQ(http_get(port, "/").status, 200);

    std::raise(SIGINT);
    ASSERT_EQ(result_.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(result_.get(), 0);
    EXPECT_FALSE(test::can_connect(port));
    EXPECT_NO_THROW(bind_listener("127.0.0.1", port, 1));
}

TEST_F(ApplicationTest, TerminateSignalStopsWithExitCodeZero) {
    install_shutdown_handlers(shutdown_);
    Application& app = start(nullptr, dir_.path());
    ASSERT_NE(app.port(), 0);

    std::raise(SIGTERM);
    ASSERT_EQ(result_.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(result_.get(), 0);
}

TEST(ExecutableDirTest, PointsAtDirectoryHoldingTheBinary) {
    fs::path dir = executable_dir(nullptr);
    EXPECT_TRUE(dir.is_absolute());
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(fs::exists(dir / fs::read_symlink("/proc/self/exe").filename()));
}

} // namespace lss
