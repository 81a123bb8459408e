#include "tree_snapshot.hh"

#include <climits>
#include <enginebox/config.hh>
#include <enginebox/file_contents.hh>
#include <enginebox/file_manip.hh>
#include <enginebox/sandbox.hh>
#include <enginebox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>

using enginebox::Config;
using enginebox::EngineResponseStatus;
using enginebox::Sandbox;
using nlohmann::json;
using std::string;
using std::chrono_literals::operator""s;

namespace {

class sandbox : public ::testing::Test {
protected:
    TemporaryDirectory tmp{"/tmp/enginebox-test.XXXXXX"};
    std::string cache = tmp.path() + "/cache";
    std::string root = tmp.path() + "/root";
    Config config{
        .sandbox_memory_limit = 512000,
        .cache_path = root,
        .sandbox_run_time = 10s,
        .worker_interpreter = std::nullopt,
        .keep_output_on_timeout = false,
    };

    void SetUp() override {
        ASSERT_EQ(mkdir_r(cache + "/node_modules/dep"), 0);
        put_file_contents(cache + "/package.json", R"({"name": "engine"})");
        put_file_contents(cache + "/node_modules/dep/index.js", "module.exports = {};\n");
        write_entry(R"(echo '{"type":"stdout","message":"hello"}' >&3
echo leftover > output.txt
mkdir -p results/1
echo '{"type":"result","message":{"status":"SUCCESS","response":{"ok":true}}}' >&3
)");
    }

    void write_entry(const std::string& body) {
        put_file_contents(cache + "/main.js", "#!/bin/sh\n" + body, 0755);
    }

    static std::set<string> entry_names(const std::string& dir) {
        std::set<string> res;
        for (const auto& [path, descr] : tree_snapshot(dir)) {
            if (path.find('/') == string::npos) {
                res.emplace(path);
            }
        }
        return res;
    }
};

} // namespace

// NOLINTNEXTLINE
TEST_F(sandbox, hello) {
    Sandbox box{"abc", config};
    box.use_cache("v1", cache);
    auto res = box.run_operation("abc", json::object());
    ASSERT_EQ(res.verdict, EngineResponseStatus::Success);
    ASSERT_EQ(res.output, json({{"ok", true}}));
    ASSERT_EQ(res.standard_output, "hello");
    ASSERT_EQ(res.standard_error, "");
}

// NOLINTNEXTLINE
TEST_F(sandbox, folder_path) {
    ASSERT_EQ(Sandbox("abc", config).folder_path(), root + "/sandbox/abc");

    config.cache_path = root + "//";
    ASSERT_EQ(Sandbox("abc", config).folder_path(), root + "/sandbox/abc");

    config.cache_path = "/";
    ASSERT_EQ(Sandbox("abc", config).folder_path(), "/sandbox/abc");

    char cwd[PATH_MAX];
    ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
    config.cache_path = "relative/root";
    ASSERT_EQ(
        Sandbox("abc", config).folder_path(), string{cwd} + "/relative/root/sandbox/abc");
}

// NOLINTNEXTLINE
TEST_F(sandbox, default_root_is_executable_directory) {
    char exe[PATH_MAX];
    auto len = readlink("/proc/self/exe", exe, sizeof(exe));
    ASSERT_GT(len, 0);
    auto exe_path = string(exe, static_cast<size_t>(len));
    auto exe_dir = exe_path.substr(0, exe_path.rfind('/'));

    config.cache_path = std::nullopt;
    ASSERT_EQ(Sandbox("abc", config).folder_path(), exe_dir + "/sandbox/abc");
}

// NOLINTNEXTLINE
TEST_F(sandbox, invalid_box_id) {
    for (auto id : {"", ".", "..", "a/b", "/abc"}) {
        ASSERT_THROW((void)Sandbox(id, config), std::invalid_argument) << id;
    }
}

// NOLINTNEXTLINE
TEST_F(sandbox, resource_limits) {
    Sandbox box{"abc", config};
    ASSERT_EQ(box.resource_limits().max_old_generation_size_mb, 500U);
    ASSERT_EQ(box.resource_limits().max_young_generation_size_mb, 500U);
    ASSERT_EQ(box.resource_limits().stack_size_mb, 500U);
}

// NOLINTNEXTLINE
TEST_F(sandbox, run_before_setup_throws) {
    Sandbox box{"abc", config};
    ASSERT_THROW(box.run_operation("abc", json::object()), std::logic_error);
}

// NOLINTNEXTLINE
TEST_F(sandbox, setup_cache_without_cache_path) {
    Sandbox box{"abc", config};
    box.setup_cache(true);
    ASSERT_TRUE(tree_snapshot(box.folder_path()).empty());
    // Running is allowed, although there is nothing to run
    auto res = box.run_operation("abc", json::object());
    ASSERT_EQ(res.verdict, EngineResponseStatus::Error);
    ASSERT_EQ(res.output, json::object());
}

// NOLINTNEXTLINE
TEST_F(sandbox, clean_up_keeps_only_engine_files) {
    Sandbox box{"abc", config};
    box.use_cache("v1", cache);
    put_file_contents(box.folder_path() + "/main.js.map", "{}");
    ASSERT_EQ(mkdir_r(box.folder_path() + "/codes"), 0);
    ASSERT_EQ(box.run_operation("abc", json::object()).verdict, EngineResponseStatus::Success);
    ASSERT_EQ(
        entry_names(box.folder_path()),
        (std::set<string>{
            "codes", "main.js", "main.js.map", "node_modules", "output.txt", "package.json",
            "results"}));

    box.clean_up();
    ASSERT_EQ(
        entry_names(box.folder_path()),
        (std::set<string>{"codes", "main.js", "main.js.map", "node_modules", "package.json"}));
    box.clean_up(); // idempotent
    ASSERT_EQ(entry_names(box.folder_path()).size(), 5U);
}

// NOLINTNEXTLINE
TEST_F(sandbox, clean_up_of_missing_directory) {
    Sandbox box{"abc", config};
    box.clean_up();
    ASSERT_EQ(access(box.folder_path().c_str(), F_OK), -1);
}

// NOLINTNEXTLINE
TEST_F(sandbox, same_cache_key_is_not_copied_again) {
    Sandbox box{"abc", config};
    box.use_cache("v1", cache);
    put_file_contents(box.folder_path() + "/marker", "");
    write_entry("exit 1\n"); // snapshot changes, but its key does not

    box.use_cache("v1", cache);
    ASSERT_EQ(access((box.folder_path() + "/marker").c_str(), F_OK), 0);
    ASSERT_EQ(box.run_operation("abc", json::object()).verdict, EngineResponseStatus::Success);

    box.use_cache("v2", cache);
    ASSERT_EQ(access((box.folder_path() + "/marker").c_str(), F_OK), -1);
    ASSERT_EQ(tree_snapshot(box.folder_path()), tree_snapshot(cache));
    ASSERT_EQ(box.run_operation("abc", json::object()).verdict, EngineResponseStatus::Error);
    ASSERT_EQ(box.cache_key(), "v2");
    ASSERT_EQ(box.cache_path(), cache);
}

// NOLINTNEXTLINE
TEST_F(sandbox, failed_setup_is_not_trusted) {
    Sandbox box{"abc", config};
    box.use_cache("v1", cache);

    ASSERT_THROW(box.use_cache("v2", tmp.path() + "/nonexistent"), std::runtime_error);
    ASSERT_THROW(box.run_operation("abc", json::object()), std::logic_error);

    // The same key is copied again, since the last setup did not succeed
    box.use_cache("v2", cache);
    ASSERT_EQ(tree_snapshot(box.folder_path()), tree_snapshot(cache));
    ASSERT_EQ(box.run_operation("abc", json::object()).verdict, EngineResponseStatus::Success);
}

// NOLINTNEXTLINE
TEST_F(sandbox, slots_are_independent) {
    Sandbox a{"a", config};
    Sandbox b{"b", config};
    a.use_cache("v1", cache);
    b.use_cache("v1", cache);
    ASSERT_EQ(a.run_operation("abc", json::object()).verdict, EngineResponseStatus::Success);
    a.clean_up();
    ASSERT_EQ(access((b.folder_path() + "/main.js").c_str(), F_OK), 0);
    ASSERT_EQ(access((a.folder_path() + "/output.txt").c_str(), F_OK), -1);
}

// NOLINTNEXTLINE
TEST_F(sandbox, timeout) {
    config.sandbox_run_time = 1s;
    write_entry("echo partial\nsleep 100\n");
    Sandbox box{"abc", config};
    box.use_cache("v1", cache);
    auto res = box.run_operation("abc", json::object());
    ASSERT_EQ(res.verdict, EngineResponseStatus::Timeout);
    ASSERT_EQ(res.output, json::object());
    ASSERT_EQ(res.standard_output, "");
    ASSERT_GE(res.time_in_seconds, 1);
}

// NOLINTNEXTLINE
TEST_F(sandbox, interpreter) {
    put_file_contents(cache + "/main.js", R"(echo "$0"
echo '{"type":"result","message":{"status":"SUCCESS"}}' >&3
)");
    config.worker_interpreter = "sh";
    Sandbox box{"abc", config};
    box.use_cache("v1", cache);
    auto res = box.run_operation("abc", json::object());
    ASSERT_EQ(res.verdict, EngineResponseStatus::Success);
    ASSERT_EQ(res.standard_output, box.folder_path() + "/main.js\n");
}

// NOLINTNEXTLINE
TEST_F(sandbox, unchanged_cache_on_fresh_slot_is_set_up) {
    Sandbox box{"abc", config};
    // Leftovers of a slot with the same id, e.g. from another process
    ASSERT_EQ(mkdir_r(box.folder_path()), 0);
    put_file_contents(box.folder_path() + "/stale", "");

    box.setup_cache(false);
    ASSERT_TRUE(tree_snapshot(box.folder_path()).empty());

    put_file_contents(box.folder_path() + "/output.txt", "");
    box.setup_cache(false); // now the contents are trusted
    ASSERT_EQ(entry_names(box.folder_path()), std::set<string>{"output.txt"});
}

// NOLINTNEXTLINE
TEST_F(sandbox, unchanged_cache_after_failed_setup_is_set_up) {
    Sandbox box{"abc", config};
    ASSERT_THROW(box.use_cache("v1", tmp.path() + "/nonexistent"), std::runtime_error);
    box.use_cache("v1", cache); // same key, but the last setup failed
    ASSERT_EQ(tree_snapshot(box.folder_path()), tree_snapshot(cache));

    ASSERT_THROW(box.use_cache("v2", tmp.path() + "/nonexistent"), std::runtime_error);
    // Not a no-op: the copy from the missing path is attempted again
    ASSERT_THROW(box.setup_cache(false), std::runtime_error);
    ASSERT_THROW(box.run_operation("abc", json::object()), std::logic_error);
}
