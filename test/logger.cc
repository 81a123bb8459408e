#include <enginebox/file_contents.hh>
#include <enginebox/logger.hh>
#include <enginebox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <regex>
#include <stdexcept>

// NOLINTNEXTLINE
TEST(logger, writes_timestamped_lines) {
    TemporaryDirectory tmp{"/tmp/enginebox-test.XXXXXX"};
    auto path = tmp.path() + "/log";
    {
        Logger logger{stderr};
        logger.use(path);
        logger("worker [", 42, "] finished: ", "SUCCESS");
        logger('x', ' ', true, ' ', 15U);
    }
    auto contents = get_file_contents(path);
    std::regex line{R"(\[ \d{4}-\d\d-\d\d \d\d:\d\d:\d\d\.\d{6} \] )"};
    auto first_end = contents.find('\n');
    ASSERT_NE(first_end, std::string::npos);
    auto first = contents.substr(0, first_end);
    auto second = contents.substr(first_end + 1);
    ASSERT_TRUE(std::regex_search(first, line)) << first;
    ASSERT_TRUE(first.ends_with("] worker [42] finished: SUCCESS")) << first;
    ASSERT_TRUE(second.ends_with("] x true 15\n")) << second;
}

// NOLINTNEXTLINE
TEST(logger, appends) {
    TemporaryDirectory tmp{"/tmp/enginebox-test.XXXXXX"};
    auto path = tmp.path() + "/log";
    put_file_contents(path, "previous\n");
    Logger logger{stderr};
    logger.use(path);
    logger("next");
    logger.use(stderr); // closes the file
    ASSERT_TRUE(get_file_contents(path).starts_with("previous\n["));
}

// NOLINTNEXTLINE
TEST(logger, use_nonexistent_path_throws) {
    Logger logger{stderr};
    ASSERT_THROW(logger.use("/nonexistent/dir/log"), std::runtime_error);
}
