#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <polyexec/file_contents.hh>
#include <polyexec/logger.hh>
#include <polyexec/temporary_directory.hh>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using std::string;
using ::testing::ContainsRegex;
using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(Logger, labeled_line) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-logger-test.XXXXXX");
    auto log_path = tmp_dir.path() + "log";
    {
        Logger logger{log_path};
        logger("Workspace ", "abc", ": ", 42, " ms");
    }
    EXPECT_THAT(
        get_file_contents(log_path),
        MatchesRegex(R"(\[ [0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2} \] Workspace abc: 42 ms)"
                     "\n")
    );
}

// NOLINTNEXTLINE
TEST(Logger, without_label) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-logger-test.XXXXXX");
    auto log_path = tmp_dir.path() + "log";
    {
        Logger logger{log_path};
        EXPECT_TRUE(logger.label(false));
        EXPECT_FALSE(logger.label());
        logger("a");
        logger("b")("c", 'd');
    }
    EXPECT_EQ(get_file_contents(log_path), "a\nbcd\n");
}

// NOLINTNEXTLINE
TEST(Logger, appends_to_existing_file) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-logger-test.XXXXXX");
    auto log_path = tmp_dir.path() + "log";
    put_file_contents(log_path, "old\n");
    Logger logger{stderr};
    logger.open(log_path);
    logger.label(false);
    logger("new");
    EXPECT_EQ(get_file_contents(log_path), "old\nnew\n");
}

// NOLINTNEXTLINE
TEST(Logger, open_failure) {
    Logger logger{nullptr};
    EXPECT_THROW(logger.open("/nonexistent-dir/polyexec/log"), std::runtime_error);
    EXPECT_NO_THROW(logger("dummy logger ignores this"));
}

// NOLINTNEXTLINE
TEST(Logger, concurrent_lines_are_not_interleaved) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-logger-test.XXXXXX");
    auto log_path = tmp_dir.path() + "log";
    constexpr int THREADS = 8;
    constexpr int LINES = 200;
    {
        Logger logger{log_path};
        logger.label(false);
        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&logger, t] {
                for (int i = 0; i < LINES; ++i) {
                    logger("thread ", t, " line ", i);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    auto contents = get_file_contents(log_path);
    size_t lines = 0;
    size_t pos = 0;
    while (pos < contents.size()) {
        auto end = contents.find('\n', pos);
        ASSERT_NE(end, string::npos);
        EXPECT_THAT(contents.substr(pos, end - pos), MatchesRegex("thread [0-9] line [0-9]+"));
        pos = end + 1;
        ++lines;
    }
    EXPECT_EQ(lines, static_cast<size_t>(THREADS * LINES));
    EXPECT_THAT(contents, ContainsRegex("thread 7 line 199"));
}
