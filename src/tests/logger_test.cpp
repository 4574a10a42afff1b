#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using namespace stash;

class LoggerTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    fs::path log_file_;

    void SetUp() override {
        test_dir_ = make_test_dir("stash_logger_test");
        log_file_ = test_dir_ / "logs" / "stash.log";
        logger::init_logging(log_file_.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        fs::remove_all(test_dir_);
        init_logging();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file_);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, WritesToFile) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(fs::exists(log_file_));
    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    logger::set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(logger::parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(logger::parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(logger::parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(logger::parse_severity("loud"), std::invalid_argument);
}
