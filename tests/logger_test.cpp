#include <gtest/gtest.h>
#include "logger.hpp"
#include <sstream>

TEST(LoggerTest, DefaultLevels) {
    std::ostringstream out, err;
    logging::Logger logger({}, out, err);

    logger.info("hello");
    logger.debug("details");
    logger.verbose("noise");
    logger.error("boom");

    std::string text = out.str();
    EXPECT_NE(text.find("syncbox: "), std::string::npos);
    EXPECT_NE(text.find(" info logger_test.cpp "), std::string::npos);
    EXPECT_NE(text.find(": hello\n"), std::string::npos);
    EXPECT_NE(text.find(" debug logger_test.cpp "), std::string::npos);
    EXPECT_NE(text.find(": details\n"), std::string::npos);
    EXPECT_EQ(text.find("noise"), std::string::npos);
    EXPECT_EQ(text.find("boom"), std::string::npos);
    EXPECT_NE(err.str().find(" error logger_test.cpp "), std::string::npos);
    EXPECT_NE(err.str().find(": boom\n"), std::string::npos);
}

TEST(LoggerTest, EntriesNameTheCallSite) {
    std::ostringstream out, err;
    logging::Logger logger({}, out, err);

    int line = __LINE__ + 1;
    logger.info("located");

    std::string expected = " info logger_test.cpp " + std::to_string(line) + ": located\n";
    EXPECT_NE(out.str().find(expected), std::string::npos) << out.str();
}

TEST(LoggerTest, LevelsAreIndependent) {
    std::ostringstream out, err;
    logging::LogOptions options;
    options.prefix = "test";
    options.info = false;
    options.error = false;
    options.debug = false;
    options.verbose = true;
    logging::Logger logger(options, out, err);

    logger.info("hidden");
    logger.error("hidden");
    logger.debug("hidden");
    logger.verbose("shown");

    EXPECT_EQ(out.str().rfind("test: ", 0), 0u);
    EXPECT_NE(out.str().find(": shown\n"), std::string::npos);
    EXPECT_NE(out.str().find(" verbose "), std::string::npos);
    EXPECT_EQ(out.str().find("hidden"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}
