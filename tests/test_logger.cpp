#include "gtest/gtest.h"

#include "../log.hpp"
#include "test_helpers.hpp"


TEST(Logger, FileSinkFiltersByLevel) {
    TempDir dir;
    const auto path = dir.path() + "/var/log/grubpower.log";
    EXPECT_FALSE(logger_setup_file(path.c_str(), log_level_t::INFO));

    ASSERT_TRUE(logger_setup_file((dir.path() + "/grubpower.log").c_str(), log_level_t::INFO));
    LOG_INFO("battery at %d%%", 42);
    LOG_DEBUG("not written");
    logger_setup(log_type_t::PRINTF, log_level_t::INFO);

    const auto content = dir.read("grubpower.log");
    EXPECT_NE(content.find("[INFO] battery at 42%\n"), std::string::npos);
    EXPECT_EQ(content.find("not written"), std::string::npos);
}
