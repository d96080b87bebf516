#include "test_framework.hpp"
#include "sv/core/config.hpp"
#include "sv/core/log.hpp"
#include <cstdlib>
#include <string>
#include <vector>

using sv::config::LogLevel;

TEST("config/parse_log_level") {
    using sv::config::_parse_level;
    ASSERT_EQ(_parse_level("debug", LogLevel::Warn), LogLevel::Debug);
    ASSERT_EQ(_parse_level("INFO", LogLevel::Warn), LogLevel::Info);
    ASSERT_EQ(_parse_level("Error", LogLevel::Warn), LogLevel::Error);
    ASSERT_EQ(_parse_level("0", LogLevel::Warn), LogLevel::Off);
    ASSERT_EQ(_parse_level("4", LogLevel::Off), LogLevel::Debug);
    ASSERT_EQ(_parse_level("verbose", LogLevel::Info), LogLevel::Info);
    ASSERT_EQ(_parse_level("", LogLevel::Error), LogLevel::Error);
    ASSERT_EQ(_parse_level(nullptr, LogLevel::Warn), LogLevel::Warn);
}

TEST("config/scoped_config_restores") {
    const auto lv = sv::config::log_level();
    const bool warn = sv::config::warn_on_write_enabled();
    {
        sv::config::ScopedConfig keep;
        sv::config::set_log_level(LogLevel::Debug);
        sv::config::set_warn_on_write(!warn);
        ASSERT_EQ(sv::config::log_level(), LogLevel::Debug);
        ASSERT_EQ(sv::config::warn_on_write_enabled(), !warn);
    }
    ASSERT_EQ(sv::config::log_level(), lv);
    ASSERT_EQ(sv::config::warn_on_write_enabled(), warn);
}

TEST("config/reload_reads_environment") {
    sv::config::ScopedConfig keep;
    const char* old_lv = std::getenv("SV_LOG_LEVEL");
    const char* old_w = std::getenv("SV_WARN_ON_WRITE");
    const std::string saved_lv = old_lv ? old_lv : "";
    const std::string saved_w = old_w ? old_w : "";

    ::setenv("SV_LOG_LEVEL", "info", 1);
    ::setenv("SV_WARN_ON_WRITE", "0", 1);
    sv::config::reload();
    ASSERT_EQ(sv::config::log_level(), LogLevel::Info);
    ASSERT_FALSE(sv::config::warn_on_write_enabled());

    ::unsetenv("SV_LOG_LEVEL");
    ::unsetenv("SV_WARN_ON_WRITE");
    sv::config::reload();
    ASSERT_EQ(sv::config::log_level(), LogLevel::Warn);
    ASSERT_TRUE(sv::config::warn_on_write_enabled());

    if (old_lv) ::setenv("SV_LOG_LEVEL", saved_lv.c_str(), 1);
    if (old_w) ::setenv("SV_WARN_ON_WRITE", saved_w.c_str(), 1);
}

TEST("log/level_filtering_and_sink") {
    sv::config::ScopedConfig keep;
    std::vector<std::pair<LogLevel, std::string>> got;
    sv::log::ScopedSink capture([&](LogLevel lv, const std::string& m) { got.emplace_back(lv, m); });

    sv::config::set_log_level(LogLevel::Warn);
    SV_LOG_ERROR("e %d", 1);
    SV_LOG_WARN("w %s", "x");
    SV_LOG_INFO("hidden");
    SV_LOG_DEBUG("hidden %d", 2);
    ASSERT_EQ(got.size(), 2u);
    ASSERT_EQ(got[0].first, LogLevel::Error);
    ASSERT_EQ(got[0].second, std::string("e 1"));
    ASSERT_EQ(got[1].second, std::string("w x"));

    sv::config::set_log_level(LogLevel::Debug);
    SV_LOG_DEBUG("d");
    ASSERT_EQ(got.size(), 3u);
    ASSERT_EQ(got[2].first, LogLevel::Debug);

    sv::config::set_log_level(LogLevel::Off);
    SV_LOG_ERROR("silent");
    ASSERT_EQ(got.size(), 3u);
    ASSERT_FALSE(sv::log::enabled(LogLevel::Error));
}

TEST("log/level_tags") {
    ASSERT_EQ(std::string(sv::log::level_tag(LogLevel::Warn)), std::string("WARN"));
    ASSERT_EQ(std::string(sv::log::level_tag(LogLevel::Debug)), std::string("DEBUG"));
    ASSERT_EQ(std::string(sv::log::level_tag(LogLevel::Off)), std::string("OFF"));
}

TEST("log/long_lines_are_not_truncated") {
    sv::config::ScopedConfig keep;
    sv::config::set_log_level(LogLevel::Warn);
    std::string got;
    sv::log::ScopedSink capture([&](LogLevel, const std::string& m) { got = m; });

    const std::string big(2000, 'x');
    SV_LOG_WARN("<%s>", big.c_str());
    ASSERT_EQ(got.size(), big.size() + 2);
    ASSERT_EQ(got, "<" + big + ">");

    SV_LOG_WARN("short %d", 5);
    ASSERT_EQ(got, std::string("short 5"));
}
