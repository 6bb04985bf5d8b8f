/**
 * @file test_config.cpp
 * @brief Unit tests for Config, Logger and config-driven decode options
 */

#include <gtest/gtest.h>
#include "lnp_config.hpp"
#include "lnp_hex.hpp"
#include "lnp_logger.hpp"
#include "lnp_tlv.hpp"
#include "lnp_wire.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace lnp;

// ---- Config ----

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.get("log.level"), "info");
    EXPECT_TRUE(cfg.getBool("log.console"));
    EXPECT_EQ(cfg.get("log.file", "unset"), "");
    EXPECT_EQ(cfg.getUInt64("presentation.max_record_len"), 65535u);
    EXPECT_TRUE(cfg.getBool("presentation.enforce_even_odd"));
}

TEST(ConfigTest, ParsesKeyValueText) {
    Config cfg;
    cfg.clear();
    cfg.loadFromString(
        "# comment\n"
        "; another comment\n"
        "  log.level = debug  \n"
        "presentation.max_record_len=0x400\n"
        "no equals sign here\n"
        "presentation.enforce_even_odd = off\n");

    EXPECT_EQ(cfg.get("log.level"), "debug");
    EXPECT_EQ(cfg.getUInt64("presentation.max_record_len"), 1024u);
    EXPECT_FALSE(cfg.getBool("presentation.enforce_even_odd", true));
    EXPECT_FALSE(cfg.has("no equals sign here"));
}

TEST(ConfigTest, MalformedNumbersFallBack) {
    Config cfg;
    cfg.set("a", "-5");
    cfg.set("b", "12abc");
    cfg.set("c", "maybe");
    EXPECT_EQ(cfg.getUInt64("a", 7), 7u);
    EXPECT_EQ(cfg.getUInt64("b", 7), 7u);
    EXPECT_TRUE(cfg.getBool("c", true));
    EXPECT_EQ(cfg.getInt("c", 3), 3);
}

TEST(ConfigTest, SaveAndLoadFile) {
    const std::string path = ::testing::TempDir() + "lnp_config_test.conf";

    Config out;
    out.setUInt64("presentation.max_record_len", 4096);
    out.setBool("presentation.enforce_even_odd", false);
    ASSERT_TRUE(out.saveToFile(path));

    Config in;
    in.clear();
    ASSERT_TRUE(in.loadFromFile(path));
    EXPECT_EQ(in.getUInt64("presentation.max_record_len"), 4096u);
    EXPECT_FALSE(in.getBool("presentation.enforce_even_odd", true));
    std::remove(path.c_str());

    EXPECT_FALSE(in.loadFromFile(path));
}

// ---- DecodeOptions ----

TEST(ConfigTest, DecodeOptionsFromConfig) {
    Config cfg;
    DecodeOptions defaults = DecodeOptions::from_config(cfg);
    EXPECT_EQ(defaults.max_record_len, LNP_MSG_MAX_LEN);
    EXPECT_TRUE(defaults.enforce_even_odd);
    EXPECT_EQ(defaults.known_types, nullptr);

    cfg.set("presentation.max_record_len", "2");
    cfg.set("presentation.enforce_even_odd", "false");
    DecodeOptions opts = DecodeOptions::from_config(cfg);
    EXPECT_EQ(opts.max_record_len, 2u);
    EXPECT_FALSE(opts.enforce_even_odd);

    EXPECT_EQ(stream_decode(from_hex("0103aabbcc").value(), opts).error(),
              Error::RECORD_TOO_LARGE);
}

// ---- Logger ----

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        Logger::instance().setSink([this](LogLevel level, const std::string& msg) {
            lines_.emplace_back(level, msg);
        });
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().closeFileOutput();
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setConsoleOutput(true);
    }

    std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerTest, LevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);
    LNP_LOG_INFO("dropped");
    LNP_LOG_WARN("kept");
    LNP_LOG_ERROR("kept too");
    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].first, LogLevel::WARN);
    EXPECT_EQ(lines_[1].second, "kept too");
}

TEST_F(LoggerTest, DisabledMacroSkipsArgument) {
    Logger::instance().setLevel(LogLevel::ERROR);
    int evaluated = 0;
    auto build = [&evaluated] { ++evaluated; return std::string("x"); };
    LNP_LOG_DEBUG(build());
    EXPECT_EQ(evaluated, 0);
    LNP_LOG_ERROR(build());
    EXPECT_EQ(evaluated, 1);
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("off"), LogLevel::NONE);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::INFO);
}

TEST_F(LoggerTest, RejectedStreamIsLoggedWithHexPreview) {
    Logger::instance().setLevel(LogLevel::DEBUG);
    auto result = stream_decode(from_hex("0501aa0301bb").value());
    ASSERT_EQ(result.error(), Error::OUT_OF_ORDER_TYPE);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].first, LogLevel::DEBUG);
    EXPECT_NE(lines_[0].second.find("offset 3"), std::string::npos) << lines_[0].second;
    EXPECT_NE(lines_[0].second.find("out-of-order TLV type"), std::string::npos) << lines_[0].second;
    EXPECT_NE(lines_[0].second.find("0301bb"), std::string::npos) << lines_[0].second;
}

TEST_F(LoggerTest, SuccessfulDecodeIsSilent) {
    Logger::instance().setLevel(LogLevel::TRACE);
    ASSERT_TRUE(stream_decode(from_hex("0100").value()).is_ok());
    EXPECT_TRUE(lines_.empty());
}

TEST_F(LoggerTest, ApplyLoggingConfigWritesFile) {
    const std::string path = ::testing::TempDir() + "lnp_logger_test.log";
    std::remove(path.c_str());

    Config cfg;
    cfg.set("log.level", "warn");
    cfg.set("log.console", "false");
    cfg.set("log.file", path);
    ASSERT_TRUE(apply_logging_config(cfg));
    EXPECT_EQ(Logger::instance().level(), LogLevel::WARN);

    LNP_LOG_WARN("written to file");
    Logger::instance().closeFileOutput();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[WARN ] [lnp] written to file"), std::string::npos)
        << content.str();
    std::remove(path.c_str());
}

TEST_F(LoggerTest, ApplyLoggingConfigReportsBadFile) {
    Config cfg;
    cfg.set("log.file", "/nonexistent-dir/lnp.log");
    EXPECT_FALSE(apply_logging_config(cfg));
}

// ---- Hex helpers ----

TEST(HexTest, RenderAndParse) {
    const std::vector<uint8_t> bytes = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(to_hex(bytes), "0001abff");
    EXPECT_EQ(to_hex(std::vector<uint8_t>()), "");
    EXPECT_EQ(from_hex("0001abff"), bytes);
    EXPECT_EQ(from_hex("00:01 ab:ff"), bytes);
    EXPECT_EQ(from_hex("0001ABFF"), bytes);
}

TEST(HexTest, RejectsMalformed) {
    EXPECT_FALSE(from_hex("abc").has_value());
    EXPECT_FALSE(from_hex("zz").has_value());
}

TEST(HexTest, PreviewTruncates) {
    std::vector<uint8_t> bytes(40, 0x11);
    std::string preview = hex_preview(bytes.data(), bytes.size(), 4);
    EXPECT_EQ(preview, "11111111..(40 bytes)");
    EXPECT_EQ(hex_preview(bytes.data(), 2), "1111");
}
