/**
 * @file test_registry.cpp
 * @brief Unit tests for DispatchTable and the message codec's registry
 */

#include <gtest/gtest.h>
#include "lnp_logger.hpp"
#include "lnp_message_codec.hpp"
#include "lnp_registry.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lnp;

namespace {

int one() { return 1; }
int two() { return 2; }
int three() { return 3; }

using IntTable = DispatchTable<uint16_t, int (*)()>;

struct Ping {
    static constexpr uint16_t TYPE = 0x0012;
    void encode(ByteWriter&) const {}
    static Status decode(ByteReader&, const DecodeOptions&, Ping&) { return Status::ok(); }
};

struct Pong {
    static constexpr uint16_t TYPE = 0x0013;
    uint8_t nonce = 0;
    void encode(ByteWriter& w) const { w.write_u8(nonce); }
    static Status decode(ByteReader& r, const DecodeOptions&, Pong& out) {
        return r.read_u8(out.nonce);
    }
};

static_assert(all_distinct(std::array<uint16_t, 3>{{1, 2, 3}}), "distinct codes");
static_assert(!all_distinct(std::array<uint16_t, 3>{{1, 2, 1}}), "repeated code");

} // namespace

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        Logger::instance().setLevel(LogLevel::DEBUG);
        Logger::instance().setSink([this](LogLevel level, const std::string& msg) {
            if (level == LogLevel::ERROR) errors_.push_back(msg);
        });
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setConsoleOutput(true);
    }

    std::vector<std::string> errors_;
};

// ---- Construction ----

TEST_F(RegistryTest, SortsEntriesOnConstruction) {
    IntTable table({{3, &three}, {1, &one}, {2, &two}}, "ints");
    EXPECT_EQ(table.keys(), (std::vector<uint16_t>{1, 2, 3}));
    EXPECT_EQ(table.size(), 3u);
}

TEST_F(RegistryTest, DuplicateKeyThrowsAndLogs) {
    EXPECT_THROW({
        IntTable table({{1, &one}, {2, &two}, {1, &three}}, "ints");
    }, std::logic_error);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_NE(errors_[0].find("ints: duplicate registration for code 1"), std::string::npos);
}

TEST_F(RegistryTest, EmptyTable) {
    IntTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.find(1), nullptr);
}

// ---- Lookup ----

TEST_F(RegistryTest, FindResolvesRegisteredKeys) {
    IntTable table({{10, &one}, {20, &two}, {30, &three}}, "ints");
    ASSERT_NE(table.find(20), nullptr);
    EXPECT_EQ((*table.find(20))(), 2);
    EXPECT_EQ(table.find(15), nullptr);
    EXPECT_EQ(table.find(31), nullptr);
    EXPECT_FALSE(table.contains(0));
}

TEST_F(RegistryTest, ConcurrentLookupsNeedNoLock) {
    const IntTable table({{10, &one}, {20, &two}, {30, &three}}, "ints");
    std::vector<std::thread> threads;
    std::vector<int> sums(4, 0);
    for (size_t t = 0; t < sums.size(); ++t) {
        threads.emplace_back([&table, &sums, t] {
            for (int i = 0; i < 1000; ++i) {
                sums[t] += (*table.find(30))();
            }
        });
    }
    for (auto& th : threads) th.join();
    for (int sum : sums) EXPECT_EQ(sum, 3000);
}

// ---- Message registry ----

TEST_F(RegistryTest, CodecRegistersEveryAlternativeOnce) {
    MessageCodec<Ping, Pong> codec;
    EXPECT_EQ(codec.registry().size(), 2u);
    EXPECT_EQ(codec.registry().keys(), (std::vector<uint16_t>{0x0012, 0x0013}));
    EXPECT_TRUE(errors_.empty());
}

TEST_F(RegistryTest, DecodedAlternativeMatchesWireCode) {
    MessageCodec<Ping, Pong> codec;
    auto result = codec.decode(std::vector<uint8_t>{0x00, 0x13, 0x2a});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ((MessageCodec<Ping, Pong>::type_code(result.value())), 0x0013);
    EXPECT_EQ(std::get<Pong>(result.value()).nonce, 0x2a);
}
