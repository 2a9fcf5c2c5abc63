#include "fortune/rng/rng-provider.h"
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace fortune::rng;

namespace {

// Sets an environment variable for the lifetime of the guard
class ScopedEnv
{
public:
    ScopedEnv(const char* name, const char* value) : name_(name)
    {
        if (value)
            setenv(name_, value, 1);
        else
            unsetenv(name_);
    }

    ~ScopedEnv()
    {
        unsetenv(name_);
    }

private:
    const char* name_;
};

}  // namespace

TEST(RngProvider, HardCodedCyclesModuloBound)
{
    HardCodedRandom rng({7, 2, 10});
    EXPECT_EQ(rng.next_u32_below(5), 2u);
    EXPECT_EQ(rng.next_u32_below(5), 2u);
    EXPECT_EQ(rng.next_u32_below(5), 0u);
    EXPECT_EQ(rng.next_u32_below(100), 7u);
}

TEST(RngProvider, HardCodedDefaultsToZero)
{
    HardCodedRandom rng;
    for (uint32_t bound : {1u, 2u, 0x80000000u})
        EXPECT_EQ(rng.next_u32_below(bound), 0u);
}

TEST(RngProvider, ZeroBoundRejected)
{
    HardCodedRandom hard;
    SeededRandom seeded;
    SystemRandom system;
    EXPECT_THROW(hard.next_u32_below(0), std::invalid_argument);
    EXPECT_THROW(seeded.next_u32_below(0), std::invalid_argument);
    EXPECT_THROW(system.next_u32_below(0), std::invalid_argument);
}

TEST(RngProvider, SeededIsReproducible)
{
    SeededRandom a;
    SeededRandom b;
    EXPECT_EQ(a.seed(), DEFAULT_FIXED_SEED);
    for (int i = 0; i < 50; ++i)
        EXPECT_EQ(a.next_u32_below(1000), b.next_u32_below(1000));
}

TEST(RngProvider, DrawsStayBelowBound)
{
    SystemRandom rng;
    for (int i = 0; i < 1000; ++i)
        EXPECT_LT(rng.next_u32_below(3), 3u);
    EXPECT_EQ(rng.next_u32_below(1), 0u);
}

TEST(RngProvider, ParseHardCodedValues)
{
    EXPECT_EQ(parse_hard_coded_values("0"), std::vector<uint64_t>{0});
    EXPECT_EQ(
        parse_hard_coded_values("3, 1;4 1"),
        (std::vector<uint64_t>{3, 1, 4, 1}));
    EXPECT_THROW(parse_hard_coded_values(""), std::invalid_argument);
    EXPECT_THROW(parse_hard_coded_values(" , "), std::invalid_argument);
    EXPECT_THROW(parse_hard_coded_values("12x"), std::invalid_argument);
    EXPECT_THROW(parse_hard_coded_values("-1"), std::invalid_argument);
}

TEST(RngProvider, ConfigFromEnvironment)
{
    {
        ScopedEnv hard(HARD_CODED_VALUES_ENV, nullptr);
        ScopedEnv seeded(USE_SEEDED_ENV, nullptr);
        RngConfig config = RngConfig::from_env();
        EXPECT_FALSE(config.hard_coded_values);
        EXPECT_FALSE(config.use_fixed_seed);
    }
    {
        ScopedEnv hard(HARD_CODED_VALUES_ENV, "5,6");
        ScopedEnv seeded(USE_SEEDED_ENV, "1");
        RngConfig config = RngConfig::from_env();
        ASSERT_TRUE(config.hard_coded_values);
        EXPECT_EQ(*config.hard_coded_values, (std::vector<uint64_t>{5, 6}));
        EXPECT_TRUE(config.use_fixed_seed);

        // Hard-coded values win over the seeded toggle
        auto provider = make_provider(config);
        EXPECT_EQ(provider->next_u32_below(10), 5u);
        EXPECT_EQ(provider->next_u32_below(10), 6u);
    }
    {
        ScopedEnv seeded(USE_SEEDED_ENV, "False");
        EXPECT_FALSE(RngConfig::from_env().use_fixed_seed);
    }
}

TEST(RngProvider, NonAsciiToggleValueIsTruthy)
{
    {
        ScopedEnv seeded(USE_SEEDED_ENV, "\xC3\xA9t\xC3\xA9");
        EXPECT_TRUE(RngConfig::from_env().use_fixed_seed);
    }
    {
        ScopedEnv seeded(USE_SEEDED_ENV, "FALSE");
        EXPECT_FALSE(RngConfig::from_env().use_fixed_seed);
    }
}

TEST(RngProvider, SeededProviderMatchesSeededRandom)
{
    RngConfig config;
    config.use_fixed_seed = true;
    auto provider = make_provider(config);
    SeededRandom reference;
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(provider->next_u32_below(97), reference.next_u32_below(97));
}
