#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace fortune::rng {

// Seed used by SeededRandom unless another one is configured ("FORT")
static constexpr uint32_t DEFAULT_FIXED_SEED = 0x464F5254;

// Environment toggles read by RngConfig::from_env()
static constexpr const char* HARD_CODED_VALUES_ENV =
    "FORTUNE_MOD_RAND_HARD_CODED_VALS";
static constexpr const char* USE_SEEDED_ENV = "FORTUNE_MOD_USE_SRAND";

/**
 * Source of uniform integers. Consumers only ever see this interface.
 */
class RngProvider
{
public:
    virtual ~RngProvider() = default;

    /**
     * Draw a value in [0, bound)
     *
     * @throws std::invalid_argument if bound is 0
     */
    virtual uint32_t
    next_u32_below(uint32_t bound) = 0;
};

// std::mt19937 seeded from std::random_device
class SystemRandom : public RngProvider
{
public:
    SystemRandom();

    uint32_t
    next_u32_below(uint32_t bound) override;

private:
    std::mt19937 engine_;
};

// std::mt19937 with a fixed seed, reproducible across runs of one build
class SeededRandom : public RngProvider
{
public:
    explicit SeededRandom(uint32_t seed = DEFAULT_FIXED_SEED);

    uint32_t
    next_u32_below(uint32_t bound) override;

    uint32_t
    seed() const
    {
        return seed_;
    }

private:
    uint32_t seed_;
    std::mt19937 engine_;
};

/**
 * Replays configured values (cycled), each reduced modulo the bound.
 * Only meant for parity and reproducibility testing.
 */
class HardCodedRandom : public RngProvider
{
public:
    explicit HardCodedRandom(std::vector<uint64_t> values = {0});

    uint32_t
    next_u32_below(uint32_t bound) override;

private:
    std::vector<uint64_t> values_;
    size_t position_ = 0;
};

/**
 * Which provider to build. Hard-coded values win over the seeded toggle;
 * with neither set the system provider is used.
 */
struct RngConfig
{
    std::optional<std::vector<uint64_t>> hard_coded_values;
    bool use_fixed_seed = false;
    uint32_t seed = DEFAULT_FIXED_SEED;

    /**
     * Read FORTUNE_MOD_RAND_HARD_CODED_VALS (integers separated by commas,
     * semicolons or whitespace) and FORTUNE_MOD_USE_SRAND (any value other
     * than "", "0" or "false")
     *
     * @throws std::invalid_argument on a malformed value list
     */
    static RngConfig
    from_env();
};

/**
 * Parse a hard-coded value list such as "0", "3,1 4"
 *
 * @throws std::invalid_argument if a token is not an unsigned integer or the
 * list is empty
 */
std::vector<uint64_t>
parse_hard_coded_values(const std::string& raw);

std::unique_ptr<RngProvider>
make_provider(const RngConfig& config);

}  // namespace fortune::rng
