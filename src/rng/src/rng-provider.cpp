#include "fortune/rng/rng-provider.h"
#include "fortune/core/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fortune::rng {

namespace {

void
require_bound(uint32_t bound)
{
    if (bound == 0)
    {
        throw std::invalid_argument("next_u32_below called with bound 0");
    }
}

uint32_t
draw_below(std::mt19937& engine, uint32_t bound)
{
    require_bound(bound);
    std::uniform_int_distribution<uint32_t> dist(0, bound - 1);
    return dist(engine);
}

bool
env_truthy(const char* name)
{
    const char* env = std::getenv(name);
    if (!env)
        return false;
    std::string value(env);
    std::ranges::transform(value, value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return !(value.empty() || value == "0" || value == "false");
}

}  // namespace

SystemRandom::SystemRandom()
{
    std::random_device rd;
    engine_.seed(rd());
}

uint32_t
SystemRandom::next_u32_below(uint32_t bound)
{
    return draw_below(engine_, bound);
}

SeededRandom::SeededRandom(uint32_t seed) : seed_(seed), engine_(seed)
{
}

uint32_t
SeededRandom::next_u32_below(uint32_t bound)
{
    return draw_below(engine_, bound);
}

HardCodedRandom::HardCodedRandom(std::vector<uint64_t> values)
    : values_(std::move(values))
{
    if (values_.empty())
    {
        throw std::invalid_argument("HardCodedRandom needs at least one value");
    }
}

uint32_t
HardCodedRandom::next_u32_below(uint32_t bound)
{
    require_bound(bound);
    uint64_t value = values_[position_ % values_.size()];
    position_++;
    return static_cast<uint32_t>(value % bound);
}

std::vector<uint64_t>
parse_hard_coded_values(const std::string& raw)
{
    std::vector<uint64_t> values;
    std::string token;

    auto flush = [&]() {
        if (token.empty())
            return;
        if (!std::ranges::all_of(
                token, [](unsigned char c) { return std::isdigit(c); }))
        {
            throw std::invalid_argument(
                "Invalid hard-coded RNG value '" + token + "'");
        }
        try
        {
            values.push_back(std::stoull(token));
        }
        catch (const std::out_of_range&)
        {
            throw std::invalid_argument(
                "Hard-coded RNG value out of range '" + token + "'");
        }
        token.clear();
    };

    for (char c : raw)
    {
        if (c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c)))
            flush();
        else
            token.push_back(c);
    }
    flush();

    if (values.empty())
    {
        throw std::invalid_argument(
            std::string(HARD_CODED_VALUES_ENV) +
            " is set but contains no numeric values");
    }
    return values;
}

RngConfig
RngConfig::from_env()
{
    RngConfig config;
    if (const char* raw = std::getenv(HARD_CODED_VALUES_ENV))
    {
        config.hard_coded_values = parse_hard_coded_values(raw);
    }
    config.use_fixed_seed = env_truthy(USE_SEEDED_ENV);
    return config;
}

std::unique_ptr<RngProvider>
make_provider(const RngConfig& config)
{
    if (config.hard_coded_values)
    {
        LOGD(
            "Using hard-coded RNG with ",
            config.hard_coded_values->size(),
            " value(s)");
        return std::make_unique<HardCodedRandom>(*config.hard_coded_values);
    }
    if (config.use_fixed_seed)
    {
        LOGD("Using seeded RNG, seed ", config.seed);
        return std::make_unique<SeededRandom>(config.seed);
    }
    LOGD("Using system RNG");
    return std::make_unique<SystemRandom>();
}

}  // namespace fortune::rng
