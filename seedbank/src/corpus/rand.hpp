// rand.hpp
//
// Randomness sources consumed by the corpus when it needs to pick
// an entry.
//

#pragma once

#include <cstdint>
#include <random>

namespace seedbank
{
namespace corpus
{

/**
 * A source of bounded random integers.
 */
class Rand
{
public:
    virtual ~Rand() {}

    /**
     * Draw a uniformly distributed integer in [0, n).
     *
     * NOTE: n must be greater than zero
     */
    virtual uint64_t Below(uint64_t n) = 0;
};


/**
 * Rand backed by a 64-bit Mersenne Twister.
 */
class StdRand : public Rand
{
public:
    explicit StdRand(uint64_t seed);

    uint64_t Below(uint64_t n) override;

    /**
     * Re-seed the generator
     */
    void SetSeed(uint64_t seed);

private:
    std::mt19937_64 engine;
};

}
}
