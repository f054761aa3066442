#include "rand.hpp"

#include <random>

namespace seedbank
{
namespace corpus
{

StdRand::StdRand(uint64_t seed)
    : engine(seed)
{
}

uint64_t StdRand::Below(uint64_t n)
{
    std::uniform_int_distribution<uint64_t> dist(0, n - 1);
    return dist(this->engine);
}

void StdRand::SetSeed(uint64_t seed)
{
    this->engine.seed(seed);
}

}
}
