// argument-parser.hpp
//
// Parses arguments for the seedbank scheduling driver
//

#pragma once

#include <string>
#include <cstdint>

namespace seedbank
{

/**
 * Holds details about parsed command-line arguments
 */
class ParsedArguments {
public:
    /**
     * Directory the on-disk corpus writes into
     */
    std::string corpus_dir;

    /**
     * Directory holding the initial seeds
     */
    std::string seed_dir;

    /**
     * How many testcases to schedule
     */
    uint64_t steps;

    /**
     * Seed for the random number generator
     */
    uint64_t seed;

    /**
     * When true, inputs are 16-bit units instead of bytes
     */
    bool two_byte;

    /**
     * When true, pick entries at random instead of walking the queue
     */
    bool use_random;

    /**
     * When true, seeds are copied into the corpus directory; otherwise
     * they are referenced where they are and loaded lazily
     */
    bool copy_seeds;

    /**
     * When true, every input is dropped from memory after it was scheduled
     */
    bool unload_after_use;

    /**
     * Parses command-line arguments
     */
    static ParsedArguments Parse(int argc, char **argv);
};


} // end namespace seedbank
