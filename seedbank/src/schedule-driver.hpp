#pragma once

#include "argument-parser.hpp"

#include <cstdint>

namespace seedbank
{
namespace driver
{

/**
 * Imports the seeds into an on-disk corpus and schedules testcases
 * from it, loading each one as a fuzzing loop would before executing it.
 *
 * @param args the parsed command-line arguments
 *
 * @returns 0 on success, nonzero when the corpus could not be set up
 *   or ran out of usable entries
 */
int Run(const ParsedArguments &args);

}
}
