#include <iostream>
#include <cstdint>

#include "argument-parser.hpp"
#include "schedule-driver.hpp"
#include "flags.hpp"

using namespace std;

namespace f = seedbank::flags;


int main(int argc, char* argv[])
{
    // Read and store our arguments.
    seedbank::ParsedArguments args = seedbank::ParsedArguments::Parse(argc, argv);

    if (f::FLAG_debug)
    {
        std::cout << "DEBUG enabled. Corpus at " << args.corpus_dir
            << ", seeds from " << args.seed_dir << std::endl;
    }

    return seedbank::driver::Run(args);
}
