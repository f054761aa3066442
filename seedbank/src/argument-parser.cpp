#include <cstdlib>
#include <ctime>
#include <exception>
#include <string>
#include <iostream>

#include <cxxopts.hpp>

#include "argument-parser.hpp"
#include "flags.hpp"
#include "version.hpp"

using namespace std;

namespace seedbank
{

[[noreturn]] static void die_with_help(cxxopts::Options &options, const std::string &message)
{
    std::cerr << "ERROR: " << message << std::endl;
    std::cerr << std::endl;
    std::cerr << options.help() << std::endl;
    exit(1);
}

static cxxopts::ParseResult parse_or_die(cxxopts::Options &options, int argc, char **argv)
{
    try
    {
        return options.parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        die_with_help(options, e.what());
    }
}

ParsedArguments ParsedArguments::Parse(int argc, char **argv)
{
    ParsedArguments ret;

    cxxopts::Options options(argv[0], "Corpus scheduling driver for coverage-guided fuzzing");
    options.add_options()
        ("v,version", "Print version", cxxopts::value<bool>()->default_value("false"))
        ("c,corpus", "Directory the corpus stores new testcases in", cxxopts::value<std::string>())
        ("i,seeds", "Directory of initial seed files", cxxopts::value<std::string>())
        ("n,steps", "How many testcases to schedule", cxxopts::value<uint64_t>()->default_value("100"))
        ("s,seed", "Seed for random number generator (0 = time-based)", cxxopts::value<uint64_t>()->default_value("0"))
        ("w,widths", "Input unit width: 1 (bytes) or 2 (16-bit units)", cxxopts::value<std::string>()->default_value("1"))
        ("random", "Pick testcases at random instead of round-robin", cxxopts::value<bool>()->default_value("false"))
        ("copy", "Copy seeds into the corpus directory instead of referencing them", cxxopts::value<bool>()->default_value("false"))
        ("unload", "Drop each input from memory after it was scheduled", cxxopts::value<bool>()->default_value("false"))
        ("debug", "Enable debug mode", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print help", cxxopts::value<bool>()->default_value("false"));

    cxxopts::ParseResult parsed = parse_or_die(options, argc, argv);

    if (parsed["help"].as<bool>())
    {
        std::cout << options.help() << std::endl;
        exit(0);
    }

    if (parsed["version"].as<bool>())
    {
        std::cout << "seedbank v" << VERSION << std::endl;
        exit(0);
    }

    seedbank::flags::FLAG_debug = parsed["debug"].as<bool>();

    if (parsed["corpus"].count() == 0)
    {
        die_with_help(options, "--corpus is required");
    }
    ret.corpus_dir = parsed["corpus"].as<std::string>();

    if (parsed["seeds"].count() == 0)
    {
        die_with_help(options, "--seeds is required");
    }
    ret.seed_dir = parsed["seeds"].as<std::string>();

    if (ret.corpus_dir.empty() || ret.seed_dir.empty())
    {
        die_with_help(options, "directories must not be empty");
    }

    std::string widths = parsed["widths"].as<std::string>();
    if (widths == "1")
    {
        ret.two_byte = false;
    }
    else if (widths == "2")
    {
        ret.two_byte = true;
    }
    else
    {
        die_with_help(options, "unknown widths argument: " + widths);
    }

    ret.steps = parsed["steps"].as<uint64_t>();
    ret.use_random = parsed["random"].as<bool>();
    ret.copy_seeds = parsed["copy"].as<bool>();
    ret.unload_after_use = parsed["unload"].as<bool>();

    ret.seed = parsed["seed"].as<uint64_t>();
    if (ret.seed == 0)
    {
        ret.seed = static_cast<uint64_t>(std::time(0));
    }

    if (seedbank::flags::FLAG_debug)
    {
        std::cout << "DEBUG Seeding random number generator with " << ret.seed << std::endl;
    }

    return ret;
}

}
