#include "schedule-driver.hpp"

#include "corpus/corpus.hpp"
#include "corpus/queue-corpus.hpp"
#include "corpus/rand.hpp"
#include "corpus/result.hpp"
#include "corpus/testcase.hpp"

#include "flags.hpp"

#include <algorithm>
#include <memory>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <sstream>


namespace f = seedbank::flags;
namespace c = seedbank::corpus;

namespace seedbank
{
namespace driver
{

/**
 * How often a testcase was handed out, kept on the testcase itself.
 */
class ScheduleStats : public c::TestcaseMetadata
{
public:
    static constexpr const char *kName = "ScheduleStats";

    ScheduleStats() : times_selected(0) {};

    const char *Name() const override
    {
        return kName;
    };

    uint64_t times_selected;
};

constexpr const char *ScheduleStats::kName;


/**
 * Represents the in-progress information about a scheduling run.
 */
template<typename Input>
class ScheduleCampaign
{
public:
    explicit ScheduleCampaign(c::Corpus<Input> *corpus)
        : corpus(corpus),
          queue(nullptr),
          steps_since_last_render(0),
          total_steps(0),
          bytes_scheduled(0),
          evicted(0),
          last_screen_render(std::chrono::steady_clock::now())
        {};

    /**
     * The corpus being scheduled from
     */
    std::unique_ptr<c::Corpus<Input>> corpus;

    /**
     * Same object as `corpus` when round-robin scheduling is used,
     * otherwise nullptr
     */
    c::QueueCorpus<Input> *queue;

    uintmax_t steps_since_last_render;

    uintmax_t total_steps;

    /**
     * Sum of the sizes (in bytes) of every scheduled input
     */
    uintmax_t bytes_scheduled;

    /**
     * Entries removed because they could not be loaded
     */
    uintmax_t evicted;

    /**
     * When the last screen render occurred
     */
    std::chrono::steady_clock::time_point last_screen_render;
};


/**
 * A work-interrupt point for printing status about a campaign.
 */
template<typename Input>
inline void work_interrupt(ScheduleCampaign<Input> *campaign, bool force)
{
    auto now = std::chrono::steady_clock::now();
    // Print stuff to screen if we haven't done that lately
    if (!force && (now - campaign->last_screen_render) <= std::chrono::milliseconds(500))
    {
        return;
    }

    auto elapsed_since_last_render = now - campaign->last_screen_render;
    double seconds_elapsed_since_last_render = std::max(
        elapsed_since_last_render.count() / (static_cast<double>(std::nano::den)),
        1e-9
    );

    std::ostringstream to_print;
    to_print << "SUMMARY ";
    to_print << (sizeof(typename Input::char_type) == 1 ? "1-byte " : "2-byte ");

    double steps_per_second = campaign->steps_since_last_render / seconds_elapsed_since_last_render;
    to_print << "Steps/s: "
        << std::setprecision(5) << std::setw(4) << steps_per_second << " "
        << std::setw(0)
        << "Steps: " << campaign->total_steps << " "
        << "Corpus Size: " << campaign->corpus->Count() << " ";

    if (campaign->queue != nullptr)
    {
        to_print << "Cycles: " << campaign->queue->Cycles() << " ";
    }

    to_print << "Evicted: " << campaign->evicted << " "
        << "Bytes: " << campaign->bytes_scheduled;

    campaign->last_screen_render = now;
    campaign->steps_since_last_render = 0;
    std::cout << to_print.str() << std::endl;
}


/**
 * Schedule `steps` testcases, loading each before it is handed out.
 */
template<typename Input>
inline int run_campaign(const ParsedArguments &args)
{
    c::OnDiskCorpus<Input> *backend = new c::OnDiskCorpus<Input>(args.corpus_dir);
    c::QueueCorpus<Input> *queue = nullptr;

    c::Corpus<Input> *corpus = backend;
    if (!args.use_random)
    {
        queue = new c::QueueCorpus<Input>(backend);
        corpus = queue;
    }

    ScheduleCampaign<Input> campaign(corpus);
    campaign.queue = queue;

    size_t n_imported = 0;
    c::Result result = c::ImportDirectory(*corpus, args.seed_dir, !args.copy_seeds, n_imported);
    if (result != c::kSuccess)
    {
        std::cerr << "ERROR: could not import seeds from " << args.seed_dir
            << ": " << c::ResultToString(result) << std::endl;
        return 1;
    }

    if (f::FLAG_debug)
    {
        std::cout << "DEBUG imported " << n_imported << " seeds, "
            << (args.use_random ? "random" : "round-robin") << " scheduling" << std::endl;
    }

    c::StdRand rand(args.seed);

    for (uint64_t step = 0; step < args.steps; step++)
    {
        c::Testcase<Input> *testcase = nullptr;
        size_t idx = 0;

        result = corpus->Next(rand, testcase, idx);
        if (result != c::kSuccess)
        {
            std::cerr << "ERROR: nothing to schedule: " << c::ResultToString(result) << std::endl;
            return 1;
        }

        result = corpus->LoadTestcase(idx);
        if (result == c::kPersistenceError || result == c::kIllegalState)
        {
            // unusable entry, drop it and keep going
            std::cerr << "ERROR: could not load " << testcase->ToString()
                << ": " << c::ResultToString(result) << ", evicting" << std::endl;
            delete corpus->Remove(*testcase);
            campaign.evicted++;
            continue;
        }
        else if (result != c::kSuccess)
        {
            std::cerr << "ERROR: could not load entry " << idx
                << ": " << c::ResultToString(result) << std::endl;
            return 1;
        }

        // loading replaces the entry, so fetch it again
        testcase = corpus->Get(idx);

        ScheduleStats *stats = dynamic_cast<ScheduleStats *>(testcase->GetMetadata(ScheduleStats::kName));
        if (stats == nullptr)
        {
            stats = new ScheduleStats();
            testcase->AddMetadata(stats);
        }
        stats->times_selected++;

        campaign.bytes_scheduled += testcase->GetInput()->buflen * sizeof(typename Input::char_type);

        if (f::FLAG_debug)
        {
            std::cout << "DEBUG step " << step << " idx=" << idx
                << " selected=" << stats->times_selected << " "
                << testcase->ToString() << std::endl;
        }

        if (args.unload_after_use)
        {
            result = corpus->UnloadTestcase(idx);
            if (result != c::kSuccess && f::FLAG_debug)
            {
                std::cout << "DEBUG keeping entry " << idx << " in memory: "
                    << c::ResultToString(result) << std::endl;
            }
        }

        campaign.steps_since_last_render++;
        campaign.total_steps++;
        work_interrupt(&campaign, false);
    }

    work_interrupt(&campaign, true);

    return 0;
}


int Run(const ParsedArguments &args)
{
    if (args.two_byte)
    {
        return run_campaign<c::WideInput>(args);
    }
    return run_campaign<c::BytesInput>(args);
}

}
}
