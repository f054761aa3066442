// result.hpp
//
// Outcome codes shared by every corpus operation.
//

#pragma once

namespace seedbank
{
namespace corpus
{

enum Result {
    kSuccess,
    // the operation needs at least one entry, and there are none
    kEmptyCorpus,
    // an index was out of bounds
    kKeyNotFound,
    // a testcase has neither input nor filename, or the scheduler
    // has not selected anything yet
    kIllegalState,
    // reading or writing a persisted input failed
    kPersistenceError,
};

/**
 * Human-readable name for a Result, for log lines.
 */
const char *ResultToString(Result result);

}
}
