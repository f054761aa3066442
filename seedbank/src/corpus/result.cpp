#include "result.hpp"

namespace seedbank
{
namespace corpus
{

const char *ResultToString(Result result)
{
    switch (result)
    {
    case kSuccess:
        return "Success";
    case kEmptyCorpus:
        return "EmptyCorpus";
    case kKeyNotFound:
        return "KeyNotFound";
    case kIllegalState:
        return "IllegalState";
    case kPersistenceError:
        return "PersistenceError";
    }
    return "Unknown";
}

}
}
