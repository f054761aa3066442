#include "queue-corpus.hpp"

#include <vector>

namespace seedbank
{
namespace corpus
{

template<typename Input>
QueueCorpus<Input>::QueueCorpus(Corpus<Input> *corpus)
    : corpus(corpus),
      pos(0),
      cycles(0),
      current_removed(false)
{
}

template<typename Input>
QueueCorpus<Input>::~QueueCorpus()
{
    delete this->corpus;
}

template<typename Input>
std::vector<Testcase<Input> *> &QueueCorpus<Input>::Entries()
{
    return this->corpus->Entries();
}

template<typename Input>
const std::vector<Testcase<Input> *> &QueueCorpus<Input>::Entries() const
{
    return this->corpus->Entries();
}

template<typename Input>
Result QueueCorpus<Input>::Add(Testcase<Input> *testcase)
{
    return this->corpus->Add(testcase);
}

template<typename Input>
Result QueueCorpus<Input>::Replace(size_t idx, Testcase<Input> *testcase)
{
    return this->corpus->Replace(idx, testcase);
}

template<typename Input>
Testcase<Input> *QueueCorpus<Input>::Remove(const Testcase<Input> &entry)
{
    size_t idx = this->IndexOfHandle(entry.GetHandle());
    if (idx >= this->Count())
    {
        return nullptr;
    }

    if (this->pos > 0 && idx == this->pos - 1)
    {
        this->current_removed = true;
    }

    // pos is 1-based, so idx < pos means the removed entry was already visited
    if (idx < this->pos)
    {
        this->pos--;
    }

    return this->corpus->Remove(entry);
}

template<typename Input>
Result QueueCorpus<Input>::RandomEntry(Rand &rand, Testcase<Input> *&out, size_t &idx_out) const
{
    return this->corpus->RandomEntry(rand, out, idx_out);
}

template<typename Input>
Result QueueCorpus<Input>::LoadTestcase(size_t idx)
{
    return this->corpus->LoadTestcase(idx);
}

template<typename Input>
Result QueueCorpus<Input>::UnloadTestcase(size_t idx)
{
    return this->corpus->UnloadTestcase(idx);
}

template<typename Input>
void QueueCorpus<Input>::AdvanceCursor()
{
    this->pos++;
    if (this->pos > this->corpus->Count())
    {
        this->pos = 1;
        this->cycles++;
    }
}

template<typename Input>
Result QueueCorpus<Input>::Next(Rand &rand, Testcase<Input> *&out, size_t &idx_out)
{
    (void)rand;

    if (this->corpus->Count() == 0)
    {
        return kEmptyCorpus;
    }

    this->AdvanceCursor();
    this->current_removed = false;

    idx_out = this->pos - 1;
    out = this->corpus->Get(idx_out);

    return kSuccess;
}

template<typename Input>
Result QueueCorpus<Input>::CurrentTestcase(Testcase<Input> *&out, size_t &idx_out) const
{
    if (this->pos == 0 || this->pos > this->corpus->Count() || this->current_removed)
    {
        // Next() was never called, or what it returned is gone
        return kIllegalState;
    }

    idx_out = this->pos - 1;
    out = this->corpus->Entries()[idx_out];

    return kSuccess;
}

template class QueueCorpus<BytesInput>;
template class QueueCorpus<WideInput>;

}
}
