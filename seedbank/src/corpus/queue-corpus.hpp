// queue-corpus.hpp
//
// Contains a QueueCorpus class which walks a wrapped corpus
// round-robin, counting how many full passes have been made.

#pragma once

#include <cstdint>
#include <vector>

#include "corpus.hpp"

namespace seedbank
{
namespace corpus
{

/**
 * Queue-like scheduler over an existing Corpus.
 *
 * Storage operations go straight to the wrapped corpus; only the
 * choice made by Next() differs, visiting every entry once per cycle
 * in insertion order.
 */
template<typename Input>
class QueueCorpus : public Corpus<Input>
{
public:
    /**
     * Takes ownership of `corpus`.
     */
    explicit QueueCorpus(Corpus<Input> *corpus);
    QueueCorpus(const QueueCorpus<Input> &other) = delete;
    QueueCorpus<Input> &operator=(const QueueCorpus<Input> &other) = delete;
    ~QueueCorpus() override;

    std::vector<Testcase<Input> *> &Entries() override;
    const std::vector<Testcase<Input> *> &Entries() const override;

    Result Add(Testcase<Input> *testcase) override;

    Result Replace(size_t idx, Testcase<Input> *testcase) override;

    /**
     * See Corpus::Remove. If the removed entry was at or before the
     * cursor, the cursor moves back one so no entry is skipped.
     * Removing the current entry leaves nothing current until the
     * next Next().
     */
    Testcase<Input> *Remove(const Testcase<Input> &entry) override;

    Result RandomEntry(Rand &rand, Testcase<Input> *&out, size_t &idx_out) const override;

    Result LoadTestcase(size_t idx) override;

    Result UnloadTestcase(size_t idx) override;

    /**
     * Advance to the following entry, wrapping to the first one (and
     * completing a cycle) after the last. `rand` is unused.
     *
     * Returns kEmptyCorpus, without moving, when the corpus is empty.
     */
    Result Next(Rand &rand, Testcase<Input> *&out, size_t &idx_out) override;

    /**
     * Returns kIllegalState until Next() has succeeded once, and after
     * the current entry was removed.
     */
    Result CurrentTestcase(Testcase<Input> *&out, size_t &idx_out) const override;

    /**
     * The number of completed passes over the corpus
     */
    inline uint64_t Cycles() const
    {
        return this->cycles;
    };

    /**
     * 1-based position of the current entry; 0 before the first Next()
     */
    inline size_t Pos() const
    {
        return this->pos;
    };

    /**
     * The wrapped corpus. Read-only: changes must go through the queue
     * so the cursor stays consistent.
     */
    inline const Corpus<Input> &Backend() const
    {
        return *this->corpus;
    };

private:
    /**
     * Move the cursor one step. Only call on a non-empty corpus.
     */
    void AdvanceCursor();

    Corpus<Input> *corpus;
    size_t pos;
    uint64_t cycles;

    /**
     * Set when the entry last returned by Next() has been removed
     */
    bool current_removed;
};

}
}
