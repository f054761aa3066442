// corpus.hpp
//
// Maintains a corpus of testcases to fuzz with, either purely in memory
// or backed by a directory on disk.
//

#pragma once

#include <cstdint>
#include <vector>
#include <string>

#include "input.hpp"
#include "rand.hpp"
#include "result.hpp"
#include "testcase.hpp"

namespace seedbank
{
namespace corpus
{

/**
 * Contains the entire corpus of testcases.
 *
 * Subclasses supply the owned entry sequence (Entries()) and the
 * selection policy (Next() / CurrentTestcase()); everything else is
 * built on top of Entries().
 *
 * Indices are only stable until the next Add() or Remove().
 */
template <typename Input>
class Corpus
{
public:
    virtual ~Corpus() {}

    /**
     * The ordered entry sequence.
     */
    virtual std::vector<Testcase<Input> *> &Entries() = 0;
    virtual const std::vector<Testcase<Input> *> &Entries() const = 0;

    /**
     * The number of entries in the corpus
     */
    size_t Count() const;

    /**
     * Append a testcase.
     *
     * Ownership of `testcase` is transferred to the Corpus on success
     * only; on failure the testcase is unmodified and still belongs to
     * the caller.
     *
     * Returns kIllegalState if the testcase has neither input nor
     * filename, or is already held by a corpus.
     */
    virtual Result Add(Testcase<Input> *testcase);

    /**
     * Overwrite the entry at `idx`, deleting the old one. The new
     * testcase takes over the identity of the slot.
     *
     * Ownership of `testcase` is transferred to the Corpus on success.
     *
     * Returns kKeyNotFound when `idx` is out of bounds.
     */
    virtual Result Replace(size_t idx, Testcase<Input> *testcase);

    /**
     * Gets the ith entry.
     *
     * Throws std::out_of_range when out of bounds; callers must only
     * pass indices they got from this corpus since the last Add/Remove.
     *
     * NOTE: owned by the corpus
     */
    Testcase<Input> *Get(size_t idx);
    const Testcase<Input> *Get(size_t idx) const;

    /**
     * Remove the entry with the same identity as `entry`.
     *
     * Returns the removed testcase (ownership passes to the caller)
     * or nullptr when no entry matches.
     */
    virtual Testcase<Input> *Remove(const Testcase<Input> &entry);

    /**
     * Pick an entry uniformly at random.
     *
     * Returns kEmptyCorpus when there are no entries.
     */
    virtual Result RandomEntry(Rand &rand, Testcase<Input> *&out, size_t &idx_out) const;

    /**
     * Make sure the entry at `idx` has a materialized input, reading it
     * from its filename if needed. This is the only place the corpus
     * reads inputs back from disk.
     *
     * Returns kKeyNotFound for a bad index, kIllegalState when the entry
     * has neither input nor filename, kPersistenceError when reading
     * fails. The entry is left untouched on failure.
     */
    virtual Result LoadTestcase(size_t idx);

    /**
     * Drop the materialized input of the entry at `idx` to save memory.
     * The entry keeps its filename and can be loaded again.
     *
     * Returns kKeyNotFound for a bad index, kIllegalState when the entry
     * has no filename, kPersistenceError when the file is missing.
     */
    virtual Result UnloadTestcase(size_t idx);

    /**
     * Select the next testcase to fuzz.
     *
     * Returns kEmptyCorpus when there are no entries.
     */
    virtual Result Next(Rand &rand, Testcase<Input> *&out, size_t &idx_out) = 0;

    /**
     * The testcase last selected by Next().
     *
     * Returns kIllegalState when nothing is selected.
     */
    virtual Result CurrentTestcase(Testcase<Input> *&out, size_t &idx_out) const = 0;

protected:
    /**
     * Index of the entry with `handle`, or Count() if there is none
     */
    size_t IndexOfHandle(uint64_t handle) const;

    /**
     * True when `testcase` has an input or a filename and no corpus
     * holds it yet
     */
    static inline bool IsUsable(const Testcase<Input> *testcase)
    {
        return testcase->GetHandle() == 0
            && (testcase->GetInput() != nullptr || testcase->HasFilename());
    };

    static inline void SetHandle(Testcase<Input> *testcase, uint64_t handle)
    {
        testcase->handle = handle;
    };
};


/**
 * A corpus held entirely in memory. Next() picks at random.
 */
template <typename Input>
class InMemoryCorpus : public Corpus<Input>
{
public:
    InMemoryCorpus();
    InMemoryCorpus(const InMemoryCorpus<Input> &other) = delete;
    InMemoryCorpus<Input> &operator=(const InMemoryCorpus<Input> &other) = delete;
    ~InMemoryCorpus() override;

    std::vector<Testcase<Input> *> &Entries() override;
    const std::vector<Testcase<Input> *> &Entries() const override;

    /**
     * See Corpus::Remove. Removing the selected entry clears the
     * selection; removing an earlier one keeps it on the same testcase.
     */
    Testcase<Input> *Remove(const Testcase<Input> &entry) override;

    Result Next(Rand &rand, Testcase<Input> *&out, size_t &idx_out) override;

    Result CurrentTestcase(Testcase<Input> *&out, size_t &idx_out) const override;

protected:
    std::vector<Testcase<Input> *> entries;

    /**
     * Index chosen by the last successful Next()
     */
    size_t pos;

    bool selected;
};


/**
 * A corpus which writes every new input into a directory.
 *
 * Testcases added without a filename are named `<dir>/id_<n>`, with n
 * counting up from 0 and skipping names that exist on disk or are held
 * by an entry, and are written out before Add() returns.
 *
 * A testcase that arrives with a name directly inside the directory is
 * written there if that file does not exist yet; two entries never
 * share such a name. Names elsewhere belong to their owner and are
 * left alone.
 */
template <typename Input>
class OnDiskCorpus : public InMemoryCorpus<Input>
{
public:
    explicit OnDiskCorpus(const std::string &dir_path);

    /**
     * See Corpus::Add. Additionally returns kPersistenceError when the
     * input could not be written, and kIllegalState when another entry
     * already uses the testcase's name inside the directory.
     */
    Result Add(Testcase<Input> *testcase) override;

    inline const std::string &GetDirPath() const
    {
        return this->dir_path;
    };

private:
    /**
     * Produce the next `id_<n>` path that is neither on disk nor held
     */
    std::string NextFilename();

    /**
     * True if an entry already uses `filename`
     */
    bool IsHeld(const std::string &filename) const;

    /**
     * True if `filename` names a file directly inside `dir_path`
     */
    bool InDirectory(const std::string &filename) const;

    Result EnsureDirectory();

    std::string dir_path;

    size_t next_id;

    /**
     * True once the directory is known to exist
     */
    bool dir_ready;
};


/**
 * Add every regular file in `seed_dir` to `corpus`, in name order.
 *
 * When `lazy` is true the testcases only reference the seed files and
 * are loaded on demand; otherwise each seed is read now and added
 * without a filename, so a disk-backed corpus stores its own copy.
 *
 * `n_imported` receives the number of testcases added. Stops at the
 * first failure and returns its code.
 */
template <typename Input>
Result ImportDirectory(
    Corpus<Input> &corpus,
    const std::string &seed_dir,
    bool lazy,
    size_t &n_imported);

}
}
