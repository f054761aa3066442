// testcase.hpp
//
// A single corpus entry: one fuzzing input (possibly not loaded yet),
// where it lives on disk, and whatever collaborators have annotated
// it with.
//

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "input.hpp"
#include "result.hpp"

namespace seedbank
{
namespace corpus
{

/**
 * One kind of annotation attached to a testcase by a mutation or
 * feedback collaborator (execution time, origin, ...).
 *
 * A testcase holds at most one metadata object per Name().
 */
class TestcaseMetadata
{
public:
    virtual ~TestcaseMetadata() {}

    virtual const char *Name() const = 0;
};


/**
 * Draws a fresh identity handle. Never returns 0.
 */
uint64_t NextTestcaseHandle();


template <typename Input>
class Corpus;


template <typename Input>
class Testcase
{
public:
    /**
     * Construct a Testcase with a materialized input.
     * Takes ownership of `input`.
     */
    explicit Testcase(Input *input);

    /**
     * Construct a Testcase that only knows where its input is stored.
     */
    explicit Testcase(const std::string &filename);

    /**
     * Construct a Testcase with both halves. Takes ownership of `input`.
     */
    Testcase(Input *input, const std::string &filename);

    Testcase(const Testcase<Input> &other) = delete;
    Testcase<Input> &operator=(const Testcase<Input> &other) = delete;

    ~Testcase();

    /**
     * Read the input stored at `filename` into a new Testcase carrying
     * both the input and the filename.
     *
     * Returns kPersistenceError if the file is unreadable or malformed,
     * in which case `out` is nullptr.
     */
    static Result LoadFromDisk(const std::string &filename, Testcase<Input> *&out);

    /**
     * The materialized input, or nullptr when not loaded.
     *
     * NOTE: never loads anything, see Corpus::LoadTestcase
     */
    inline Input *GetInput()
    {
        return this->input;
    };

    inline const Input *GetInput() const
    {
        return this->input;
    };

    /**
     * Install a materialized input, deleting any previous one.
     * Takes ownership of `input`.
     */
    void SetInput(Input *input);

    /**
     * Detach the materialized input; ownership passes to the caller.
     */
    Input *TakeInput();

    inline bool HasFilename() const
    {
        return !this->filename.empty();
    };

    /**
     * The storage location, or the empty string when there is none
     */
    inline const std::string &GetFilename() const
    {
        return this->filename;
    };

    void SetFilename(const std::string &filename);

    /**
     * Attach metadata, replacing (and deleting) any existing metadata
     * with the same Name(). Takes ownership of `metadata`.
     */
    void AddMetadata(TestcaseMetadata *metadata);

    /**
     * Gets the metadata with the given name, or nullptr.
     *
     * NOTE: owned by the testcase
     */
    TestcaseMetadata *GetMetadata(const std::string &name) const;

    /**
     * Delete the metadata with the given name. Returns false if absent.
     */
    bool RemoveMetadata(const std::string &name);

    size_t MetadataCount() const;

    /**
     * Move every metadata object of `other` onto this testcase.
     * Entries already present here with the same name are replaced.
     */
    void TakeMetadatas(Testcase<Input> &other);

    /**
     * Identity assigned by the corpus holding this testcase;
     * 0 when no corpus holds it.
     */
    inline uint64_t GetHandle() const
    {
        return this->handle;
    };

    std::string ToString() const;

private:
    friend class Corpus<Input>;

    Input *input;
    std::string filename;
    std::map<std::string, TestcaseMetadata *> metadatas;
    uint64_t handle;
};

}
}
