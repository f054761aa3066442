// input.hpp
//
// Input payloads: fixed buffers of 8-bit or 16-bit units that can be
// rebuilt from raw bytes and persisted to a file.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

namespace seedbank
{
namespace corpus
{

/**
 * A single fuzzing input, ie, a buffer of Chars.
 */
template <typename Char>
class BufferInput
{
public:
    typedef Char char_type;

    /**
     * Construct a BufferInput.
     * Takes ownership of `buf`.
     */
    BufferInput(Char *buf, size_t buflen);
    BufferInput(const BufferInput<Char> &other);
    BufferInput<Char> &operator=(const BufferInput<Char> &other) = delete;

    ~BufferInput();

    /**
     * Rebuild an input from its persisted byte representation.
     * 16-bit units are read little-endian.
     *
     * Returns kPersistenceError when `len` is not a multiple of
     * sizeof(Char).
     */
    static Result FromBytes(const uint8_t *data, size_t len, BufferInput<Char> *&out);

    /**
     * Serialize into the persisted byte representation (appends to `out`).
     */
    void ToBytes(std::vector<uint8_t> &out) const;

    /**
     * Read and deserialize the input stored at `path`.
     */
    static Result FromFile(const std::string &path, BufferInput<Char> *&out);

    /**
     * Serialize and write the input to `path`, replacing any existing file.
     */
    Result ToFile(const std::string &path) const;

    bool operator==(const BufferInput<Char> &other) const;
    bool operator!=(const BufferInput<Char> &other) const
    {
        return !(*this == other);
    };

    std::string ToString() const;

    Char *buf;
    size_t buflen;
};

typedef BufferInput<uint8_t> BytesInput;
typedef BufferInput<uint16_t> WideInput;

}
}
