#include "input.hpp"
#include "util.hpp"
#include "flags.hpp"

#include <cstring>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace f = seedbank::flags;

namespace seedbank
{
namespace corpus
{

template <typename Char>
BufferInput<Char>::BufferInput(Char *buf, size_t buflen)
{
    this->buf = buf;
    this->buflen = buflen;
}


template <typename Char>
BufferInput<Char>::BufferInput(const BufferInput<Char> &other)
{
    this->buflen = other.buflen;
    this->buf = new Char[other.buflen];
    if (other.buflen > 0)
    {
        memcpy(this->buf, other.buf, other.buflen * sizeof(Char));
    }
}


template <typename Char>
BufferInput<Char>::~BufferInput()
{
    delete[] this->buf;
}


template <typename Char>
Result BufferInput<Char>::FromBytes(const uint8_t *data, size_t len, BufferInput<Char> *&out)
{
    if (len % sizeof(Char) != 0)
    {
        // cannot use odd-length data
        out = nullptr;
        return kPersistenceError;
    }

    size_t buflen = len / sizeof(Char);
    Char *buf = new Char[buflen];
    for (size_t i = 0; i < buflen; i++)
    {
        Char c = 0;
        for (size_t b = 0; b < sizeof(Char); b++)
        {
            c |= static_cast<Char>(static_cast<Char>(data[i * sizeof(Char) + b]) << (8 * b));
        }
        buf[i] = c;
    }

    out = new BufferInput<Char>(buf, buflen);
    return kSuccess;
}


template <typename Char>
void BufferInput<Char>::ToBytes(std::vector<uint8_t> &out) const
{
    out.reserve(out.size() + this->buflen * sizeof(Char));
    for (size_t i = 0; i < this->buflen; i++)
    {
        for (size_t b = 0; b < sizeof(Char); b++)
        {
            out.push_back(static_cast<uint8_t>((this->buf[i] >> (8 * b)) & 0xFF));
        }
    }
}


template <typename Char>
Result BufferInput<Char>::FromFile(const std::string &path, BufferInput<Char> *&out)
{
    std::vector<uint8_t> bytes;
    if (!ReadFile(path, bytes))
    {
        if (f::FLAG_debug)
        {
            std::cout << "DEBUG could not read input file " << path << std::endl;
        }
        out = nullptr;
        return kPersistenceError;
    }

    return FromBytes(bytes.data(), bytes.size(), out);
}


template <typename Char>
Result BufferInput<Char>::ToFile(const std::string &path) const
{
    std::vector<uint8_t> bytes;
    this->ToBytes(bytes);

    if (!WriteFileAtomic(path, bytes.data(), bytes.size()))
    {
        if (f::FLAG_debug)
        {
            std::cout << "DEBUG could not write input file " << path << std::endl;
        }
        return kPersistenceError;
    }

    return kSuccess;
}


template <typename Char>
bool BufferInput<Char>::operator==(const BufferInput<Char> &other) const
{
    if (this->buflen != other.buflen)
    {
        return false;
    }
    return this->buflen == 0 || memcmp(this->buf, other.buf, this->buflen * sizeof(Char)) == 0;
}


template <typename Char>
std::string BufferInput<Char>::ToString() const
{
    std::ostringstream out;
    out << "width=" << sizeof(Char) << " len=" << this->buflen;

    out << " word=\"";
    for (size_t i = 0; i < this->buflen; i++)
    {
        Char c = this->buf[i];
        if ('\\' == c)
        {
            out << "\\\\";
        }
        else if (' ' <= c && c <= '~')
        {
            out << static_cast<char>(c);
        }
        else if (c == '\n')
        {
            out << "\\n";
        }
        else if (c == '\t')
        {
            out << "\\t";
        }
        else if (c == '\r')
        {
            out << "\\r";
        }
        else
        {
            out << "\\x";
            out << std::setw(sizeof(Char) * 2) << std::setfill('0') << std::hex
                << static_cast<uint32_t>(c);
            out << std::dec << std::setw(0) << std::setfill(' ');
        }
    }
    out << "\"";

    return out.str();
}


// Specialization
template class BufferInput<uint8_t>;
template class BufferInput<uint16_t>;

}
}
