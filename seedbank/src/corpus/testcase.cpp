#include "testcase.hpp"
#include "input.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>

namespace seedbank
{
namespace corpus
{

uint64_t NextTestcaseHandle()
{
    static std::atomic<uint64_t> next_handle(1);
    return next_handle++;
}


template <typename Input>
Testcase<Input>::Testcase(Input *input)
    : input(input),
      handle(0)
{
}


template <typename Input>
Testcase<Input>::Testcase(const std::string &filename)
    : input(nullptr),
      filename(filename),
      handle(0)
{
}


template <typename Input>
Testcase<Input>::Testcase(Input *input, const std::string &filename)
    : input(input),
      filename(filename),
      handle(0)
{
}


template <typename Input>
Testcase<Input>::~Testcase()
{
    delete this->input;

    for (auto it = this->metadatas.begin(); it != this->metadatas.end(); ++it)
    {
        delete it->second;
    }
}


template <typename Input>
Result Testcase<Input>::LoadFromDisk(const std::string &filename, Testcase<Input> *&out)
{
    out = nullptr;

    Input *input = nullptr;
    Result result = Input::FromFile(filename, input);
    if (result != kSuccess)
    {
        return result;
    }

    out = new Testcase<Input>(input, filename);
    return kSuccess;
}


template <typename Input>
void Testcase<Input>::SetInput(Input *input)
{
    if (input != this->input)
    {
        delete this->input;
    }
    this->input = input;
}


template <typename Input>
Input *Testcase<Input>::TakeInput()
{
    Input *ret = this->input;
    this->input = nullptr;
    return ret;
}


template <typename Input>
void Testcase<Input>::SetFilename(const std::string &filename)
{
    this->filename = filename;
}


template <typename Input>
void Testcase<Input>::AddMetadata(TestcaseMetadata *metadata)
{
    std::string name(metadata->Name());

    auto existing = this->metadatas.find(name);
    if (existing != this->metadatas.end())
    {
        if (existing->second != metadata)
        {
            delete existing->second;
        }
        existing->second = metadata;
        return;
    }

    this->metadatas[name] = metadata;
}


template <typename Input>
TestcaseMetadata *Testcase<Input>::GetMetadata(const std::string &name) const
{
    auto it = this->metadatas.find(name);
    if (it == this->metadatas.end())
    {
        return nullptr;
    }
    return it->second;
}


template <typename Input>
bool Testcase<Input>::RemoveMetadata(const std::string &name)
{
    auto it = this->metadatas.find(name);
    if (it == this->metadatas.end())
    {
        return false;
    }

    delete it->second;
    this->metadatas.erase(it);
    return true;
}


template <typename Input>
size_t Testcase<Input>::MetadataCount() const
{
    return this->metadatas.size();
}


template <typename Input>
void Testcase<Input>::TakeMetadatas(Testcase<Input> &other)
{
    if (&other == this)
    {
        return;
    }

    for (auto it = other.metadatas.begin(); it != other.metadatas.end(); ++it)
    {
        this->AddMetadata(it->second);
    }
    other.metadatas.clear();
}


template <typename Input>
std::string Testcase<Input>::ToString() const
{
    std::ostringstream out;
    out << "<Testcase handle=" << this->handle;

    if (this->HasFilename())
    {
        out << " file=" << this->filename;
    }

    if (this->input != nullptr)
    {
        out << " " << this->input->ToString();
    }
    else
    {
        out << " (not loaded)";
    }

    if (!this->metadatas.empty())
    {
        out << " meta=";
        for (auto it = this->metadatas.begin(); it != this->metadatas.end(); ++it)
        {
            if (it != this->metadatas.begin())
            {
                out << ",";
            }
            out << it->first;
        }
    }

    out << ">";
    return out.str();
}


// Specialization
template class Testcase<BytesInput>;
template class Testcase<WideInput>;

}
}
