#include "corpus.hpp"
#include "testcase.hpp"
#include "util.hpp"
#include "flags.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace f = seedbank::flags;

namespace seedbank
{
namespace corpus
{

template<typename Input>
size_t Corpus<Input>::Count() const
{
    return this->Entries().size();
}


template<typename Input>
Result Corpus<Input>::Add(Testcase<Input> *testcase)
{
    if (!IsUsable(testcase))
    {
        return kIllegalState;
    }

    SetHandle(testcase, NextTestcaseHandle());
    this->Entries().push_back(testcase);

    return kSuccess;
}


template<typename Input>
Result Corpus<Input>::Replace(size_t idx, Testcase<Input> *testcase)
{
    std::vector<Testcase<Input> *> &entries = this->Entries();

    if (idx >= entries.size())
    {
        return kKeyNotFound;
    }

    Testcase<Input> *old = entries[idx];
    if (old == testcase)
    {
        return kSuccess;
    }

    if (!IsUsable(testcase))
    {
        return kIllegalState;
    }

    SetHandle(testcase, old->GetHandle());
    entries[idx] = testcase;
    delete old;

    return kSuccess;
}


template<typename Input>
Testcase<Input> *Corpus<Input>::Get(size_t idx)
{
    return this->Entries().at(idx);
}


template<typename Input>
const Testcase<Input> *Corpus<Input>::Get(size_t idx) const
{
    return this->Entries().at(idx);
}


template<typename Input>
size_t Corpus<Input>::IndexOfHandle(uint64_t handle) const
{
    const std::vector<Testcase<Input> *> &entries = this->Entries();

    if (handle == 0)
    {
        return entries.size();
    }

    for (size_t i = 0; i < entries.size(); i++)
    {
        if (entries[i]->GetHandle() == handle)
        {
            return i;
        }
    }

    return entries.size();
}


template<typename Input>
Testcase<Input> *Corpus<Input>::Remove(const Testcase<Input> &entry)
{
    std::vector<Testcase<Input> *> &entries = this->Entries();

    size_t idx = this->IndexOfHandle(entry.GetHandle());
    if (idx >= entries.size())
    {
        return nullptr;
    }

    Testcase<Input> *ret = entries[idx];
    entries.erase(entries.begin() + idx);
    SetHandle(ret, 0);

    return ret;
}


template<typename Input>
Result Corpus<Input>::RandomEntry(Rand &rand, Testcase<Input> *&out, size_t &idx_out) const
{
    size_t count = this->Count();
    if (count == 0)
    {
        return kEmptyCorpus;
    }

    idx_out = static_cast<size_t>(rand.Below(count));
    out = this->Entries()[idx_out];

    return kSuccess;
}


template<typename Input>
Result Corpus<Input>::LoadTestcase(size_t idx)
{
    if (idx >= this->Count())
    {
        return kKeyNotFound;
    }

    Testcase<Input> *testcase = this->Entries()[idx];
    if (testcase->GetInput() != nullptr)
    {
        // already loaded
        return kSuccess;
    }

    if (!testcase->HasFilename())
    {
        return kIllegalState;
    }

    Testcase<Input> *loaded = nullptr;
    Result result = Testcase<Input>::LoadFromDisk(testcase->GetFilename(), loaded);
    if (result != kSuccess)
    {
        return result;
    }

    loaded->TakeMetadatas(*testcase);

    result = this->Replace(idx, loaded);
    if (result != kSuccess)
    {
        // hand the annotations back before discarding the copy
        testcase->TakeMetadatas(*loaded);
        delete loaded;
        return result;
    }

    if (f::FLAG_debug)
    {
        std::cout << "DEBUG loaded testcase " << idx << " from " << loaded->GetFilename() << std::endl;
    }

    return kSuccess;
}


template<typename Input>
Result Corpus<Input>::UnloadTestcase(size_t idx)
{
    if (idx >= this->Count())
    {
        return kKeyNotFound;
    }

    Testcase<Input> *testcase = this->Entries()[idx];
    if (testcase->GetInput() == nullptr)
    {
        return kSuccess;
    }

    if (!testcase->HasFilename())
    {
        // the bytes would be lost
        return kIllegalState;
    }

    if (!PathExists(testcase->GetFilename()))
    {
        return kPersistenceError;
    }

    delete testcase->TakeInput();

    return kSuccess;
}


template<typename Input>
InMemoryCorpus<Input>::InMemoryCorpus()
    : pos(0),
      selected(false)
{
}


template<typename Input>
InMemoryCorpus<Input>::~InMemoryCorpus()
{
    while (this->entries.size() > 0)
    {
        delete this->entries.at(this->entries.size() - 1);
        this->entries.pop_back();
    }
}


template<typename Input>
std::vector<Testcase<Input> *> &InMemoryCorpus<Input>::Entries()
{
    return this->entries;
}


template<typename Input>
const std::vector<Testcase<Input> *> &InMemoryCorpus<Input>::Entries() const
{
    return this->entries;
}


template<typename Input>
Testcase<Input> *InMemoryCorpus<Input>::Remove(const Testcase<Input> &entry)
{
    size_t idx = this->IndexOfHandle(entry.GetHandle());
    if (idx >= this->entries.size())
    {
        return nullptr;
    }

    if (this->selected)
    {
        if (idx == this->pos)
        {
            // the selection is gone until the next Next()
            this->selected = false;
        }
        else if (idx < this->pos)
        {
            this->pos--;
        }
    }

    return Corpus<Input>::Remove(entry);
}


template<typename Input>
Result InMemoryCorpus<Input>::Next(Rand &rand, Testcase<Input> *&out, size_t &idx_out)
{
    Result result = this->RandomEntry(rand, out, idx_out);
    if (result != kSuccess)
    {
        return result;
    }

    this->pos = idx_out;
    this->selected = true;

    return kSuccess;
}


template<typename Input>
Result InMemoryCorpus<Input>::CurrentTestcase(Testcase<Input> *&out, size_t &idx_out) const
{
    if (!this->selected || this->pos >= this->entries.size())
    {
        return kIllegalState;
    }

    idx_out = this->pos;
    out = this->entries[this->pos];

    return kSuccess;
}


template<typename Input>
OnDiskCorpus<Input>::OnDiskCorpus(const std::string &dir_path)
    : dir_path(dir_path),
      next_id(0),
      dir_ready(false)
{
}


template<typename Input>
bool OnDiskCorpus<Input>::IsHeld(const std::string &filename) const
{
    for (size_t i = 0; i < this->entries.size(); i++)
    {
        if (this->entries[i]->GetFilename() == filename)
        {
            return true;
        }
    }
    return false;
}


template<typename Input>
bool OnDiskCorpus<Input>::InDirectory(const std::string &filename) const
{
    std::string prefix = DirPlusFile(this->dir_path, "");
    return filename.size() > prefix.size()
        && filename.compare(0, prefix.size(), prefix) == 0
        && filename.find('/', prefix.size()) == std::string::npos;
}


template<typename Input>
Result OnDiskCorpus<Input>::EnsureDirectory()
{
    if (this->dir_ready)
    {
        return kSuccess;
    }

    if (!MakeDirectories(this->dir_path))
    {
        if (f::FLAG_debug)
        {
            std::cout << "DEBUG could not create corpus directory " << this->dir_path << std::endl;
        }
        return kPersistenceError;
    }
    this->dir_ready = true;

    return kSuccess;
}


template<typename Input>
std::string OnDiskCorpus<Input>::NextFilename()
{
    while (true)
    {
        std::ostringstream name;
        name << "id_" << this->next_id;
        this->next_id++;

        std::string path = DirPlusFile(this->dir_path, name.str());
        if (!PathExists(path) && !this->IsHeld(path))
        {
            return path;
        }
    }
}


template<typename Input>
Result OnDiskCorpus<Input>::Add(Testcase<Input> *testcase)
{
    if (!Corpus<Input>::IsUsable(testcase))
    {
        return kIllegalState;
    }

    if (!testcase->HasFilename())
    {
        Result result = this->EnsureDirectory();
        if (result != kSuccess)
        {
            return result;
        }

        std::string filename = this->NextFilename();
        result = testcase->GetInput()->ToFile(filename);
        if (result != kSuccess)
        {
            return result;
        }

        testcase->SetFilename(filename);

        if (f::FLAG_debug)
        {
            std::cout << "DEBUG persisted new testcase to " << filename << std::endl;
        }
    }
    else if (this->InDirectory(testcase->GetFilename()))
    {
        const std::string &filename = testcase->GetFilename();

        if (this->IsHeld(filename))
        {
            return kIllegalState;
        }

        if (testcase->GetInput() != nullptr && !PathExists(filename))
        {
            // a name in our directory that nothing was written to yet
            Result result = this->EnsureDirectory();
            if (result != kSuccess)
            {
                return result;
            }

            result = testcase->GetInput()->ToFile(filename);
            if (result != kSuccess)
            {
                return result;
            }

            if (f::FLAG_debug)
            {
                std::cout << "DEBUG persisted named testcase to " << filename << std::endl;
            }
        }
    }

    return InMemoryCorpus<Input>::Add(testcase);
}


template<typename Input>
Result ImportDirectory(
    Corpus<Input> &corpus,
    const std::string &seed_dir,
    bool lazy,
    size_t &n_imported)
{
    n_imported = 0;

    std::vector<std::string> names;
    if (!ListRegularFiles(seed_dir, names))
    {
        return kPersistenceError;
    }

    for (size_t i = 0; i < names.size(); i++)
    {
        std::string path = DirPlusFile(seed_dir, names[i]);
        Testcase<Input> *testcase;

        if (lazy)
        {
            testcase = new Testcase<Input>(path);
        }
        else
        {
            Testcase<Input> *loaded = nullptr;
            Result result = Testcase<Input>::LoadFromDisk(path, loaded);
            if (result != kSuccess)
            {
                return result;
            }

            // drop the filename so the corpus stores its own copy
            testcase = new Testcase<Input>(loaded->TakeInput());
            delete loaded;
        }

        Result result = corpus.Add(testcase);
        if (result != kSuccess)
        {
            delete testcase;
            return result;
        }

        n_imported++;
    }

    if (f::FLAG_debug)
    {
        std::cout << "DEBUG imported " << n_imported << " seeds from " << seed_dir << std::endl;
    }

    return kSuccess;
}


// Specialization
template class Corpus<BytesInput>;
template class Corpus<WideInput>;
template class InMemoryCorpus<BytesInput>;
template class InMemoryCorpus<WideInput>;
template class OnDiskCorpus<BytesInput>;
template class OnDiskCorpus<WideInput>;

template Result ImportDirectory<BytesInput>(
    Corpus<BytesInput> &corpus,
    const std::string &seed_dir,
    bool lazy,
    size_t &n_imported);
template Result ImportDirectory<WideInput>(
    Corpus<WideInput> &corpus,
    const std::string &seed_dir,
    bool lazy,
    size_t &n_imported);

}
}
