#include "corpus/corpus.hpp"
#include "util.hpp"

#include "test-helpers.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace seedbank::corpus;
using seedbank::DirPlusFile;
using seedbank::PathExists;
using seedbank::ReadFile;
using seedbank::test::ScratchDir;
using seedbank::test::WriteBytes;


template<typename Input>
static Input *make_input(const std::vector<uint8_t> &bytes)
{
    Input *input = nullptr;
    Input::FromBytes(bytes.data(), bytes.size(), input);
    return input;
}


TEST_CASE( "New input gets the first id under the corpus directory" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    REQUIRE( corp.GetDirPath() == dir.path );
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({0, 0, 0, 0}))) == kSuccess );

    REQUIRE( corp.Count() == 1 );
    REQUIRE( corp.Get(0)->GetFilename() == DirPlusFile(dir.path, "id_0") );
}


TEST_CASE( "Added input is written through to disk" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'a', 'b'}))) == kSuccess );
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'c'}))) == kSuccess );

    std::vector<uint8_t> on_disk;
    REQUIRE( ReadFile(dir.Join("id_0"), on_disk) );
    REQUIRE( on_disk == std::vector<uint8_t>({'a', 'b'}) );

    on_disk.clear();
    REQUIRE( ReadFile(dir.Join("id_1"), on_disk) );
    REQUIRE( on_disk == std::vector<uint8_t>({'c'}) );
}


TEST_CASE( "Corpus directory is created on first add" )
{
    ScratchDir dir;
    std::string nested = dir.Join("queue/inner");
    OnDiskCorpus<BytesInput> corp(nested);

    REQUIRE_FALSE( PathExists(nested) );
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({1}))) == kSuccess );
    REQUIRE( PathExists(DirPlusFile(nested, "id_0")) );
}


TEST_CASE( "Assigned names are never reused after removal" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({1}))) == kSuccess );
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({2}))) == kSuccess );

    delete corp.Remove(*corp.Get(1));
    REQUIRE( corp.Count() == 1 );

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({3}))) == kSuccess );
    REQUIRE( corp.Get(1)->GetFilename() == dir.Join("id_2") );
}


TEST_CASE( "Names already in the directory are skipped" )
{
    ScratchDir dir;
    REQUIRE( WriteBytes(dir.Join("id_0"), {'o', 'l', 'd'}) );
    REQUIRE( WriteBytes(dir.Join("id_1"), {'o', 'l', 'd'}) );

    OnDiskCorpus<BytesInput> corp(dir.path);
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'n'}))) == kSuccess );
    REQUIRE( corp.Get(0)->GetFilename() == dir.Join("id_2") );

    // the old file is left alone
    std::vector<uint8_t> on_disk;
    REQUIRE( ReadFile(dir.Join("id_0"), on_disk) );
    REQUIRE( on_disk == std::vector<uint8_t>({'o', 'l', 'd'}) );
}


TEST_CASE( "Testcases with a filename are not rewritten" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.Join("corpus"));

    std::string elsewhere = dir.Join("fancyfile");
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({0, 0, 0, 0}), elsewhere)) == kSuccess );

    REQUIRE( corp.Get(0)->GetFilename() == elsewhere );
    REQUIRE_FALSE( PathExists(elsewhere) );
    REQUIRE_FALSE( PathExists(dir.Join("corpus")) );
}


TEST_CASE( "Named testcase inside the directory is written and its name reserved" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'A'}), dir.Join("id_0"))) == kSuccess );
    REQUIRE( PathExists(dir.Join("id_0")) );

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'B'}))) == kSuccess );
    REQUIRE( corp.Get(1)->GetFilename() == dir.Join("id_1") );

    // each entry reloads its own bytes
    REQUIRE( corp.UnloadTestcase(0) == kSuccess );
    REQUIRE( corp.LoadTestcase(0) == kSuccess );
    REQUIRE( corp.Get(0)->GetInput()->buf[0] == 'A' );

    REQUIRE( corp.UnloadTestcase(1) == kSuccess );
    REQUIRE( corp.LoadTestcase(1) == kSuccess );
    REQUIRE( corp.Get(1)->GetInput()->buf[0] == 'B' );
}


TEST_CASE( "Assigned names skip names held by lazy entries" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    // referenced, not loaded, and not on disk yet
    REQUIRE( corp.Add(new Testcase<BytesInput>(dir.Join("id_0"))) == kSuccess );
    REQUIRE_FALSE( PathExists(dir.Join("id_0")) );

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'B'}))) == kSuccess );
    REQUIRE( corp.Get(1)->GetFilename() == dir.Join("id_1") );
}


TEST_CASE( "Existing file under a given name is not overwritten" )
{
    ScratchDir dir;
    REQUIRE( WriteBytes(dir.Join("keep"), {'o', 'l', 'd'}) );

    OnDiskCorpus<BytesInput> corp(dir.path);
    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'n'}), dir.Join("keep"))) == kSuccess );

    std::vector<uint8_t> on_disk;
    REQUIRE( ReadFile(dir.Join("keep"), on_disk) );
    REQUIRE( on_disk == std::vector<uint8_t>({'o', 'l', 'd'}) );
}


TEST_CASE( "Two entries cannot share a name inside the directory" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'A'}))) == kSuccess );

    Testcase<BytesInput> *dup = new Testcase<BytesInput>(make_input<BytesInput>({'B'}), dir.Join("id_0"));
    REQUIRE( corp.Add(dup) == kIllegalState );
    REQUIRE( corp.Count() == 1 );
    REQUIRE( dup->GetHandle() == 0 );

    std::vector<uint8_t> on_disk;
    REQUIRE( ReadFile(dir.Join("id_0"), on_disk) );
    REQUIRE( on_disk == std::vector<uint8_t>({'A'}) );

    delete dup;
}


TEST_CASE( "Failed write leaves the testcase with the caller" )
{
    ScratchDir dir;
    // a regular file where the corpus directory should be
    std::string blocker = dir.Join("blocker");
    REQUIRE( WriteBytes(blocker, {1}) );

    OnDiskCorpus<BytesInput> corp(blocker);
    Testcase<BytesInput> *testcase = new Testcase<BytesInput>(make_input<BytesInput>({1}));

    REQUIRE( corp.Add(testcase) == kPersistenceError );
    REQUIRE( corp.Count() == 0 );
    REQUIRE_FALSE( testcase->HasFilename() );
    REQUIRE( testcase->GetHandle() == 0 );

    delete testcase;
}


TEST_CASE( "Empty testcase is rejected by the on-disk corpus" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);
    Testcase<BytesInput> *testcase = new Testcase<BytesInput>(std::string(""));

    REQUIRE( corp.Add(testcase) == kIllegalState );
    REQUIRE( corp.Count() == 0 );

    delete testcase;
}


TEST_CASE( "Unloaded on-disk entry reloads what was persisted" )
{
    ScratchDir dir;
    OnDiskCorpus<BytesInput> corp(dir.path);

    REQUIRE( corp.Add(new Testcase<BytesInput>(make_input<BytesInput>({'p', 'e', 'r'}))) == kSuccess );
    REQUIRE( corp.UnloadTestcase(0) == kSuccess );
    REQUIRE( corp.Get(0)->GetInput() == nullptr );

    REQUIRE( corp.LoadTestcase(0) == kSuccess );
    BytesInput *expected = make_input<BytesInput>({'p', 'e', 'r'});
    REQUIRE( *corp.Get(0)->GetInput() == *expected );
    delete expected;
}


TEST_CASE( "Wide inputs persist as 16-bit units" )
{
    ScratchDir dir;
    OnDiskCorpus<WideInput> corp(dir.path);

    REQUIRE( corp.Add(new Testcase<WideInput>(make_input<WideInput>({0x34, 0x12, 0xac, 0x20}))) == kSuccess );
    REQUIRE( corp.UnloadTestcase(0) == kSuccess );
    REQUIRE( corp.LoadTestcase(0) == kSuccess );

    const WideInput *input = corp.Get(0)->GetInput();
    REQUIRE( input->buflen == 2 );
    REQUIRE( input->buf[0] == 0x1234 );
    REQUIRE( input->buf[1] == 0x20ac );
}


TEST_CASE( "Import a seed directory lazily" )
{
    ScratchDir seeds;
    REQUIRE( WriteBytes(seeds.Join("b-seed"), {'b'}) );
    REQUIRE( WriteBytes(seeds.Join("a-seed"), {'a', 'a'}) );
    REQUIRE( WriteBytes(seeds.Join(".hidden"), {'h'}) );

    ScratchDir out;
    OnDiskCorpus<BytesInput> corp(out.path);

    size_t n_imported = 0;
    REQUIRE( ImportDirectory<BytesInput>(corp, seeds.path, true, n_imported) == kSuccess );
    REQUIRE( n_imported == 2 );
    REQUIRE( corp.Count() == 2 );

    // name order, nothing loaded yet
    REQUIRE( corp.Get(0)->GetFilename() == seeds.Join("a-seed") );
    REQUIRE( corp.Get(1)->GetFilename() == seeds.Join("b-seed") );
    REQUIRE( corp.Get(0)->GetInput() == nullptr );
    REQUIRE_FALSE( PathExists(out.Join("id_0")) );

    REQUIRE( corp.LoadTestcase(0) == kSuccess );
    REQUIRE( corp.Get(0)->GetInput()->buflen == 2 );
}


TEST_CASE( "Import a seed directory by copying" )
{
    ScratchDir seeds;
    REQUIRE( WriteBytes(seeds.Join("one"), {'1'}) );
    REQUIRE( WriteBytes(seeds.Join("two"), {'2', '2'}) );

    ScratchDir out;
    OnDiskCorpus<BytesInput> corp(out.path);

    size_t n_imported = 0;
    REQUIRE( ImportDirectory<BytesInput>(corp, seeds.path, false, n_imported) == kSuccess );
    REQUIRE( n_imported == 2 );

    REQUIRE( corp.Get(0)->GetFilename() == out.Join("id_0") );
    REQUIRE( corp.Get(1)->GetFilename() == out.Join("id_1") );
    REQUIRE( corp.Get(1)->GetInput() != nullptr );

    std::vector<uint8_t> on_disk;
    REQUIRE( ReadFile(out.Join("id_1"), on_disk) );
    REQUIRE( on_disk == std::vector<uint8_t>({'2', '2'}) );
}


TEST_CASE( "Importing a missing directory fails" )
{
    ScratchDir dir;
    InMemoryCorpus<BytesInput> corp;

    size_t n_imported = 7;
    REQUIRE( ImportDirectory<BytesInput>(corp, dir.Join("nothing-here"), true, n_imported) == kPersistenceError );
    REQUIRE( n_imported == 0 );
    REQUIRE( corp.Count() == 0 );
}


TEST_CASE( "Copy-importing a malformed wide seed stops the import" )
{
    ScratchDir seeds;
    REQUIRE( WriteBytes(seeds.Join("a"), {1, 0}) );
    REQUIRE( WriteBytes(seeds.Join("b"), {1, 0, 2}) );

    InMemoryCorpus<WideInput> corp;
    size_t n_imported = 0;
    REQUIRE( ImportDirectory<WideInput>(corp, seeds.path, false, n_imported) == kPersistenceError );
    REQUIRE( n_imported == 1 );
    REQUIRE( corp.Count() == 1 );
}
