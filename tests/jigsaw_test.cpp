#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <numeric>
#include <set>

#include "Jigsaw/Jigsaw.hpp"
#include "errors/errors.hpp"
#include "fsUtils/fsUtils.hpp"
#include "test_util.hpp"

using namespace jigsaw;

namespace
{
    EncodeOptions options(SlicerKind kind, std::size_t blocksize, std::size_t threads = 1)
    {
        EncodeOptions o;
        o.slicer = kind;
        o.blocksize = blocksize;
        o.filenamelength = 30;
        o.hashlength = 16;
        o.original_filename = "source.bin";
        o.threads = threads;
        return o;
    }

    std::map<std::string, Bytes> storeOf(const EncodeResult &result)
    {
        std::map<std::string, Bytes> store;
        for (const auto &f : result.fragments)
        {
            store[f.name] = f.bytes;
        }
        return store;
    }

    std::vector<std::uint64_t> sizesOf(const Manifest &manifest)
    {
        std::vector<std::uint64_t> sizes;
        for (const auto &e : manifest.entries)
            sizes.push_back(e.size);
        return sizes;
    }

    Bytes roundTrip(const Bytes &source, const EncodeOptions &opts, std::uint64_t seed)
    {
        Rng rng(seed);
        EncodeResult result = encode(source, opts, rng);
        auto store = storeOf(result);
        return decode(ManifestCodec::encode(result.manifest), test::mapLookup(store), opts.threads);
    }
}

TEST(JigsawTest, RoundTripsAllShapes)
{
    for (auto kind : {SlicerKind::Even, SlicerKind::Uneven})
    {
        for (std::size_t threads : {1u, 4u})
        {
            for (std::size_t size : {0u, 3u, 12u, 10u, 4097u})
            {
                Bytes source = test::makeBytes(size, static_cast<std::uint32_t>(size));
                EXPECT_EQ(roundTrip(source, options(kind, 4, threads), 99), source)
                    << toString(kind) << " threads=" << threads << " size=" << size;
            }
        }
    }
}

TEST(JigsawTest, EvenScenario)
{
    Bytes source = test::toBytes("0123456789");
    Rng rng(1);
    EncodeResult result = encode(source, options(SlicerKind::Even, 4), rng);

    EXPECT_EQ(sizesOf(result.manifest), (std::vector<std::uint64_t>{4, 4, 2}));
    EXPECT_EQ(result.manifest.original_size, 10u);
    EXPECT_EQ(result.fragments.size(), 3u);

    auto store = storeOf(result);
    EXPECT_EQ(decode(result.manifest, test::mapLookup(store)), source);
}

TEST(JigsawTest, UnevenScenario)
{
    Bytes source = test::makeBytes(100);
    Rng rng(77);
    EncodeResult result = encode(source, options(SlicerKind::Uneven, 10), rng);

    const auto &entries = result.manifest.entries;
    ASSERT_FALSE(entries.empty());
    std::uint64_t total = 0;
    for (const auto &e : entries)
    {
        EXPECT_GE(e.size, 1u);
        EXPECT_LE(e.size, 20u);
        total += e.size;
    }
    EXPECT_EQ(total, 100u);

    auto store = storeOf(result);
    EXPECT_EQ(decode(result.manifest, test::mapLookup(store)), source);
}

TEST(JigsawTest, CoverageAndUniqueNames)
{
    EncodeOptions opts = options(SlicerKind::Even, 3);
    opts.filenamelength = 4;
    Rng rng(3);
    Bytes source = test::makeBytes(3000);
    EncodeResult result = encode(source, opts, rng);

    const auto &entries = result.manifest.entries;
    ASSERT_EQ(entries.size(), 1000u);
    std::set<std::string> names;
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        EXPECT_EQ(entries[i].logical_index, i);
        EXPECT_EQ(entries[i].name.size(), 4u);
        EXPECT_EQ(entries[i].digest.size(), 16u);
        names.insert(entries[i].name);
        total += entries[i].size;
    }
    EXPECT_EQ(names.size(), entries.size());
    EXPECT_EQ(total, result.manifest.original_size);
}

TEST(JigsawTest, StorageOrderIsAPermutationOfTheManifest)
{
    Rng rng(8);
    EncodeResult result = encode(test::makeBytes(400), options(SlicerKind::Even, 4), rng);

    std::vector<std::string> logical;
    for (const auto &e : result.manifest.entries)
        logical.push_back(e.name);
    std::vector<std::string> stored;
    for (const auto &f : result.fragments)
        stored.push_back(f.name);

    EXPECT_TRUE(std::is_permutation(logical.begin(), logical.end(), stored.begin(), stored.end()));
    EXPECT_NE(logical, stored);
}

TEST(JigsawTest, SameSeedSameOutput)
{
    Bytes source = test::makeBytes(2048);
    for (std::size_t threads : {1u, 4u})
    {
        Rng a(1234);
        Rng b(1234);
        EncodeResult first = encode(source, options(SlicerKind::Uneven, 16, 1), a);
        EncodeResult second = encode(source, options(SlicerKind::Uneven, 16, threads), b);

        EXPECT_EQ(first.manifest, second.manifest);
        ASSERT_EQ(first.fragments.size(), second.fragments.size());
        for (std::size_t i = 0; i < first.fragments.size(); ++i)
        {
            EXPECT_EQ(first.fragments[i].name, second.fragments[i].name);
            EXPECT_EQ(first.fragments[i].bytes, second.fragments[i].bytes);
        }
    }
}

TEST(JigsawTest, EveryTamperedByteIsDetected)
{
    Bytes source = test::makeBytes(64);
    Rng rng(4);
    EncodeResult result = encode(source, options(SlicerKind::Even, 16), rng);
    const auto pristine = storeOf(result);

    for (const auto &entry : result.manifest.entries)
    {
        for (std::size_t pos = 0; pos < entry.size; ++pos)
        {
            auto store = pristine;
            store[entry.name][pos] ^= 0x20;
            try
            {
                decode(result.manifest, test::mapLookup(store));
                FAIL() << "tampering went unnoticed in " << entry.name << " at " << pos;
            }
            catch (const IntegrityMismatch &e)
            {
                EXPECT_EQ(e.index(), entry.logical_index);
                EXPECT_EQ(e.name(), entry.name);
            }
        }
    }
}

TEST(JigsawTest, MissingFragmentIsNamed)
{
    Rng rng(6);
    EncodeResult result = encode(test::makeBytes(50), options(SlicerKind::Even, 8), rng);
    auto store = storeOf(result);
    const ManifestEntry &victim = result.manifest.entries[3];
    store.erase(victim.name);

    try
    {
        decode(result.manifest, test::mapLookup(store), 2);
        FAIL() << "expected MissingFragment";
    }
    catch (const MissingFragment &e)
    {
        EXPECT_EQ(e.name(), victim.name);
        EXPECT_EQ(e.index(), 3u);
    }
}

TEST(JigsawTest, UnknownVersionReadsNoFragments)
{
    Rng rng(6);
    EncodeResult result = encode(test::makeBytes(50), options(SlicerKind::Even, 8), rng);
    std::string text = ManifestCodec::encode(result.manifest);
    auto pos = text.find("\"version\": 1");
    ASSERT_NE(pos, std::string::npos);
    text.replace(pos, 12, "\"version\": 99");

    std::atomic<int> calls{0};
    FragmentLookup counting = [&calls](const std::string &) -> std::optional<Bytes>
    {
        ++calls;
        return std::nullopt;
    };
    EXPECT_THROW(decode(text, counting), UnsupportedVersion);
    EXPECT_EQ(calls.load(), 0);
}

TEST(JigsawTest, ReservedNamesAreNeverUsed)
{
    EncodeOptions opts = options(SlicerKind::Even, 1);
    opts.filenamelength = 2;

    Rng probe_rng(10);
    EncodeResult probe = encode(test::makeBytes(20), opts, probe_rng);
    for (const auto &e : probe.manifest.entries)
        opts.reserved_names.insert(e.name);

    Rng rng(10);
    EncodeResult result = encode(test::makeBytes(20), opts, rng);
    for (const auto &e : result.manifest.entries)
    {
        EXPECT_EQ(opts.reserved_names.count(e.name), 0u) << e.name;
    }
    EXPECT_EQ(decode(result.manifest, test::mapLookup(storeOf(result))), test::makeBytes(20));
}

TEST(JigsawTest, TooShortNamesFailFast)
{
    EncodeOptions opts = options(SlicerKind::Even, 1);
    opts.filenamelength = 1;
    Rng rng(0);
    EXPECT_THROW(encode(test::makeBytes(100), opts, rng), NameSpaceExhausted);
}

TEST(JigsawTest, RejectsInvalidOptions)
{
    Rng rng(0);
    Bytes source = test::makeBytes(10);

    EncodeOptions opts = options(SlicerKind::Even, 4);
    opts.version = 2;
    EXPECT_THROW(encode(source, opts, rng), UnsupportedVersion);

    opts = options(SlicerKind::Even, 0);
    EXPECT_THROW(encode(source, opts, rng), InvalidParameter);

    opts = options(SlicerKind::Even, 4);
    opts.hashlength = 0;
    EXPECT_THROW(encode(source, opts, rng), InvalidParameter);

    opts = options(SlicerKind::Even, 4);
    opts.filenamelength = 0;
    EXPECT_THROW(encode(source, opts, rng), InvalidParameter);
}

TEST(JigsawTest, LongHashLengthRoundTrips)
{
    EncodeOptions opts = options(SlicerKind::Uneven, 32);
    opts.hashlength = 150;
    Rng rng(12);
    Bytes source = test::makeBytes(1000);
    EncodeResult result = encode(source, opts, rng);
    for (const auto &e : result.manifest.entries)
    {
        EXPECT_EQ(e.digest.size(), 150u);
    }
    EXPECT_EQ(decode(ManifestCodec::encode(result.manifest), test::mapLookup(storeOf(result))), source);
}

TEST(JigsawTest, ChecksumReport)
{
    Bytes source = test::makeBytes(300);
    Rng rng(2);
    EncodeResult result = encode(source, options(SlicerKind::Even, 64), rng);
    ASSERT_EQ(result.manifest.checksums.size(), 6u);

    DecodeReport good = compareChecksums(result.manifest, source);
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(good.fragments, 5u);
    EXPECT_EQ(good.checksums.size(), 6u);

    Bytes altered = source;
    altered[0] ^= 1;
    EXPECT_FALSE(compareChecksums(result.manifest, altered).ok());
}

TEST(JigsawTest, RoundTripsThroughADirectory)
{
    test::TempDir dir;
    Bytes source = test::makeBytes(5000);
    Rng rng(31);
    EncodeResult result = encode(source, options(SlicerKind::Uneven, 100), rng);

    for (const auto &f : result.fragments)
    {
        fsUtils::writeBinaryFile(dir.path() / f.name, f.bytes);
    }
    fsUtils::writeTextFile(dir.path() / "source.bin.jgk", ManifestCodec::encode(result.manifest));

    std::string text = fsUtils::readTextFile(dir.path() / "source.bin.jgk");
    EXPECT_EQ(decode(text, fsUtils::directoryLookup(dir.path()), 3), source);

    std::filesystem::remove(dir.path() / result.manifest.entries.front().name);
    EXPECT_THROW(decode(text, fsUtils::directoryLookup(dir.path())), MissingFragment);
}
