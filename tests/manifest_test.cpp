#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "Manifest/Manifest.hpp"
#include "errors/errors.hpp"

using namespace jigsaw;
using json = nlohmann::json;

namespace
{
    Manifest sampleManifest()
    {
        Manifest m;
        m.version = 1;
        m.slicer_kind = SlicerKind::Uneven;
        m.blocksize = 4;
        m.filenamelength = 5;
        m.hashlength = 8;
        m.original_filename = "DataA.xlsx";
        m.original_size = 10;
        m.checksums = {{"md5", "00112233"}, {"sha256", "aabbccdd"}};
        m.entries = {
            {0, "ABCDE", "0123abcd", 4},
            {1, "qrt12", "deadbeef", 4},
            {2, "Zzzzz", "cafebabe", 2},
        };
        return m;
    }

    json sampleJson()
    {
        return json::parse(ManifestCodec::encode(sampleManifest()));
    }

    template <typename Error>
    void expectDecodeThrows(const json &j)
    {
        EXPECT_THROW(ManifestCodec::decode(j.dump()), Error) << j.dump();
    }
}

TEST(ManifestTest, RoundTrips)
{
    Manifest m = sampleManifest();
    EXPECT_EQ(ManifestCodec::decode(ManifestCodec::encode(m)), m);
}

TEST(ManifestTest, RoundTripsEmptyManifest)
{
    Manifest m;
    m.blocksize = 32768;
    m.filenamelength = 30;
    m.hashlength = 16;
    m.original_filename = "empty.bin";
    EXPECT_EQ(ManifestCodec::decode(ManifestCodec::encode(m)), m);
}

TEST(ManifestTest, WritesFileNamesThatAreNotUtf8)
{
    Manifest m = sampleManifest();
    m.original_filename = "caf\xe9.txt";

    std::string text;
    ASSERT_NO_THROW(text = ManifestCodec::encode(m));
    Manifest decoded = ManifestCodec::decode(text);
    EXPECT_EQ(decoded.original_filename, "caf\xef\xbf\xbd.txt");
    EXPECT_EQ(decoded.entries, m.entries);
}

TEST(ManifestTest, WritesDocumentedFields)
{
    json j = sampleJson();
    EXPECT_EQ(j["format"], "jigsaw-keyfile");
    EXPECT_EQ(j["version"], 1);
    EXPECT_EQ(j["slicer"], "uneven");
    EXPECT_EQ(j["entries"].size(), 3u);
    EXPECT_EQ(j["entries"][1]["index"], 1);
    EXPECT_EQ(j["entries"][1]["name"], "qrt12");
}

TEST(ManifestTest, RejectsUnknownVersion)
{
    json j = sampleJson();
    j["version"] = 2;
    try
    {
        ManifestCodec::decode(j.dump());
        FAIL() << "expected UnsupportedVersion";
    }
    catch (const UnsupportedVersion &e)
    {
        EXPECT_EQ(e.version(), 2);
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedVersion);
    }

    Manifest m = sampleManifest();
    m.version = 7;
    EXPECT_THROW(ManifestCodec::encode(m), UnsupportedVersion);
}

TEST(ManifestTest, RejectsMissingOrMistypedVersion)
{
    json j = sampleJson();
    j.erase("version");
    expectDecodeThrows<MalformedManifest>(j);

    j["version"] = "1";
    expectDecodeThrows<MalformedManifest>(j);
}

TEST(ManifestTest, RejectsNonJson)
{
    EXPECT_THROW(ManifestCodec::decode("#version>>JigsawFileONE\n"), MalformedManifest);
    EXPECT_THROW(ManifestCodec::decode("[1, 2, 3]"), MalformedManifest);
    EXPECT_THROW(ManifestCodec::decode(""), MalformedManifest);
}

TEST(ManifestTest, RejectsForeignFormatTag)
{
    json j = sampleJson();
    j["format"] = "something-else";
    expectDecodeThrows<MalformedManifest>(j);
}

TEST(ManifestTest, RejectsMissingFields)
{
    for (const char *key : {"slicer", "blocksize", "filenamelength", "hashlength",
                            "original_filename", "original_size", "entries"})
    {
        json j = sampleJson();
        j.erase(key);
        expectDecodeThrows<MalformedManifest>(j);
    }

    json j = sampleJson();
    j["entries"][0].erase("digest");
    expectDecodeThrows<MalformedManifest>(j);
}

TEST(ManifestTest, RejectsWrongTypes)
{
    json j = sampleJson();
    j["blocksize"] = "4";
    expectDecodeThrows<MalformedManifest>(j);

    j = sampleJson();
    j["entries"][0]["size"] = -4;
    expectDecodeThrows<MalformedManifest>(j);

    j = sampleJson();
    j["entries"] = json::object();
    expectDecodeThrows<MalformedManifest>(j);

    j = sampleJson();
    j["slicer"] = "diagonal";
    expectDecodeThrows<MalformedManifest>(j);

    j = sampleJson();
    j["hashlength"] = 0;
    expectDecodeThrows<MalformedManifest>(j);
}

TEST(ManifestTest, RejectsLengthsThatDisagreeWithHeader)
{
    json j = sampleJson();
    j["entries"][2]["name"] = "toolong";
    expectDecodeThrows<MalformedManifest>(j);

    j = sampleJson();
    j["entries"][0]["digest"] = "0123";
    expectDecodeThrows<MalformedManifest>(j);
}

TEST(ManifestTest, RejectsDuplicateAndMissingIndices)
{
    json j = sampleJson();
    j["entries"][2]["index"] = 1;
    expectDecodeThrows<MalformedManifest>(j);

    j = sampleJson();
    j["entries"][2]["index"] = 5;
    expectDecodeThrows<MalformedManifest>(j);
}

TEST(ManifestTest, AcceptsEntriesInAnyOrder)
{
    json j = sampleJson();
    std::swap(j["entries"][0], j["entries"][2]);
    EXPECT_EQ(ManifestCodec::decode(j.dump()), sampleManifest());
}

TEST(ManifestTest, IgnoresUnknownKeys)
{
    json j = sampleJson();
    j["comment"] = "written by a newer tool";
    j["entries"][0]["route"] = "courier-2";
    EXPECT_EQ(ManifestCodec::decode(j.dump()), sampleManifest());
}

TEST(ManifestTest, ChecksumsAreOptional)
{
    json j = sampleJson();
    j.erase("checksums");
    Manifest expected = sampleManifest();
    expected.checksums.clear();
    EXPECT_EQ(ManifestCodec::decode(j.dump()), expected);
}
