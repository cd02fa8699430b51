#include "wfsync/workflow/hasher.hpp"

#include <gtest/gtest.h>

using wfsync::workflow::CanonicalHasher;
using wfsync::workflow::Document;

TEST(CanonicalHasherTest, Sha256KnownVectors) {
    EXPECT_EQ(CanonicalHasher::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(CanonicalHasher::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CanonicalHasherTest, KeyOrderDoesNotMatter) {
    auto a = Document::parse(R"({"name":"Flow","nodes":[],"settings":{"x":1,"y":2}})");
    auto b = Document::parse(R"({"settings":{"y":2,"x":1},"nodes":[],"name":"Flow"})");

    EXPECT_EQ(CanonicalHasher::canonical_text(a), CanonicalHasher::canonical_text(b));
    EXPECT_EQ(CanonicalHasher::hash(a), CanonicalHasher::hash(b));
}

TEST(CanonicalHasherTest, ArrayOrderMatters) {
    auto a = Document::parse(R"({"nodes":[{"name":"A"},{"name":"B"}]})");
    auto b = Document::parse(R"({"nodes":[{"name":"B"},{"name":"A"}]})");

    EXPECT_NE(CanonicalHasher::hash(a), CanonicalHasher::hash(b));
}

TEST(CanonicalHasherTest, CanonicalTextIsCompactAndSorted) {
    auto doc = Document::parse(R"({"b":1,"a":[2.0,"x"],"c":{"z":null,"y":true}})");

    EXPECT_EQ(CanonicalHasher::canonical_text(doc), R"({"a":[2,"x"],"b":1,"c":{"y":true,"z":null}})");
}

TEST(CanonicalHasherTest, IntegralFloatsHashLikeIntegers) {
    auto as_float = Document::parse(R"({"position":[250.0,300.0]})");
    auto as_int = Document::parse(R"({"position":[250,300]})");

    EXPECT_EQ(CanonicalHasher::hash(as_float), CanonicalHasher::hash(as_int));

    auto fractional = Document::parse(R"({"position":[250.5,300]})");
    EXPECT_NE(CanonicalHasher::hash(fractional), CanonicalHasher::hash(as_int));
}

TEST(CanonicalHasherTest, HashIsLowerHexOf64Chars) {
    const auto hash = CanonicalHasher::hash(Document::object());

    ASSERT_EQ(hash.size(), 64u);
    EXPECT_EQ(hash.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(CanonicalHasherTest, UnicodeIsHashedAsUtf8) {
    auto a = Document::parse(R"({"name":"Café ✓"})");
    auto b = Document::parse("{\"name\":\"Caf\\u00e9 \\u2713\"}");

    EXPECT_EQ(CanonicalHasher::hash(a), CanonicalHasher::hash(b));
}
