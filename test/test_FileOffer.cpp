#include <gtest/gtest.h>
#include "p2pchat/FileOffer.hpp"
#include "TestSupport.hpp"
#include <string>

using namespace p2pchat;
using p2pchat::testing_support::TempFile;

// -----------------------
// SHA-256
// -----------------------
TEST(FileOfferTest, KnownDigest) {
    TempFile file("abc");
    EXPECT_EQ(sha256File(file.path()), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(FileOfferTest, EmptyFileDigest) {
    TempFile file("");
    EXPECT_EQ(sha256File(file.path()), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(FileOfferTest, DigestDependsOnlyOnContent) {
    const std::string contents(10000, 'x'); // spans several read blocks
    TempFile a(contents, "a.bin");
    TempFile b(contents, "b.bin");
    TempFile c(contents + "y", "c.bin");

    const std::string digest = sha256File(a.path());
    EXPECT_EQ(digest.size(), SHA256_HEX_LENGTH);
    EXPECT_EQ(digest, sha256File(b.path()));
    EXPECT_NE(digest, sha256File(c.path()));
}

TEST(FileOfferTest, MissingFileThrows) {
    try {
        sha256File("/nonexistent/p2pchat/file.txt");
        FAIL() << "expected FileNotFoundError";
    } catch (const FileNotFoundError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/p2pchat/file.txt");
        EXPECT_NE(std::string(e.what()).find("/nonexistent/p2pchat/file.txt"), std::string::npos);
    }
}

TEST(FileOfferTest, DirectoryIsNotAFile) {
    TempFile file("abc");
    EXPECT_THROW(sha256File(file.directory()), FileNotFoundError);
    EXPECT_THROW(buildFileOffer(file.directory(), "alice"), FileNotFoundError);
}

// -----------------------
// OFFER METADATA
// -----------------------
TEST(FileOfferTest, BuildUsesBasenameAndSize) {
    TempFile file("hello world", "notes.txt");
    FileOffer offer = buildFileOffer(file.path(), "alice");

    EXPECT_EQ(offer.filename, "notes.txt");
    EXPECT_EQ(offer.size, 11u);
    EXPECT_EQ(offer.sender, "alice");
    EXPECT_EQ(offer.hash, sha256File(file.path()));
    EXPECT_EQ(offer.filename.find('/'), std::string::npos);
}
