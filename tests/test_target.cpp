#include <gtest/gtest.h>
#include "download_error.h"
#include "target.h"

namespace {

ErrorKind parseErrorKind(const std::string& url) {
    try {
        parseTarget(url);
    } catch (const DownloadError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected DownloadError for " << url;
    return ErrorKind::FetchError;
}

} // namespace

TEST(TargetTest, ParsesHostPortAndPath) {
    Target t = parseTarget("http://example.com:8080/files/archive.tar.gz");
    EXPECT_EQ(t.scheme, "http");
    EXPECT_EQ(t.host, "example.com");
    EXPECT_EQ(t.port, 8080);
    EXPECT_EQ(t.path, "/files/archive.tar.gz");
    EXPECT_EQ(t.url, "http://example.com:8080/files/archive.tar.gz");
}

TEST(TargetTest, DefaultPortFilledIn) {
    EXPECT_EQ(parseTarget("http://example.com/a").port, 80);
    EXPECT_EQ(parseTarget("https://example.com/a").port, 443);
    EXPECT_EQ(parseTarget("http://example.com/a").url, "http://example.com/a");
}

TEST(TargetTest, QueryKeptFragmentDropped) {
    Target t = parseTarget("http://example.com/get/file.iso?mirror=2#top");
    EXPECT_EQ(t.path, "/get/file.iso");
    EXPECT_EQ(t.url, "http://example.com/get/file.iso?mirror=2");
}

TEST(TargetTest, MissingPathBecomesRoot) {
    Target t = parseTarget("http://example.com");
    EXPECT_EQ(t.path, "/");
}

TEST(TargetTest, RejectsGarbage) {
    EXPECT_EQ(parseErrorKind("not a url"), ErrorKind::ParameterError);
    EXPECT_EQ(parseErrorKind(""), ErrorKind::ParameterError);
}

TEST(TargetTest, RejectsNonHttpSchemes) {
    EXPECT_EQ(parseErrorKind("ftp://example.com/file"), ErrorKind::ParameterError);
}

// ── fileNameFromPath / urlDecode ───────────────────────────────

TEST(TargetTest, FileNameIsLastSegment) {
    EXPECT_EQ(fileNameFromPath("/files/archive.tar.gz"), "archive.tar.gz");
    EXPECT_EQ(fileNameFromPath("/top"), "top");
}

TEST(TargetTest, FileNameIsPercentDecoded) {
    EXPECT_EQ(fileNameFromPath("/dl/my%20file%2Bv2.bin"), "my file+v2.bin");
}

TEST(TargetTest, DirectoryPathHasNoFileName) {
    EXPECT_EQ(fileNameFromPath("/files/"), "");
    EXPECT_EQ(fileNameFromPath("/"), "");
}

TEST(TargetTest, MalformedEscapesKeptVerbatim) {
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zzabc"), "%zzabc");
    EXPECT_EQ(urlDecode("a+b"), "a+b");
}
