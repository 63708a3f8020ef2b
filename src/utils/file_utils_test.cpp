#include "file_utils.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(GuessMimeTests, CommonExtensions) {
  using namespace file_utils;
  EXPECT_EQ(guessMime("index.html"), "text/html; charset=utf-8");
  EXPECT_EQ(guessMime("readme.txt"), "text/plain; charset=utf-8");
  EXPECT_EQ(guessMime("style.css"), "text/css");
  EXPECT_EQ(guessMime("script.js"), "application/javascript");
  EXPECT_EQ(guessMime("image.jpg"), "image/jpeg");
  EXPECT_EQ(guessMime("unknown.bin"), "application/octet-stream");
}

TEST(GuessMimeTests, AllSupportedExtensions) {
  using namespace file_utils;
  // Text types
  EXPECT_EQ(guessMime("file.htm"), "text/html; charset=utf-8");
  EXPECT_EQ(guessMime("data.csv"), "text/csv");
  // Application types
  EXPECT_EQ(guessMime("data.json"), "application/json");
  EXPECT_EQ(guessMime("config.xml"), "application/xml");
  EXPECT_EQ(guessMime("doc.pdf"), "application/pdf");
  EXPECT_EQ(guessMime("archive.zip"), "application/zip");
  // Image types
  EXPECT_EQ(guessMime("photo.jpeg"), "image/jpeg");
  EXPECT_EQ(guessMime("logo.png"), "image/png");
  EXPECT_EQ(guessMime("anim.gif"), "image/gif");
  EXPECT_EQ(guessMime("favicon.ico"), "image/x-icon");
  EXPECT_EQ(guessMime("vector.svg"), "image/svg+xml");
  EXPECT_EQ(guessMime("modern.webp"), "image/webp");
}

TEST(GuessMimeTests, NoExtension) {
  using namespace file_utils;
  EXPECT_EQ(guessMime("Makefile"), "application/octet-stream");
  EXPECT_EQ(guessMime("/path/to/file"), "application/octet-stream");
}

TEST(GuessMimeTests, PathWithMultipleDots) {
  using namespace file_utils;
  EXPECT_EQ(guessMime("file.backup.html"), "text/html; charset=utf-8");
  EXPECT_EQ(guessMime("archive.tar.gz"), "application/gzip");
}

TEST(GuessMimeTests, MediaFilesAndCase) {
  using namespace file_utils;
  EXPECT_EQ(guessMime("movie.mp4"), "video/mp4");
  EXPECT_EQ(guessMime("MOVIE.MP4"), "video/mp4");
  EXPECT_EQ(guessMime("song.Mp3"), "audio/mpeg");
  EXPECT_EQ(guessMime("clip.webm"), "video/webm");
}

TEST(GuessMimeTests, DotInDirectoryIsNotAnExtension) {
  using namespace file_utils;
  EXPECT_EQ(guessMime("/srv/v1.2/README"), "application/octet-stream");
  EXPECT_EQ(guessMime("/srv/v1.2/notes.txt"), "text/plain; charset=utf-8");
}

TEST(MakeETagTests, HexMtimeAndSize) {
  EXPECT_EQ(file_utils::makeETag(0x5f5e1000, 100), "\"5f5e1000-64\"");
  EXPECT_EQ(file_utils::makeETag(0, 0), "\"0-0\"");
}

TEST(MakeETagTests, ChangesWithSizeOrMtime) {
  std::string base = file_utils::makeETag(1700000000, 4096);
  EXPECT_NE(base, file_utils::makeETag(1700000001, 4096));
  EXPECT_NE(base, file_utils::makeETag(1700000000, 4097));
}

TEST(AttachmentDispositionTests, PlainAsciiName) {
  EXPECT_EQ(file_utils::attachmentDisposition("report.pdf"),
            "attachment; filename=\"report.pdf\"; "
            "filename*=utf-8''report.pdf");
}

TEST(AttachmentDispositionTests, SpacesAndQuotes) {
  EXPECT_EQ(file_utils::attachmentDisposition("my \"best\" file.txt"),
            "attachment; filename=\"my _best_ file.txt\"; "
            "filename*=utf-8''my%20%22best%22%20file.txt");
}

TEST(AttachmentDispositionTests, NonAsciiBytesArePercentEncoded) {
  // "café.mp4" in UTF-8
  std::string name = "caf\xc3\xa9.mp4";
  EXPECT_EQ(file_utils::attachmentDisposition(name),
            "attachment; filename=\"caf__.mp4\"; "
            "filename*=utf-8''caf%C3%A9.mp4");
}
