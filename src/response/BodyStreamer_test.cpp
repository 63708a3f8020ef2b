#include "BodyStreamer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "RemoteBackend.hpp"
#include "test_helpers.hpp"

namespace {

StreamResult drain(BodyStreamer& streamer, std::string& body, int& chunks) {
  body.clear();
  chunks = 0;
  std::string chunk;
  for (;;) {
    StreamResult r = streamer.next(chunk);
    if (r != SR_CHUNK) {
      return r;
    }
    ++chunks;
    body += chunk;
  }
}

}  // namespace

TEST(BodyStreamerTests, SingleSliceInChunks) {
  BackendCounters counters;
  std::string data = patternData(100);
  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::slice(10, 25));
  BodyStreamer streamer(new MemoryBackend(data, &counters), segs, 10);
  EXPECT_EQ(streamer.contentLength(), 25);

  std::string body;
  int chunks = 0;
  EXPECT_EQ(drain(streamer, body, chunks), SR_END);
  EXPECT_EQ(body, data.substr(10, 25));
  EXPECT_EQ(chunks, 3);
  EXPECT_EQ(streamer.bytesProduced(), 25);
  EXPECT_TRUE(streamer.isFinished());
  EXPECT_EQ(counters.closes, 1);

  // finished streams keep answering SR_END
  std::string chunk;
  EXPECT_EQ(streamer.next(chunk), SR_END);
  EXPECT_TRUE(chunk.empty());
  EXPECT_EQ(counters.closes, 1);
}

TEST(BodyStreamerTests, BackendReleasedWithLastChunk) {
  BackendCounters counters;
  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::slice(0, 4));
  BodyStreamer streamer(new MemoryBackend("abcd", &counters), segs, 16);
  std::string chunk;
  ASSERT_EQ(streamer.next(chunk), SR_CHUNK);
  EXPECT_EQ(chunk, "abcd");
  EXPECT_EQ(counters.closes, 1);
  EXPECT_TRUE(counters.deleted);
}

TEST(BodyStreamerTests, LiteralsAndSlicesInterleave) {
  BackendCounters counters;
  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::literal("<"));
  segs.push_back(BodySegment::slice(2, 3));
  segs.push_back(BodySegment::literal(">"));
  BodyStreamer streamer(new MemoryBackend("abcdef", &counters), segs, 2);
  EXPECT_EQ(streamer.contentLength(), 5);

  std::string body;
  int chunks = 0;
  EXPECT_EQ(drain(streamer, body, chunks), SR_END);
  EXPECT_EQ(body, "<cde>");
  EXPECT_EQ(counters.closes, 1);
}

TEST(BodyStreamerTests, EmptyBodyEndsAtOnce) {
  BackendCounters counters;
  BodyStreamer streamer(new MemoryBackend("", &counters),
                        std::vector<BodySegment>(), 8);
  std::string chunk;
  EXPECT_EQ(streamer.contentLength(), 0);
  EXPECT_EQ(streamer.next(chunk), SR_END);
  EXPECT_EQ(counters.closes, 1);
}

TEST(BodyStreamerTests, ReadFailureTruncates) {
  BackendCounters counters;
  MemoryBackend* backend = new MemoryBackend(patternData(100), &counters);
  backend->failReadAfter(2);
  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::slice(0, 100));
  BodyStreamer streamer(backend, segs, 10);

  std::string body;
  int chunks = 0;
  EXPECT_EQ(drain(streamer, body, chunks), SR_ERROR);
  EXPECT_EQ(chunks, 2);
  EXPECT_EQ(streamer.bytesProduced(), 20);
  EXPECT_LT(streamer.bytesProduced(), streamer.contentLength());
  EXPECT_EQ(counters.closes, 1);

  std::string chunk;
  EXPECT_EQ(streamer.next(chunk), SR_ERROR);
  EXPECT_EQ(counters.closes, 1);
}

TEST(BodyStreamerTests, ShrunkResourceIsAnError) {
  BackendCounters counters;
  MemoryBackend* backend = new MemoryBackend(patternData(100), &counters);
  backend->shrinkAfterStat(50);
  ResourceDescriptor d;
  ASSERT_EQ(backend->stat(d), IO_DONE);
  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::slice(0, d.size));
  BodyStreamer streamer(backend, segs, 30);

  std::string body;
  int chunks = 0;
  EXPECT_EQ(drain(streamer, body, chunks), SR_ERROR);
  EXPECT_EQ(body, patternData(100).substr(0, 30));
  EXPECT_EQ(counters.closes, 1);
}

TEST(BodyStreamerTests, CancelReleasesOnce) {
  BackendCounters counters;
  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::slice(0, 100));
  BodyStreamer streamer(new MemoryBackend(patternData(100), &counters), segs,
                        10);
  std::string chunk;
  ASSERT_EQ(streamer.next(chunk), SR_CHUNK);
  streamer.cancel();
  EXPECT_EQ(counters.closes, 1);
  streamer.cancel();
  EXPECT_EQ(streamer.next(chunk), SR_ERROR);
  EXPECT_EQ(counters.closes, 1);
}

TEST(BodyStreamerTests, DestructionMidStreamReleases) {
  BackendCounters counters;
  {
    std::vector<BodySegment> segs;
    segs.push_back(BodySegment::slice(0, 100));
    BodyStreamer streamer(new MemoryBackend(patternData(100), &counters),
                          segs, 10);
    std::string chunk;
    ASSERT_EQ(streamer.next(chunk), SR_CHUNK);
    EXPECT_EQ(counters.closes, 0);
  }
  EXPECT_EQ(counters.closes, 1);
  EXPECT_TRUE(counters.deleted);
}

TEST(BodyStreamerTests, RemoteWouldBlockIsReported) {
  FakeRemote remote;
  remote.content = patternData(64);
  remote.fd = 3;
  FakeSession session(remote);
  RemoteBackend* backend = new RemoteBackend(session, "/f", BORROW_SESSION);
  ResourceDescriptor d;
  ASSERT_EQ(backend->stat(d), IO_DONE);
  remote.block_every_other_call = true;

  std::vector<BodySegment> segs;
  segs.push_back(BodySegment::slice(0, 64));
  BodyStreamer streamer(backend, segs, 16);
  EXPECT_EQ(streamer.getMonitorFd(), 3);

  std::string body;
  std::string chunk;
  int blocked = 0;
  StreamResult r;
  while ((r = streamer.next(chunk)) != SR_END) {
    ASSERT_NE(r, SR_ERROR);
    if (r == SR_WOULD_BLOCK) {
      EXPECT_TRUE(chunk.empty());
      ++blocked;
    }
    body += chunk;
  }
  EXPECT_GT(blocked, 0);
  EXPECT_EQ(body, remote.content);
  EXPECT_EQ(remote.file_closes, 1);
  EXPECT_EQ(streamer.getMonitorFd(), -1);
}

TEST(PlanSegmentsTests, FullSingleAndMulti) {
  ResourceDescriptor d = ResourceDescriptor::fromStat(100, 0);

  std::vector<BodySegment> full =
      planSegments(ResolvedPlan::full(), d, "text/plain", "");
  ASSERT_EQ(full.size(), 1u);
  EXPECT_EQ(full[0].offset, 0);
  EXPECT_EQ(full[0].length, 100);

  std::vector<ByteRange> one(1, ByteRange(90, 99));
  std::vector<BodySegment> single =
      planSegments(ResolvedPlan::partial(one), d, "text/plain", "");
  ASSERT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0].offset, 90);
  EXPECT_EQ(single[0].length, 10);

  std::vector<ByteRange> two;
  two.push_back(ByteRange(0, 9));
  two.push_back(ByteRange(20, 29));
  std::vector<BodySegment> multi =
      planSegments(ResolvedPlan::partial(two), d, "text/plain", "B");
  EXPECT_EQ(totalLength(multi),
            totalLength(multipart::encode(two, 100, "text/plain", "B")));

  EXPECT_TRUE(
      planSegments(ResolvedPlan::unsatisfiable(), d, "text/plain", "").empty());
}
