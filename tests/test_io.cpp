/**
 * @file test_io.cpp
 * @brief Tests for ReadinessMultiplexer and WakeEndpoint.
 */
#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <thread>

#include <unistd.h>

#include "msgbuf/io/readiness_multiplexer.hpp"
#include "msgbuf/io/wake_endpoint.hpp"

using msgbuf::io::DescriptorEndpoint;
using msgbuf::io::EndpointRef;
using msgbuf::io::IoError;
using msgbuf::io::PollEvents;
using msgbuf::io::ReadinessMultiplexer;
using msgbuf::io::WakeEndpoint;

namespace {

/// Owns one pipe for the duration of a test.
struct Pipe {
  int fds[2] = {-1, -1};
  Pipe() { EXPECT_EQ(::pipe(fds), 0); }
  ~Pipe() { for (int fd : fds) if (fd >= 0) ::close(fd); }
  int read_end() const { return fds[0]; }
  int write_end() const { return fds[1]; }
  void write_byte() const { const char c = 'x'; EXPECT_EQ(::write(fds[1], &c, 1), 1); }
};

} // namespace

TEST(ReadinessMultiplexer, CapacityValidation) {
  auto bad = ReadinessMultiplexer::with_capacity(0);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), IoError::InvalidCapacity);

  auto mux = ReadinessMultiplexer::with_capacity(2);
  ASSERT_TRUE(mux);
  Pipe a, b, c;
  DescriptorEndpoint ea(a.read_end()), eb(b.read_end()), ec(c.read_end());
  ASSERT_TRUE(mux->add(ea, PollEvents::In));
  ASSERT_TRUE(mux->add(eb, PollEvents::In));
  auto full = mux->add(ec, PollEvents::In);
  ASSERT_FALSE(full);
  EXPECT_EQ(full.error(), IoError::CapacityExceeded);
  EXPECT_EQ(mux->size(), 2u);
  EXPECT_EQ(mux->capacity(), 2u);
}

TEST(ReadinessMultiplexer, RejectsInvalidEndpoint) {
  auto mux = ReadinessMultiplexer::with_capacity(4);
  ASSERT_TRUE(mux);
  DescriptorEndpoint closed(-1);
  auto r = mux->add(closed, PollEvents::In);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), IoError::InvalidEndpoint);
}

/**
 * @test ReadinessMultiplexer.OnlyReadyEndpointReported
 * @brief Two endpoints, only the first has data: poll(-1) returns 1 and only
 *        the first is readable.
 */
TEST(ReadinessMultiplexer, OnlyReadyEndpointReported) {
  auto mux = ReadinessMultiplexer::with_capacity(4);
  ASSERT_TRUE(mux);
  Pipe p1, p2;
  DescriptorEndpoint e1(p1.read_end()), e2(p2.read_end());
  auto r1 = mux->add(e1, PollEvents::In);
  auto r2 = mux->add(e2, PollEvents::In);
  ASSERT_TRUE(r1 && r2);
  EXPECT_NE(*r1, *r2);

  p1.write_byte();
  auto n = mux->poll(-1);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 1);
  EXPECT_TRUE(mux->is_ready(*r1, PollEvents::In));
  EXPECT_FALSE(mux->is_ready(*r2, PollEvents::In));
  EXPECT_TRUE(mux->is_readable(*r1));
  EXPECT_EQ(mux->endpoint(*r1), &e1);
}

TEST(ReadinessMultiplexer, NonBlockingPollReturnsQuickly) {
  auto mux = ReadinessMultiplexer::with_capacity(4);
  ASSERT_TRUE(mux);
  Pipe p1, p2;
  DescriptorEndpoint e1(p1.read_end()), e2(p2.read_end());
  ASSERT_TRUE(mux->add(e1, PollEvents::In));
  ASSERT_TRUE(mux->add(e2, PollEvents::In));

  const auto t0 = std::chrono::steady_clock::now();
  auto n = mux->poll(0);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 0);
  EXPECT_LT(elapsed, std::chrono::milliseconds(10));
}

TEST(ReadinessMultiplexer, BoundedTimeoutElapses) {
  auto mux = ReadinessMultiplexer::with_capacity(1);
  ASSERT_TRUE(mux);
  Pipe p;
  DescriptorEndpoint e(p.read_end());
  ASSERT_TRUE(mux->add(e, PollEvents::In));

  const auto t0 = std::chrono::steady_clock::now();
  auto n = mux->poll(std::chrono::milliseconds(30));
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 0);
  EXPECT_GE(elapsed, std::chrono::milliseconds(25));
}

TEST(ReadinessMultiplexer, SnapshotOverwrittenByNextPoll) {
  auto mux = ReadinessMultiplexer::with_capacity(2);
  ASSERT_TRUE(mux);
  Pipe p;
  DescriptorEndpoint e(p.read_end());
  auto ref = mux->add(e, PollEvents::In);
  ASSERT_TRUE(ref);

  p.write_byte();
  ASSERT_EQ(mux->poll(0).value(), 1);
  EXPECT_TRUE(mux->is_readable(*ref));

  char c{};
  ASSERT_EQ(::read(p.read_end(), &c, 1), 1);
  ASSERT_EQ(mux->poll(0).value(), 0);
  EXPECT_FALSE(mux->is_readable(*ref));
  EXPECT_EQ(mux->returned_events(*ref), PollEvents::None);
}

TEST(ReadinessMultiplexer, UpdateAndWritableInterest) {
  auto mux = ReadinessMultiplexer::with_capacity(2);
  ASSERT_TRUE(mux);
  Pipe p;
  DescriptorEndpoint w(p.write_end());
  auto ref = mux->add(w, PollEvents::None);
  ASSERT_TRUE(ref);
  ASSERT_EQ(mux->poll(0).value(), 0);

  ASSERT_TRUE(mux->update(*ref, PollEvents::Out));
  ASSERT_EQ(mux->poll(0).value(), 1);
  EXPECT_TRUE(mux->is_writable(*ref));
  EXPECT_FALSE(mux->has_error(*ref));

  auto bad = mux->update(EndpointRef{7}, PollEvents::In);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), IoError::InvalidRef);
}

TEST(ReadinessMultiplexer, HangupReportedAsError) {
  auto mux = ReadinessMultiplexer::with_capacity(1);
  ASSERT_TRUE(mux);
  Pipe p;
  DescriptorEndpoint r(p.read_end());
  auto ref = mux->add(r, PollEvents::In);
  ASSERT_TRUE(ref);

  ::close(p.fds[1]);
  p.fds[1] = -1;
  ASSERT_EQ(mux->poll(0).value(), 1);
  EXPECT_TRUE(mux->has_error(*ref));
}

TEST(ReadinessMultiplexer, EmptyTableAndClear) {
  auto mux = ReadinessMultiplexer::with_capacity(2);
  ASSERT_TRUE(mux);
  ASSERT_EQ(mux->poll(0).value(), 0);

  Pipe p;
  DescriptorEndpoint e(p.read_end());
  auto ref = mux->add(e, PollEvents::In);
  ASSERT_TRUE(ref);
  mux->clear();
  EXPECT_EQ(mux->size(), 0u);
  EXPECT_EQ(mux->endpoint(*ref), nullptr);
  EXPECT_FALSE(mux->is_readable(*ref));
}

// ---------- WakeEndpoint ----------

TEST(WakeEndpoint, SignalAndDrain) {
  auto wake = WakeEndpoint::create();
  ASSERT_TRUE(wake);
  EXPECT_GE(wake->native_handle(), 0);

  EXPECT_EQ(wake->drain().value(), 0u);
  ASSERT_TRUE(wake->signal());
  ASSERT_TRUE(wake->signal());
  EXPECT_EQ(wake->drain().value(), 2u);
  EXPECT_EQ(wake->drain().value(), 0u);
}

/**
 * @test WakeEndpoint.CancelsInfiniteWait
 * @brief A poll(-1) with nothing ready is ended by signal() from another thread.
 */
TEST(WakeEndpoint, CancelsInfiniteWait) {
  auto mux = ReadinessMultiplexer::with_capacity(2);
  auto wake = WakeEndpoint::create();
  ASSERT_TRUE(mux && wake);
  Pipe idle;
  DescriptorEndpoint quiet(idle.read_end());
  auto quiet_ref = mux->add(quiet, PollEvents::In);
  auto wake_ref  = mux->add(*wake, PollEvents::In);
  ASSERT_TRUE(quiet_ref && wake_ref);

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(wake->signal());
  });
  auto n = mux->poll(-1);
  canceller.join();

  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 1);
  EXPECT_TRUE(mux->is_readable(*wake_ref));
  EXPECT_FALSE(mux->is_readable(*quiet_ref));
  EXPECT_EQ(wake->drain().value(), 1u);
  ASSERT_EQ(mux->poll(0).value(), 0);
}
