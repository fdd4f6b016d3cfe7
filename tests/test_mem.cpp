/**
 * @file test_mem.cpp
 * @brief Tests for the size ladder, BufferPool, MessageHandle and SpscQueue<T>.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include "msgbuf/config/constants.hpp"
#include "msgbuf/mem/buffer_pool.hpp"
#include "msgbuf/mem/message_handle.hpp"
#include "msgbuf/mem/size_class.hpp"
#include "msgbuf/mem/spsc_queue.hpp"

using msgbuf::mem::BufferError;
using msgbuf::mem::BufferPool;
using msgbuf::mem::MessageHandle;
using msgbuf::mem::OwnerKind;
using msgbuf::mem::PooledBuffer;
using msgbuf::mem::SizeClassIndex;
using msgbuf::mem::SpscQueue;
using msgbuf::mem::class_capacity;
using msgbuf::mem::class_for;
using msgbuf::mem::kSizeClassCount;
namespace constants = msgbuf::config::constants;

// ---------- Size ladder ----------

TEST(SizeClass, LadderBoundaries) {
  EXPECT_FALSE(class_for(0).has_value());
  EXPECT_EQ(*class_for(1), 0u);
  EXPECT_EQ(*class_for(16), 0u);
  EXPECT_EQ(*class_for(17), 1u);
  EXPECT_EQ(*class_for(constants::POOL_MAX_CLASS_BYTES), SizeClassIndex(kSizeClassCount - 1));
  EXPECT_FALSE(class_for(constants::POOL_MAX_CLASS_BYTES + 1).has_value());
  EXPECT_EQ(kSizeClassCount, 19u);
}

// ---------- BufferPool ----------

TEST(BufferPool, RentRoundsUpToClassCapacity) {
  BufferPool pool;
  std::size_t prev = 0;
  for (SizeClassIndex c = 0; c < kSizeClassCount; ++c) {
    const std::size_t cap = class_capacity(c);
    for (std::size_t len : {prev + 1, cap}) {
      auto buf = pool.rent(len);
      ASSERT_TRUE(buf) << "len=" << len;
      EXPECT_EQ(buf->capacity(), cap) << "len=" << len;
      EXPECT_EQ(buf->size(), len);
      EXPECT_EQ(buf->size_class(), c);
      EXPECT_FALSE(buf->oversize());
      ASSERT_TRUE(pool.give_back(*buf));
    }
    prev = cap;
  }
}

TEST(BufferPool, ZeroLengthIsInvalidSize) {
  BufferPool pool;
  auto buf = pool.rent(0);
  ASSERT_FALSE(buf);
  EXPECT_EQ(buf.error(), BufferError::InvalidSize);
  EXPECT_EQ(pool.statistics().rents, 0u);
}

TEST(BufferPool, MissThenHitReturnsSameRegion) {
  BufferPool pool;

  auto first = pool.rent(64);
  ASSERT_TRUE(first);
  auto s = pool.statistics();
  EXPECT_EQ(s.misses, 1u);
  EXPECT_EQ(s.hits, 0u);

  std::byte* const region = first->data();
  ASSERT_TRUE(pool.give_back(*first));

  auto second = pool.rent(64);
  ASSERT_TRUE(second);
  EXPECT_EQ(second->data(), region);
  s = pool.statistics();
  EXPECT_EQ(s.hits, 1u);
  EXPECT_EQ(s.misses, 1u);
  EXPECT_EQ(s.rents, 2u);
  EXPECT_EQ(s.outstanding(), 1);
  ASSERT_TRUE(pool.give_back(*second));
}

TEST(BufferPool, WarmRoundTripKeepsIdentity) {
  BufferPool pool;
  ASSERT_EQ(pool.prewarm(1024, 1).value(), 1u);

  auto a = pool.rent(700);
  ASSERT_TRUE(a);
  std::byte* const region = a->data();
  ASSERT_TRUE(pool.give_back(*a));

  auto b = pool.rent(1000);
  ASSERT_TRUE(b);
  EXPECT_EQ(b->data(), region);
  EXPECT_EQ(b->size(), 1000u);
  EXPECT_EQ(pool.statistics().misses, 0u);
  ASSERT_TRUE(pool.give_back(*b));
}

TEST(BufferPool, DoubleReturnIsDetected) {
  BufferPool pool;
  auto buf = pool.rent(128);
  ASSERT_TRUE(buf);
  ASSERT_TRUE(pool.give_back(*buf));
  const auto before = pool.statistics();

  auto again = pool.give_back(*buf);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), BufferError::DoubleRelease);

  const auto after = pool.statistics();
  EXPECT_EQ(after.returns, before.returns);
  EXPECT_EQ(after.outstanding(), 0);
  EXPECT_EQ(pool.class_statistics(128)->idle, 1u);
}

TEST(BufferPool, ForeignDescriptorRejected) {
  BufferPool pool;
  PooledBuffer empty;
  auto r = pool.give_back(empty);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), BufferError::UnknownSizeClass);

  BufferPool other;
  auto buf = other.rent(32);
  ASSERT_TRUE(buf);
  auto wrong = pool.give_back(*buf);
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error(), BufferError::UnknownSizeClass);
  ASSERT_TRUE(other.give_back(*buf));
}

TEST(BufferPool, OversizeServedUnpooled) {
  BufferPool pool;
  const std::size_t n = constants::POOL_MAX_CLASS_BYTES + 1;
  auto buf = pool.rent(n);
  ASSERT_TRUE(buf);
  EXPECT_TRUE(buf->oversize());
  EXPECT_EQ(buf->capacity(), n);
  std::memset(buf->data(), 0xAB, n);

  auto s = pool.statistics();
  EXPECT_EQ(s.oversize, 1u);
  EXPECT_EQ(s.misses, 1u);
  ASSERT_TRUE(pool.give_back(*buf));
  s = pool.statistics();
  EXPECT_EQ(s.returns, 1u);
  EXPECT_EQ(s.outstanding(), 0);
}

TEST(BufferPool, OversizeDoubleReturnIsDetected) {
  BufferPool pool;
  const std::size_t n = constants::POOL_MAX_CLASS_BYTES + 1;
  auto buf = pool.rent(n);
  ASSERT_TRUE(buf);
  const PooledBuffer copy = *buf;

  ASSERT_TRUE(pool.give_back(*buf));
  const auto before = pool.statistics();

  // Second return of the same region: refused, nothing freed, no counter moves.
  auto again = pool.give_back(copy);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), BufferError::DoubleRelease);
  const auto after = pool.statistics();
  EXPECT_EQ(after.returns, before.returns);
  EXPECT_EQ(after.outstanding(), 0);

  // The registry slot is reused by the next oversize rent.
  auto next = pool.rent(n);
  ASSERT_TRUE(next);
  std::memset(next->data(), 0x5A, n);
  ASSERT_TRUE(pool.give_back(*next));
  EXPECT_EQ(pool.statistics().outstanding(), 0);
}

TEST(BufferPool, OversizeFromAnotherPoolRejected) {
  BufferPool owner;
  BufferPool other;
  const std::size_t n = constants::POOL_MAX_CLASS_BYTES * 2;
  auto buf = owner.rent(n);
  ASSERT_TRUE(buf);

  auto foreign = other.give_back(*buf);
  ASSERT_FALSE(foreign);
  EXPECT_EQ(foreign.error(), BufferError::UnknownSizeClass);
  EXPECT_EQ(other.statistics().returns, 0u);

  // Still live in its owner.
  std::memset(buf->data(), 0x11, n);
  ASSERT_TRUE(owner.give_back(*buf));
  EXPECT_EQ(owner.statistics().outstanding(), 0);
}

TEST(BufferPool, PrewarmAndSetCapacity) {
  BufferPool pool;
  ASSERT_EQ(pool.prewarm(1000, 4).value(), 4u);
  auto cs = pool.class_statistics(1024);
  ASSERT_TRUE(cs);
  EXPECT_EQ(cs->capacity, 1024u);
  EXPECT_EQ(cs->owned, 4u);
  EXPECT_EQ(cs->idle, 4u);

  EXPECT_EQ(pool.set_capacity(1024, 10).value(), 6u);
  EXPECT_EQ(pool.class_statistics(1024)->owned, 10u);
  EXPECT_EQ(pool.set_capacity(1024, 3).value(), 0u); // never shrinks
  EXPECT_EQ(pool.class_statistics(1024)->owned, 10u);

  auto bad = pool.prewarm(constants::POOL_MAX_CLASS_BYTES + 1, 1);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), BufferError::UnknownSizeClass);
}

TEST(BufferPool, PrewarmPlanValidatedUpFront) {
  BufferPool pool;
  auto bad = pool.prewarm({{64, 2}, {0, 1}});
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), BufferError::UnknownSizeClass);
  EXPECT_EQ(pool.class_statistics(64)->owned, 0u);

  auto ok = pool.prewarm({{64, 2}, {4096, 3}});
  ASSERT_TRUE(ok);
  EXPECT_EQ(*ok, 5u);
  EXPECT_EQ(pool.class_statistics(4096)->idle, 3u);
}

TEST(BufferPool, ClearFreesOnlyIdleBuffers) {
  BufferPool pool;
  ASSERT_TRUE(pool.prewarm(256, 3));
  auto held = pool.rent(200);
  ASSERT_TRUE(held);

  EXPECT_EQ(pool.clear(), 2u);
  auto cs = pool.class_statistics(256);
  EXPECT_EQ(cs->owned, 1u);
  EXPECT_EQ(cs->idle, 0u);

  // Outstanding buffer survives and is re-pooled on return.
  std::memset(held->data(), 0x5A, held->capacity());
  std::byte* const region = held->data();
  ASSERT_TRUE(pool.give_back(*held));
  auto again = pool.rent(256);
  ASSERT_TRUE(again);
  EXPECT_EQ(again->data(), region);
  ASSERT_TRUE(pool.give_back(*again));

  // A later miss reuses a vacated slot.
  auto a = pool.rent(256);
  auto b = pool.rent(256);
  ASSERT_TRUE(a && b);
  EXPECT_EQ(pool.class_statistics(256)->owned, 2u);
  ASSERT_TRUE(pool.give_back(*a));
  ASSERT_TRUE(pool.give_back(*b));
}

/**
 * @test BufferPool.Concurrent_RentReturn
 * @brief M threads x P rent/return cycles over mixed classes balance exactly.
 */
TEST(BufferPool, Concurrent_RentReturn) {
  constexpr std::size_t M = 8, P = 20000;
  BufferPool pool;
  std::atomic<std::size_t> failures{0};

  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < M; ++t) {
    threads.emplace_back([&, t] {
      for (std::size_t i = 0; i < P; ++i) {
        const std::size_t n = 1 + ((i * 131 + t * 17) % 8192);
        auto buf = pool.rent(n);
        if (!buf) { failures.fetch_add(1); continue; }
        // Any corruption of the free list would make two threads share a region.
        std::memset(buf->data(), static_cast<int>(t), n);
        for (std::size_t k = 0; k < n; k += 512) {
          if (buf->data()[k] != std::byte(static_cast<unsigned char>(t))) failures.fetch_add(1);
        }
        if (!pool.give_back(*buf)) failures.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(failures.load(), 0u);
  const auto s = pool.statistics();
  EXPECT_EQ(s.rents, M * P);
  EXPECT_EQ(s.returns, M * P);
  EXPECT_EQ(s.hits + s.misses, s.rents);
  EXPECT_EQ(s.outstanding(), 0);
}

// ---------- MessageHandle ----------

TEST(MessageHandle, FromLengthIsPooled) {
  BufferPool pool;
  auto h = MessageHandle::from_length(pool, 100);
  ASSERT_TRUE(h);
  EXPECT_EQ(h->owner(), OwnerKind::Pooled);
  EXPECT_EQ(h->size(), 100u);
  EXPECT_EQ(h->capacity(), 128u);
  EXPECT_FALSE(h->released());
  EXPECT_EQ(pool.statistics().outstanding(), 1);

  ASSERT_TRUE(h->release());
  EXPECT_TRUE(h->released());
  EXPECT_EQ(pool.statistics().outstanding(), 0);

  auto zero = MessageHandle::from_length(pool, 0);
  ASSERT_FALSE(zero);
  EXPECT_EQ(zero.error(), BufferError::InvalidSize);
}

TEST(MessageHandle, FromDataCopiesPayload) {
  BufferPool pool;
  std::vector<std::byte> src(300);
  for (std::size_t i = 0; i < src.size(); ++i) src[i] = std::byte(static_cast<unsigned char>(i));

  auto h = MessageHandle::from_data(pool, src);
  ASSERT_TRUE(h);
  auto view = h->cdata();
  ASSERT_TRUE(view);
  ASSERT_EQ(view->size(), src.size());
  EXPECT_EQ(std::memcmp(view->data(), src.data(), src.size()), 0);
  EXPECT_NE(static_cast<const void*>(view->data()), static_cast<const void*>(src.data()));
}

TEST(MessageHandle, DoubleReleaseChangesNothing) {
  BufferPool pool;
  auto h = MessageHandle::from_length(pool, 64);
  ASSERT_TRUE(h);
  ASSERT_TRUE(h->release());
  const auto before = pool.statistics();

  auto second = h->release();
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error(), BufferError::DoubleRelease);

  const auto after = pool.statistics();
  EXPECT_EQ(after.rents, before.rents);
  EXPECT_EQ(after.returns, before.returns);
  EXPECT_EQ(pool.class_statistics(64)->idle, 1u);
}

TEST(MessageHandle, AccessAfterReleaseFails) {
  BufferPool pool;
  auto h = MessageHandle::from_length(pool, 32);
  ASSERT_TRUE(h);
  ASSERT_TRUE(h->release());

  auto d = h->data();
  ASSERT_FALSE(d);
  EXPECT_EQ(d.error(), BufferError::UseAfterRelease);
  auto cd = std::as_const(*h).cdata();
  ASSERT_FALSE(cd);
  EXPECT_EQ(cd.error(), BufferError::UseAfterRelease);
  EXPECT_EQ(h->resize(1).error(), BufferError::UseAfterRelease);
}

TEST(MessageHandle, ZeroCopyCallbackFiresOnce) {
  std::vector<std::byte> region(4096);
  int calls = 0;
  std::byte* seen = nullptr;
  {
    auto h = MessageHandle::zero_copy(region.data(), region.size(),
                                      [&](std::byte* p, std::size_t n) {
                                        ++calls;
                                        seen = p;
                                        EXPECT_EQ(n, 4096u);
                                      });
    ASSERT_TRUE(h);
    EXPECT_EQ(h->owner(), OwnerKind::External);
    ASSERT_TRUE(h->release());
    EXPECT_EQ(h->release().error(), BufferError::DoubleRelease);
  } // destructor must not fire it again
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(seen, region.data());

  auto null = MessageHandle::zero_copy(nullptr, 8, [](std::byte*, std::size_t) {});
  ASSERT_FALSE(null);
  EXPECT_EQ(null.error(), BufferError::InvalidSize);
}

TEST(MessageHandle, ZeroLengthViewsRejected) {
  std::byte local[16]{};
  int calls = 0;
  auto zc = MessageHandle::zero_copy(local, 0, [&](std::byte*, std::size_t) { ++calls; });
  ASSERT_FALSE(zc);
  EXPECT_EQ(zc.error(), BufferError::InvalidSize);
  EXPECT_EQ(calls, 0);

  auto view = MessageHandle::borrowed(local, 0);
  ASSERT_FALSE(view);
  EXPECT_EQ(view.error(), BufferError::InvalidSize);
}

TEST(MessageHandle, BorrowedReleaseIsNoOp) {
  std::byte local[16]{};
  auto h = MessageHandle::borrowed(local, sizeof(local));
  ASSERT_TRUE(h);
  EXPECT_EQ(h->owner(), OwnerKind::CallerOwned);
  EXPECT_EQ(h->data()->data(), local);
  ASSERT_TRUE(h->release());
  EXPECT_EQ(h->release().error(), BufferError::DoubleRelease);
}

TEST(MessageHandle, DestructorReleasesPooledBuffer) {
  BufferPool pool;
  {
    auto h = MessageHandle::from_length(pool, 512);
    ASSERT_TRUE(h);
    EXPECT_EQ(pool.statistics().outstanding(), 1);
  }
  const auto s = pool.statistics();
  EXPECT_EQ(s.returns, 1u);
  EXPECT_EQ(s.outstanding(), 0);
}

TEST(MessageHandle, MoveTransfersOwnership) {
  BufferPool pool;
  auto h = MessageHandle::from_length(pool, 48);
  ASSERT_TRUE(h);
  const auto id = h->id();

  MessageHandle moved = std::move(*h);
  EXPECT_TRUE(h->released());
  EXPECT_FALSE(moved.released());
  EXPECT_EQ(moved.id(), id);
  EXPECT_EQ(moved.size(), 48u);

  MessageHandle target;
  EXPECT_TRUE(target.released());
  target = std::move(moved);
  EXPECT_TRUE(moved.released());
  ASSERT_TRUE(target.release());
  EXPECT_EQ(pool.statistics().returns, 1u);
}

TEST(MessageHandle, ResizeWithinCapacity) {
  BufferPool pool;
  auto h = MessageHandle::from_length(pool, 20);
  ASSERT_TRUE(h);
  ASSERT_TRUE(h->resize(32));
  EXPECT_EQ(h->data()->size(), 32u);
  auto past = h->resize(33);
  ASSERT_FALSE(past);
  EXPECT_EQ(past.error(), BufferError::InvalidSize);
  EXPECT_EQ(h->size(), 32u);
}

TEST(MessageHandle, IdsAreUnique) {
  BufferPool pool;
  auto a = MessageHandle::from_length(pool, 8);
  auto b = MessageHandle::from_length(pool, 8);
  ASSERT_TRUE(a && b);
  EXPECT_NE(a->id(), b->id());
}

/**
 * @test MessageHandle.Concurrent_ReleaseRace
 * @brief Two threads release every handle at once; exactly one wins each time.
 */
/**
 * @test K pooled handles live at once; release them one by one, releasing each
 *       twice. After every step: rents - returns equals the live count, and
 *       every still-live handle keeps its own byte pattern even though the
 *       class is rented again in between.
 */
class OutstandingHandles : public ::testing::TestWithParam<std::size_t> {};

TEST_P(OutstandingHandles, SecondReleaseLeavesLiveHandlesIntact) {
  constexpr std::size_t kLen = 256;
  const std::size_t k = GetParam();
  BufferPool pool;

  auto pattern = [](std::size_t i) { return static_cast<std::byte>((i * 7 + 1) & 0xFF); };

  std::vector<MessageHandle> live;
  live.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    auto h = MessageHandle::from_length(pool, kLen);
    ASSERT_TRUE(h);
    std::memset(h->data()->data(), static_cast<int>(pattern(i)), kLen);
    live.push_back(std::move(*h));
  }
  ASSERT_EQ(pool.statistics().outstanding(), static_cast<std::int64_t>(k));

  for (std::size_t j = 0; j < k; ++j) {
    ASSERT_TRUE(live[j].release());
    auto second = live[j].release();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error(), BufferError::DoubleRelease);

    // Rent the class twice: a corrupted free list would hand out a live region.
    auto a = MessageHandle::from_length(pool, kLen);
    auto b = MessageHandle::from_length(pool, kLen);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    std::memset(a->data()->data(), 0xEE, kLen);
    std::memset(b->data()->data(), 0xDD, kLen);
    ASSERT_TRUE(a->release());
    ASSERT_TRUE(b->release());

    const auto s = pool.statistics();
    const auto remaining = static_cast<std::int64_t>(k - j - 1);
    EXPECT_EQ(s.outstanding(), remaining);
    EXPECT_EQ(static_cast<std::int64_t>(s.rents - s.returns), remaining);

    for (std::size_t m = j + 1; m < k; ++m) {
      auto view = live[m].cdata();
      ASSERT_TRUE(view);
      for (std::byte byte : *view) {
        ASSERT_EQ(byte, pattern(m)) << "handle " << m << " after releasing " << j;
      }
    }
  }
  EXPECT_EQ(pool.statistics().returns, pool.statistics().rents);
}

INSTANTIATE_TEST_SUITE_P(MessageHandle, OutstandingHandles, ::testing::Values(1, 2, 5, 16, 64));

TEST(MessageHandle, Concurrent_ReleaseRace) {
  constexpr std::size_t N = 2000;
  BufferPool pool;
  std::vector<MessageHandle> handles;
  handles.reserve(N);
  for (std::size_t i = 0; i < N; ++i) {
    auto h = MessageHandle::from_length(pool, 1 + (i % 1000));
    ASSERT_TRUE(h);
    handles.push_back(std::move(*h));
  }

  std::atomic<std::size_t> wins{0}, doubles{0};
  auto racer = [&] {
    for (auto& h : handles) {
      auto r = h.release();
      if (r) wins.fetch_add(1);
      else if (r.error() == BufferError::DoubleRelease) doubles.fetch_add(1);
    }
  };
  std::thread t1(racer), t2(racer);
  t1.join(); t2.join();

  EXPECT_EQ(wins.load(), N);
  EXPECT_EQ(doubles.load(), N);
  const auto s = pool.statistics();
  EXPECT_EQ(s.returns, N);
  EXPECT_EQ(s.outstanding(), 0);
}

// ---------- SpscQueue ----------

TEST(SpscQueue, WithCapacity_Validation) {
  auto bad0 = SpscQueue<int>::with_capacity(0);
  EXPECT_FALSE(bad0.has_value());
  auto badN = SpscQueue<int>::with_capacity(100);
  ASSERT_FALSE(badN.has_value());
  EXPECT_EQ(badN.error(), msgbuf::mem::SpscError::CapacityNotPowerOfTwo);
  auto ok = SpscQueue<int>::with_capacity(1024);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->capacity(), 1024u);
}

TEST(SpscQueue, SingleThread_WrapAround) {
  constexpr std::size_t CAP = 8;
  auto q = std::move(SpscQueue<int>::with_capacity(CAP).value());

  for (int i = 0; i < int(CAP - 1); ++i) EXPECT_TRUE(q.push(i));
  EXPECT_TRUE(q.full());
  EXPECT_FALSE(q.push(999));

  for (int i = 0; i < 3; ++i) {
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, i);
  }
  for (int i = 100; i < 103; ++i) EXPECT_TRUE(q.push(i));

  std::vector<int> out;
  int v{};
  while (q.pop(v)) out.push_back(v);
  std::vector<int> expected = {3, 4, 5, 6, 100, 101, 102};
  EXPECT_EQ(out, expected);
  EXPECT_TRUE(q.empty());
}

TEST(SpscQueue, ProducerConsumer_Concurrent) {
  constexpr std::size_t CAP = 1024, N = 50000;
  auto qexp = SpscQueue<std::uint32_t>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<SpscQueue<std::uint32_t>>(std::move(*qexp));

  std::thread prod([&] {
    for (std::size_t i = 0; i < N;) {
      if (q->push(static_cast<std::uint32_t>(i))) ++i;
      else std::this_thread::yield();
    }
  });
  std::vector<std::uint32_t> out;
  out.reserve(N);
  std::thread cons([&] {
    std::uint32_t v{};
    while (out.size() < N) {
      if (q->pop(v)) out.push_back(v);
      else std::this_thread::yield();
    }
  });
  prod.join(); cons.join();

  ASSERT_EQ(out.size(), N);
  for (std::size_t i = 0; i < N; ++i) EXPECT_EQ(out[i], i);
  EXPECT_TRUE(q->empty());
}

/**
 * @test SpscQueue.MessageHandles_CrossThreadRelease
 * @brief Handles rented on one thread are released by the consumer thread.
 */
TEST(SpscQueue, MessageHandles_CrossThreadRelease) {
  constexpr std::size_t N = 5000;
  BufferPool pool;
  auto q = std::move(SpscQueue<MessageHandle>::with_capacity(64).value());

  std::atomic<std::size_t> released{0};
  std::thread cons([&] {
    MessageHandle h;
    while (released.load(std::memory_order_relaxed) < N) {
      if (q.pop(h)) {
        if (h.release()) released.fetch_add(1, std::memory_order_relaxed);
      } else {
        std::this_thread::yield();
      }
    }
  });

  for (std::size_t i = 0; i < N;) {
    auto h = MessageHandle::from_length(pool, 1 + (i % 2048));
    ASSERT_TRUE(h);
    while (!q.push(std::move(*h))) std::this_thread::yield();
    ++i;
  }
  cons.join();

  const auto s = pool.statistics();
  EXPECT_EQ(released.load(), N);
  EXPECT_EQ(s.rents, N);
  EXPECT_EQ(s.returns, N);
}

TEST(SpscQueue, DestroysQueuedHandles) {
  BufferPool pool;
  {
    auto q = std::move(SpscQueue<MessageHandle>::with_capacity(8).value());
    for (int i = 0; i < 3; ++i) {
      auto h = MessageHandle::from_length(pool, 64);
      ASSERT_TRUE(h);
      ASSERT_TRUE(q.push(std::move(*h)));
    }
    EXPECT_EQ(pool.statistics().outstanding(), 3);
  }
  EXPECT_EQ(pool.statistics().outstanding(), 0);
}
