/**
 * @file test_interactiondebouncer.cpp
 * @brief Tests for interaction-triggered refresh coalescing.
 */

#include <gtest/gtest.h>

#include <QElapsedTimer>
#include <QList>

#include "interactiondebouncer.hpp"
#include "testsupport.hpp"

using testsupport::spinFor;
using testsupport::waitUntil;

TEST(InteractionDebouncer, BurstOfTenNotificationsProducesOneRefresh) {
  const EngineTimings timings;
  InteractionDebouncer debouncer(timings);

  QElapsedTimer elapsed;
  QList<qint64> firedAt;
  QObject::connect(&debouncer, &InteractionDebouncer::refreshRequested, [&]() { firedAt.append(elapsed.elapsed()); });

  elapsed.start();
  for (int i = 0; i < 10; ++i) {
    debouncer.notify();
    spinFor(5);
  }
  EXPECT_TRUE(debouncer.isPending());

  ASSERT_TRUE(waitUntil([&]() { return !firedAt.isEmpty(); }, 2000));
  spinFor(timings.interactionDebounceMs + timings.interactionRescheduleMs);

  ASSERT_EQ(firedAt.size(), 1);
  EXPECT_GE(firedAt.first(), timings.interactionDebounceMs);
  EXPECT_LE(firedAt.first(), timings.interactionDebounceMs + timings.interactionRescheduleMs);
  EXPECT_FALSE(debouncer.isPending());
}

TEST(InteractionDebouncer, RecentRefreshPostponesFiring) {
  const EngineTimings timings = testsupport::fastTimings();
  InteractionDebouncer debouncer(timings);

  QElapsedTimer sinceRefresh;
  qint64 firedAt = -1;
  QObject::connect(&debouncer, &InteractionDebouncer::refreshRequested, [&]() { firedAt = sinceRefresh.elapsed(); });

  debouncer.markRefreshed();
  sinceRefresh.start();
  debouncer.notify();

  ASSERT_TRUE(waitUntil([&]() { return firedAt >= 0; }, 2000));
  EXPECT_GE(firedAt, timings.minRefreshSpacingMs);
}

TEST(InteractionDebouncer, StormKeepsMinimumSpacingBetweenRefreshes) {
  const EngineTimings timings = testsupport::fastTimings();
  InteractionDebouncer debouncer(timings);

  QElapsedTimer clock;
  clock.start();
  QList<qint64> firedAt;
  QObject::connect(&debouncer, &InteractionDebouncer::refreshRequested, [&]() {
    firedAt.append(clock.elapsed());
    debouncer.markRefreshed();
  });

  while (clock.elapsed() < 600) {
    debouncer.notify();
    spinFor(5);
  }
  spinFor(200);

  ASSERT_GE(firedAt.size(), 2);
  for (int i = 1; i < firedAt.size(); ++i) {
    EXPECT_GE(firedAt.at(i) - firedAt.at(i - 1), timings.minRefreshSpacingMs - 1);
  }
}

TEST(InteractionDebouncer, QuietPeriodFiresWithoutReschedule) {
  const EngineTimings timings = testsupport::fastTimings();
  InteractionDebouncer debouncer(timings);

  int fired = 0;
  QObject::connect(&debouncer, &InteractionDebouncer::refreshRequested, [&]() { ++fired; });

  EXPECT_FALSE(debouncer.isPending());
  debouncer.notify();
  ASSERT_TRUE(waitUntil([&]() { return fired == 1; }));
  spinFor(timings.interactionRescheduleMs * 2);
  EXPECT_EQ(fired, 1);
}
