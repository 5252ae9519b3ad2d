// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/thread/spin_wait.h"

#include "gtest/gtest.h"

namespace qlock {

namespace thread_internal {

namespace {

TEST(SpinWaitTest, BoundedSequence) {
    spin_wait spinner;
    int rounds = 0;
    while (spinner.spin()) {
        ++rounds;
        ASSERT_LE(rounds, 100) << "spin_wait never gave up";
    }
    EXPECT_EQ(rounds, 10);
    EXPECT_EQ(spinner.count(), spin_wait::kMaxRounds);
    EXPECT_TRUE(spinner.exhausted());

    // Stays exhausted.
    EXPECT_FALSE(spinner.spin());
    EXPECT_EQ(spinner.count(), spin_wait::kMaxRounds);
}

TEST(SpinWaitTest, ResetRestartsTheSequence) {
    spin_wait spinner;
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(spinner.spin());
    }
    EXPECT_EQ(spinner.count(), 4);
    EXPECT_FALSE(spinner.exhausted());

    spinner.reset();
    EXPECT_EQ(spinner.count(), 0);
    int rounds = 0;
    while (spinner.spin()) {
        ++rounds;
    }
    EXPECT_EQ(rounds, spin_wait::kMaxRounds);
}

TEST(SpinWaitTest, PauseAndYieldReturn) {
    spin_wait::pause(0);
    spin_wait::pause(spin_wait::kBatchPauses);
    spin_wait::yield();
    SUCCEED();
}

TEST(SpinWaitTest, SuggestedDelayIsBounded) {
    for (int loop = 0; loop < 40; ++loop) {
        const int ns = spin_lock_suggested_delay_ns(loop);
        EXPECT_GE(ns, 0);
        EXPECT_LT(ns, 1 << 24);
    }
}

}  // namespace

}  // namespace thread_internal

}  // namespace qlock
