// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com
//
// Option parsing and report formatting for lock_bench.
//
// A list option is a comma separated list of items, each either a single
// value `a` or a range `a-b`:
//
//   --threads=1,2,4-8      runs with 1, 2, 4, 5, 6, 7 and 8 threads
//   --locked_ns=0,50-200   no work, then a random 50..200ns of work per op

#ifndef QLOCK_TOOLS_LOCK_BENCH_BENCH_OPTIONS_H_
#define QLOCK_TOOLS_LOCK_BENCH_BENCH_OPTIONS_H_

#include <cstdint>
#include <string>
#include <vector>

namespace qlock {

namespace bench {

// Amount of busy work, in nanoseconds, done inside or outside the lock. A
// range is re-drawn every few thousand operations.
struct work_range {
    uint64_t from = 0;
    uint64_t to = 0;

    bool randomized() const { return to > from; }

    // Draw a value in [from, to] using the xorshift state `*prng`.
    uint64_t pick(uint64_t *prng) const;

    // Scale nanoseconds into pause-loop iterations.
    work_range scaled(uint64_t ns_per_unit) const;

    std::string to_string() const;
};

std::vector<std::string> split_csv(const std::string &csv);

// Both return false and fill `*error` on malformed input.
bool parse_thread_list(const std::string &csv, std::vector<int> *out, std::string *error);

bool parse_work_list(const std::string &csv, std::vector<work_range> *out, std::string *error);

// Per-lock summary of the operations completed by each thread.
struct result {
    std::string name;
    double mean = 0;
    double stdev = 0;
    double min = 0;
    double max = 0;
    double sum = 0;
};

result summarize(const std::string &name, std::vector<double> ops_per_thread);

// 1234 -> "1k", 2500000 -> "2.50m".
std::string format_count(double v);

std::string format_header();

std::string format_row(const result &r);

}  // namespace bench

}  // namespace qlock

#endif  // QLOCK_TOOLS_LOCK_BENCH_BENCH_OPTIONS_H_
