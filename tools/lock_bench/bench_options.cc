// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "tools/lock_bench/bench_options.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace qlock {

namespace bench {

namespace {

bool parse_uint(const std::string &s, uint64_t *out) {
    if (s.empty() || s.size() > 19) {
        return false;
    }
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    *out = v;
    return true;
}

// "a" or "a-b".
bool parse_item(const std::string &item, uint64_t *a, uint64_t *b) {
    const size_t dash = item.find('-');
    if (dash == std::string::npos) {
        if (!parse_uint(item, a)) {
            return false;
        }
        *b = *a;
        return true;
    }
    return parse_uint(item.substr(0, dash), a) && parse_uint(item.substr(dash + 1), b);
}

std::string format_ns(uint64_t ns) {
    if (ns < 1000) {
        return fmt::format("{}ns", ns);
    }
    if (ns < 1000 * 1000) {
        return fmt::format("{}us", ns / 1000);
    }
    if (ns < 1000 * 1000 * 1000) {
        return fmt::format("{}ms", ns / (1000 * 1000));
    }
    return fmt::format("{}s", ns / (1000 * 1000 * 1000));
}

}  // namespace

uint64_t work_range::pick(uint64_t *prng) const {
    if (!randomized()) {
        return from;
    }
    uint64_t x = *prng;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    *prng = x;
    return from + x % (to - from + 1);
}

work_range work_range::scaled(uint64_t ns_per_unit) const {
    if (ns_per_unit == 0) {
        return *this;
    }
    work_range r;
    r.from = from / ns_per_unit;
    r.to = to / ns_per_unit;
    return r;
}

std::string work_range::to_string() const {
    if (randomized()) {
        return fmt::format("rand({}, {})", format_ns(from), format_ns(to));
    }
    return format_ns(from);
}

std::vector<std::string> split_csv(const std::string &csv) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        const size_t comma = csv.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(csv.substr(start));
            break;
        }
        parts.push_back(csv.substr(start, comma - start));
        start = comma + 1;
    }
    return parts;
}

bool parse_thread_list(const std::string &csv, std::vector<int> *out, std::string *error) {
    out->clear();
    for (const std::string &item : split_csv(csv)) {
        uint64_t a = 0;
        uint64_t b = 0;
        if (!parse_item(item, &a, &b)) {
            *error = fmt::format("invalid thread count `{}'", item);
            return false;
        }
        if (a == 0 || a > b || b > 4096) {
            *error = fmt::format("invalid thread range `{}'", item);
            return false;
        }
        for (uint64_t n = a; n <= b; ++n) {
            out->push_back(static_cast<int>(n));
        }
    }
    return true;
}

bool parse_work_list(const std::string &csv, std::vector<work_range> *out, std::string *error) {
    out->clear();
    for (const std::string &item : split_csv(csv)) {
        work_range w;
        if (!parse_item(item, &w.from, &w.to)) {
            *error = fmt::format("invalid amount of work `{}'", item);
            return false;
        }
        if (item.find('-') != std::string::npos && w.from >= w.to) {
            *error = fmt::format("invalid work range `{}'", item);
            return false;
        }
        out->push_back(w);
    }
    return true;
}

result summarize(const std::string &name, std::vector<double> ops_per_thread) {
    result r;
    r.name = name;
    if (ops_per_thread.empty()) {
        return r;
    }
    for (double v : ops_per_thread) {
        r.sum += v;
    }
    const double n = static_cast<double>(ops_per_thread.size());
    r.mean = r.sum / n;
    if (ops_per_thread.size() > 1) {
        double sq = 0;
        for (double v : ops_per_thread) {
            sq += (v - r.mean) * (v - r.mean);
        }
        r.stdev = std::sqrt(sq / (n - 1));
    }
    std::sort(ops_per_thread.begin(), ops_per_thread.end());
    r.min = ops_per_thread.front();
    r.max = ops_per_thread.back();
    return r;
}

std::string format_count(double v) {
    if (v < 1e3) {
        return fmt::format("{:.0f}", std::round(v));
    }
    if (v < 1e6) {
        return fmt::format("{:.0f}k", v / 1e3);
    }
    if (v < 1e9) {
        return fmt::format("{:.2f}m", v / 1e6);
    }
    return fmt::format("{:.2f}b", v / 1e9);
}

std::string format_header() {
    return fmt::format("{:<18} | {:>8} | {:>8} | {:>8} | {:>8} | {:>8} |",
                       "name", "mean", "stdev", "min", "max", "sum");
}

std::string format_row(const result &r) {
    return fmt::format("{:<18} | {:>8} | {:>8} | {:>8} | {:>8} | {:>8} |", r.name,
                       format_count(r.mean), format_count(r.stdev), format_count(r.min),
                       format_count(r.max), format_count(r.sum));
}

}  // namespace bench

}  // namespace qlock
