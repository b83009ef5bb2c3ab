/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of holemap.
 *
 * holemap is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * holemap is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with holemap.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <algorithm>
#include <filesystem>
#include <random>
#include <vector>

#include <gtest/gtest.h>

#include <holemap/scan_extents.h>

#include "fake_sparse_query_ops.h"

using namespace holemap;
using namespace holemap::test;

namespace {

constexpr int kIterations{500};

// random split points in (0, size), kinds alternating from a random start
std::vector<run> random_alternating_runs(std::mt19937_64& rng) {
  std::uniform_int_distribution<file_size_t> size_dist(1, 1 << 20);
  std::uniform_int_distribution<int> split_dist(0, 20);
  std::bernoulli_distribution coin;

  auto const size = size_dist(rng);
  auto const num_splits = split_dist(rng);

  std::vector<file_off_t> splits;
  std::uniform_int_distribution<file_off_t> pos_dist(1, size);
  for (int i = 0; i < num_splits; ++i) {
    if (auto const pos = pos_dist(rng); pos < size) {
      splits.push_back(pos);
    }
  }
  std::ranges::sort(splits);
  auto const dup = std::ranges::unique(splits);
  splits.erase(dup.begin(), dup.end());
  splits.push_back(size);

  std::vector<run> runs;
  auto kind = coin(rng) ? extent_kind::data : extent_kind::hole;
  file_off_t prev{0};

  for (auto pos : splits) {
    runs.push_back({kind, pos - prev});
    kind = kind == extent_kind::data ? extent_kind::hole : extent_kind::data;
    prev = pos;
  }

  return runs;
}

// random kinds, so neighbouring runs may share a kind or be empty
std::vector<run> random_unordered_runs(std::mt19937_64& rng) {
  std::uniform_int_distribution<int> count_dist(0, 30);
  std::uniform_int_distribution<file_size_t> size_dist(0, 5000);
  std::bernoulli_distribution coin;

  std::vector<run> runs(count_dist(rng));
  for (auto& r : runs) {
    r.kind = coin(rng) ? extent_kind::data : extent_kind::hole;
    r.size = size_dist(rng);
  }

  return runs;
}

file_size_t total_size(std::vector<run> const& runs, extent_kind kind) {
  file_size_t total{0};
  for (auto const& r : runs) {
    if (r.kind == kind) {
      total += r.size;
    }
  }
  return total;
}

void check_layout(extent_map const& map, std::vector<run> const& runs) {
  file_size_t size{0};
  for (auto const& r : runs) {
    size += r.size;
  }

  EXPECT_EQ(size, map.file_size());
  EXPECT_FALSE(extent_map::validate(map.extents()));

  file_off_t expected_begin{0};
  extent_info const* prev{nullptr};

  for (auto const& e : map) {
    EXPECT_EQ(expected_begin, e.range.begin());
    EXPECT_GT(e.range.size(), 0);
    if (prev) {
      EXPECT_NE(prev->kind, e.kind);
    }
    expected_begin = e.range.end();
    prev = &e;
  }

  EXPECT_EQ(size, expected_begin);
  EXPECT_EQ(total_size(runs, extent_kind::data), map.data_size());
  EXPECT_EQ(total_size(runs, extent_kind::hole), map.hole_size());
  EXPECT_EQ(size, map.data_size() + map.hole_size());

  for (auto kind : {extent_kind::data, extent_kind::hole}) {
    file_off_t last_end{-1};
    size_t count{0};
    for (auto const& e : map.extents(kind)) {
      EXPECT_EQ(kind, e.kind);
      EXPECT_GT(e.range.begin(), last_end);
      last_end = e.range.end();
      ++count;
    }
    EXPECT_EQ(count, map.extents(kind).count());
  }

  EXPECT_EQ(expected_layout(runs),
            std::vector<extent_info>(map.begin(), map.end()));
}

} // namespace

TEST(scan_property, alternating_layouts) {
  std::mt19937_64 rng{42};

  for (int i = 0; i < kIterations; ++i) {
    auto const runs = random_alternating_runs(rng);

    fake_sparse_query_ops ops;
    ops.add_file("/file", runs);

    std::error_code ec;
    auto const map = scan_extents(ops, std::filesystem::path{"/file"}, ec);

    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(runs.size(), map.size());
    check_layout(map, runs);

    auto const again = scan_extents(ops, std::filesystem::path{"/file"}, ec);

    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(map, again);

    if (::testing::Test::HasFailure()) {
      break;
    }
  }
}

TEST(scan_property, merges_adjacent_runs_of_same_kind) {
  std::mt19937_64 rng{4711};

  for (int i = 0; i < kIterations; ++i) {
    auto const runs = random_unordered_runs(rng);

    fake_sparse_query_ops ops;
    ops.add_file("/file", runs);

    std::error_code ec;
    auto const map = scan_extents(ops, std::filesystem::path{"/file"}, ec);

    ASSERT_FALSE(ec) << ec.message();
    check_layout(map, runs);

    if (::testing::Test::HasFailure()) {
      break;
    }
  }
}

TEST(scan_property, queries_stay_within_bound) {
  std::mt19937_64 rng{1234};

  for (int i = 0; i < kIterations; ++i) {
    auto const runs = random_alternating_runs(rng);

    fake_sparse_query_ops ops;
    ops.add_file("/file", runs);

    std::error_code ec;
    auto const map = scan_extents(ops, std::filesystem::path{"/file"}, ec);

    ASSERT_FALSE(ec) << ec.message();

    // two queries per extent
    EXPECT_EQ(2 * map.size(), ops.query_count());
  }
}
