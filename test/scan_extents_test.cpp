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

#include <filesystem>
#include <limits>
#include <optional>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <holemap/scan_extents.h>

#include "fake_sparse_query_ops.h"

using namespace holemap;
using namespace holemap::test;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;
using ::testing::StrictMock;

namespace {

std::vector<extent_info> to_vector(auto const& iterable) {
  std::vector<extent_info> rv;
  for (auto const& e : iterable) {
    rv.push_back(e);
  }
  return rv;
}

extent_info data_at(file_off_t begin, file_off_t end) {
  return {extent_kind::data, file_range::between(begin, end)};
}

extent_info hole_at(file_off_t begin, file_off_t end) {
  return {extent_kind::hole, file_range::between(begin, end)};
}

class scan_extents_test : public ::testing::Test {
 protected:
  extent_map
  scan_runs(std::vector<run> const& runs, std::error_code& ec) {
    fake.add_file("/file", runs);
    return scan_extents(fake, std::filesystem::path{"/file"}, ec);
  }

  fake_sparse_query_ops fake;
};

} // namespace

TEST_F(scan_extents_test, empty_file) {
  std::error_code ec;
  auto map = scan_runs({}, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_TRUE(map.empty());
  EXPECT_EQ(0, map.file_size());
  EXPECT_TRUE(map.data().empty());
  EXPECT_TRUE(map.holes().empty());
  EXPECT_EQ(0, fake.query_count());
}

TEST_F(scan_extents_test, dense_file) {
  std::error_code ec;
  auto map = scan_runs({data_run(10)}, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(1, map.size());
  EXPECT_EQ(data_at(0, 10), map[0]);
  EXPECT_TRUE(map.holes().empty());
  EXPECT_FALSE(map.is_sparse());
}

TEST_F(scan_extents_test, all_hole_file) {
  std::error_code ec;
  auto map = scan_runs({hole_run(50)}, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(1, map.size());
  EXPECT_EQ(hole_at(0, 50), map[0]);
  EXPECT_TRUE(map.data().empty());
  EXPECT_EQ(50, map.hole_size());
}

TEST_F(scan_extents_test, mixed_layout) {
  std::error_code ec;
  auto map =
      scan_runs({data_run(10), hole_run(40), data_run(30), hole_run(20)}, ec);

  ASSERT_FALSE(ec) << ec.message();

  std::vector<extent_info> const expected{
      data_at(0, 10),
      hole_at(10, 50),
      data_at(50, 80),
      hole_at(80, 100),
  };

  EXPECT_EQ(expected, std::vector<extent_info>(map.begin(), map.end()));

  EXPECT_EQ((std::vector<extent_info>{data_at(0, 10), data_at(50, 80)}),
            to_vector(map.data()));
  EXPECT_EQ((std::vector<extent_info>{hole_at(10, 50), hole_at(80, 100)}),
            to_vector(map.holes()));

  EXPECT_EQ(100, map.file_size());
  EXPECT_EQ(40, map.data_size());
  EXPECT_EQ(60, map.hole_size());
  EXPECT_EQ(0, fake.open_handles());
}

TEST_F(scan_extents_test, leading_hole) {
  std::error_code ec;
  auto map = scan_runs({hole_run(4096), data_run(1)}, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ((std::vector<extent_info>{hole_at(0, 4096), data_at(4096, 4097)}),
            std::vector<extent_info>(map.begin(), map.end()));
}

TEST_F(scan_extents_test, handle_overload_matches_path_overload) {
  fake.add_file("/file", {hole_run(7), data_run(3), hole_run(1)});

  std::error_code ec;
  auto handle = fake.open("/file", ec);
  ASSERT_FALSE(ec);

  auto by_handle = scan_extents(fake, handle, 11);
  auto by_path = scan_extents(fake, std::filesystem::path{"/file"});

  EXPECT_EQ(by_path, by_handle);

  fake.close(handle, ec);
  EXPECT_FALSE(ec);
}

TEST_F(scan_extents_test, rescan_is_identical) {
  fake.add_file("/file", {data_run(1), hole_run(2), data_run(3)});

  auto first = scan_extents(fake, std::filesystem::path{"/file"});
  auto second = scan_extents(fake, std::filesystem::path{"/file"});

  EXPECT_EQ(first, second);
}

TEST(scan_extents, unsupported_platform_issues_no_queries) {
  StrictMock<mock_sparse_query_ops> ops;

  EXPECT_CALL(ops, is_supported()).WillRepeatedly(Return(false));

  std::error_code ec;
  auto map = scan_extents(ops, std::any{}, 100, ec);

  EXPECT_EQ(scan_errc::unsupported_platform, ec);
  EXPECT_EQ(scan_failure::unsupported_platform, ec);
  EXPECT_TRUE(map.empty());

  map = scan_extents(ops, std::filesystem::path{"/file"}, ec);

  EXPECT_EQ(scan_errc::unsupported_platform, ec);
  EXPECT_TRUE(map.empty());
}

TEST(scan_extents, unsupported_platform_throws) {
  fake_sparse_query_ops ops{false};

  try {
    scan_extents(ops, std::any{}, 100);
    FAIL() << "expected std::system_error";
  } catch (std::system_error const& e) {
    EXPECT_EQ(scan_errc::unsupported_platform, e.code());
  }
}

TEST(scan_extents, query_error_is_propagated) {
  fake_sparse_query_ops fake;
  fake.add_file("/file", {data_run(10), hole_run(10), data_run(10)});
  NiceMock<mock_sparse_query_ops> ops;
  ops.delegate_to(&fake);

  EXPECT_CALL(ops, next_hole(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(ops, next_hole(_, 10, _))
      .WillOnce(DoAll(
          SetArgReferee<2>(std::make_error_code(std::errc::io_error)),
          Return(std::nullopt)));

  std::error_code ec;
  auto map = scan_extents(ops, std::filesystem::path{"/file"}, ec);

  EXPECT_EQ(std::errc::io_error, ec);
  EXPECT_EQ(scan_failure::io_failure, ec);
  EXPECT_NE(scan_failure::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
  EXPECT_EQ(0, fake.open_handles());
}

TEST(scan_extents, query_error_throws_system_error) {
  NiceMock<mock_sparse_query_ops> ops;

  ON_CALL(ops, is_supported()).WillByDefault(Return(true));
  EXPECT_CALL(ops, next_data(_, 0, _))
      .WillOnce(DoAll(
          SetArgReferee<2>(std::make_error_code(std::errc::permission_denied)),
          Return(std::nullopt)));

  EXPECT_THROW(scan_extents(ops, std::any{}, 10), std::system_error);
}

TEST(scan_extents, open_error_is_propagated) {
  fake_sparse_query_ops fake;

  std::error_code ec;
  auto map = scan_extents(fake, std::filesystem::path{"/missing"}, ec);

  EXPECT_EQ(std::errc::no_such_file_or_directory, ec);
  EXPECT_EQ(scan_failure::io_failure, ec);
  EXPECT_TRUE(map.empty());
}

TEST(scan_extents, close_error_after_successful_scan_is_reported) {
  fake_sparse_query_ops fake;
  fake.add_file("/file", {data_run(10)});
  NiceMock<mock_sparse_query_ops> ops;
  ops.delegate_to(&fake);

  EXPECT_CALL(ops, close(_, _))
      .WillOnce(
          SetArgReferee<1>(std::make_error_code(std::errc::io_error)));

  std::error_code ec;
  auto map = scan_extents(ops, std::filesystem::path{"/file"}, ec);

  EXPECT_EQ(std::errc::io_error, ec);
  EXPECT_TRUE(map.empty());
}

TEST(scan_extents, negative_size_is_rejected) {
  fake_sparse_query_ops fake;

  std::error_code ec;
  auto map = scan_extents(fake, std::any{}, -1, ec);

  EXPECT_EQ(std::errc::invalid_argument, ec);
  EXPECT_TRUE(map.empty());
}

TEST(scan_extents, dense_file_of_maximum_size) {
  NiceMock<mock_sparse_query_ops> ops;
  auto constexpr max_size = std::numeric_limits<file_size_t>::max();

  ON_CALL(ops, is_supported()).WillByDefault(Return(true));
  ON_CALL(ops, next_data(_, _, _))
      .WillByDefault(Invoke([](std::any const&, file_off_t offset,
                               std::error_code&) {
        return std::optional<file_off_t>{offset};
      }));
  ON_CALL(ops, next_hole(_, _, _)).WillByDefault(Return(std::nullopt));

  std::error_code ec;
  auto map = scan_extents(ops, std::any{}, max_size, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(1, map.size());
  EXPECT_EQ(data_at(0, max_size), map[0]);
  EXPECT_EQ(max_size, map.data_size());
}

class scan_extents_contradiction : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(ops, is_supported()).WillByDefault(Return(true));
  }

  void answer(file_off_t offset, std::optional<file_off_t> data,
              std::optional<file_off_t> hole) {
    ON_CALL(ops, next_data(_, offset, _)).WillByDefault(Return(data));
    ON_CALL(ops, next_hole(_, offset, _)).WillByDefault(Return(hole));
  }

  extent_map scan(file_size_t size, std::error_code& ec) {
    return scan_extents(ops, std::any{}, size, ec);
  }

  NiceMock<mock_sparse_query_ops> ops;
};

TEST_F(scan_extents_contradiction, both_kinds_at_cursor) {
  answer(0, 0, 0);

  std::error_code ec;
  auto map = scan(10, ec);

  EXPECT_EQ(scan_errc::invariant_violation, ec);
  EXPECT_EQ(scan_failure::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
}

TEST_F(scan_extents_contradiction, neither_kind_at_cursor) {
  answer(0, 4, 6);

  std::error_code ec;
  auto map = scan(10, ec);

  EXPECT_EQ(scan_errc::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
}

TEST_F(scan_extents_contradiction, no_more_data_but_no_hole_at_cursor) {
  answer(0, std::nullopt, 5);

  std::error_code ec;
  auto map = scan(10, ec);

  EXPECT_EQ(scan_errc::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
}

TEST_F(scan_extents_contradiction, no_transitions_at_all) {
  answer(0, std::nullopt, std::nullopt);

  std::error_code ec;
  auto map = scan(10, ec);

  EXPECT_EQ(scan_errc::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
}

TEST_F(scan_extents_contradiction, answer_before_cursor) {
  answer(0, 0, 5);
  answer(5, 2, 5);

  std::error_code ec;
  auto map = scan(10, ec);

  EXPECT_EQ(scan_errc::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
}

TEST_F(scan_extents_contradiction, partial_result_is_discarded) {
  answer(0, 0, 4);
  answer(4, 8, 4);
  answer(8, 8, 8);

  std::error_code ec;
  auto map = scan(12, ec);

  EXPECT_EQ(scan_errc::invariant_violation, ec);
  EXPECT_TRUE(map.empty());
}

TEST_F(scan_extents_contradiction, transitions_beyond_size_are_clamped) {
  answer(0, 0, 150);

  std::error_code ec;
  auto map = scan(100, ec);

  ASSERT_FALSE(ec) << ec.message();
  ASSERT_EQ(1, map.size());
  EXPECT_EQ(data_at(0, 100), map[0]);
}

TEST_F(scan_extents_contradiction, hole_beyond_size_is_clamped) {
  answer(0, 0, 60);
  answer(60, 120, 60);

  std::error_code ec;
  auto map = scan(100, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ((std::vector<extent_info>{data_at(0, 60), hole_at(60, 100)}),
            std::vector<extent_info>(map.begin(), map.end()));
}

TEST_F(scan_extents_contradiction, same_kind_segments_are_merged) {
  answer(0, 0, 10);
  answer(10, 10, 20);
  answer(20, std::nullopt, 20);

  std::error_code ec;
  auto map = scan(30, ec);

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ((std::vector<extent_info>{data_at(0, 20), hole_at(20, 30)}),
            std::vector<extent_info>(map.begin(), map.end()));
}
