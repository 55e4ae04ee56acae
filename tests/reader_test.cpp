// reader_test.cpp

#include "fake_readers.hpp"

#include <gtest/gtest.h>

using namespace pwr;
using pwr::test::fake_energy_reader;
using pwr::test::fake_power_reader;

TEST(reader, read_is_quantity_major) {
  fake_energy_reader rdr({"a", "b"},
                         {quantity::temperature, quantity::energy});
  ASSERT_EQ(rdr.quantities().size(), 2u);
  readings r = rdr.read();
  // temperatures for a and b, then energies for a and b
  ASSERT_EQ(r.size(), 4u);
  EXPECT_DOUBLE_EQ(r[0], 40.0);
  EXPECT_DOUBLE_EQ(r[1], 41.0);
  EXPECT_DOUBLE_EQ(r[2], 1.0);
  EXPECT_DOUBLE_EQ(r[3], 2.0);
}

TEST(reader, duplicate_quantities_are_dropped) {
  fake_energy_reader rdr({"a"}, {quantity::energy, quantity::energy});
  EXPECT_EQ(rdr.quantities(), std::vector<quantity>{quantity::energy});
}

TEST(reader, energy_without_power) {
  fake_energy_reader energy;
  EXPECT_TRUE(energy.energy_without_power());
  fake_energy_reader temp({"a"}, {quantity::temperature});
  EXPECT_FALSE(temp.energy_without_power());
  fake_power_reader power;
  EXPECT_FALSE(power.energy_without_power());
}

TEST(reader, get_unit) {
  fake_energy_reader rdr;
  EXPECT_EQ(rdr.get_unit(quantity::energy), units::joules());

  testing::internal::CaptureStderr();
  unit u = rdr.get_unit(quantity::power);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(u, unit{});
  EXPECT_NE(err.find("invalid quantity requested: power"), std::string::npos);
}

TEST(reader, energy_delta_length) {
  fake_energy_reader rdr;
  EXPECT_TRUE(rdr.compute_energy_delta(series{}).empty());
  EXPECT_TRUE(rdr.compute_energy_delta(series{5.0}).empty());
  EXPECT_EQ(rdr.compute_energy_delta(series{1.0, 3.0, 6.0}),
            (series{2.0, 3.0}));

  matrix m = {{0.0, 10.0}, {1.0, 30.0}, {3.0, 60.0}};
  matrix d = rdr.compute_energy_delta(m);
  ASSERT_EQ(d.size(), 2u);
  EXPECT_EQ(d[0], (readings{1.0, 20.0}));
  EXPECT_EQ(d[1], (readings{2.0, 30.0}));
}

TEST(reader, power_series_1d) {
  fake_energy_reader rdr;
  series p = rdr.compute_power_series({0.0, 1.0, 2.0}, {0.0, 10.0, 30.0});
  EXPECT_EQ(p, (series{10.0, 20.0, 0.0}));
}

TEST(reader, power_series_2d) {
  fake_energy_reader rdr;
  matrix p = rdr.compute_power_series({0.0, 1.0, 2.0},
                                      {{0.0, 0.0}, {10.0, 5.0}, {30.0, 15.0}});
  ASSERT_EQ(p.size(), 3u);
  EXPECT_EQ(p[0], (readings{10.0, 5.0}));
  EXPECT_EQ(p[1], (readings{20.0, 10.0}));
  EXPECT_EQ(p[2], (readings{0.0, 0.0}));
}

TEST(reader, power_series_short_input) {
  fake_energy_reader rdr;
  EXPECT_TRUE(rdr.compute_power_series(series{}, series{}).empty());
  EXPECT_EQ(rdr.compute_power_series({1.0}, {5.0}), series{0.0});
  // extra energy samples beyond the time series are ignored
  EXPECT_EQ(rdr.compute_power_series({0.0, 2.0}, {0.0, 4.0, 100.0}),
            (series{2.0, 0.0}));
}

TEST(reader, power_series_non_increasing_time) {
  fake_energy_reader rdr;
  testing::internal::CaptureStderr();
  series p = rdr.compute_power_series({0.0, 0.0, 1.0}, {0.0, 5.0, 7.0});
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(p, (series{0.0, 2.0, 0.0}));
  EXPECT_NE(err.find("non-increasing"), std::string::npos);
}

TEST(reader, unsupported_quantity_fail_fast) {
  try {
    fake_energy_reader rdr({"a"}, {quantity::energy, quantity::power},
                           quantity_policy::fail_fast);
    FAIL() << "expected an exception";
  } catch (const exception &e) {
    EXPECT_EQ(e.code(), errc::unsupported_quantity);
  }
}

TEST(reader, unsupported_quantity_log_and_skip) {
  testing::internal::CaptureStderr();
  fake_energy_reader rdr({"a", "b"}, {quantity::power, quantity::energy},
                         quantity_policy::log_and_skip);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("skipping"), std::string::npos);
  EXPECT_EQ(rdr.quantities(), std::vector<quantity>{quantity::energy});
  EXPECT_EQ(rdr.read().size(), 2u);
  EXPECT_EQ(rdr.policy(), quantity_policy::log_and_skip);
}

TEST(reader, policy_names) {
  EXPECT_STREQ(to_string(quantity_policy::fail_fast), "fail-fast");
  EXPECT_STREQ(to_string(quantity_policy::log_and_skip), "log-and-skip");
}
