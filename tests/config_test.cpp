// config_test.cpp

#include "config.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>

using namespace pwrtrack;
using namespace std::chrono_literals;

namespace {
cfg::config_t parse(const std::string &xml) {
  std::istringstream is(xml);
  return cfg::config_t(is);
}

void expect_error(const std::string &xml, cfg::errc expected) {
  try {
    parse(xml);
    FAIL() << "expected " << cfg::make_error_code(expected).message();
  } catch (const cfg::exception &e) {
    EXPECT_EQ(e.code(), expected) << e.what();
  }
}
} // namespace

TEST(config, full_document) {
  auto config = parse(R"(
    <config>
      <interval>0.25</interval>
      <write-interval>60</write-interval>
      <log-level>info</log-level>
      <readers>
        <rapl path="/tmp/powercap" output="cpu.log"/>
        <nvml quantities="power, energy" output="gpu.log"/>
      </readers>
    </config>)");

  ASSERT_TRUE(config.dt_read());
  EXPECT_EQ(*config.dt_read(), 250ms);
  ASSERT_TRUE(config.dt_write());
  EXPECT_EQ(*config.dt_write(), 60s);
  ASSERT_TRUE(config.log_level());
  EXPECT_EQ(*config.log_level(), pwr::log::info);

  ASSERT_EQ(config.readers().size(), 2u);
  const auto &rapl = config.readers()[0];
  EXPECT_EQ(rapl.src, cfg::source::rapl);
  EXPECT_TRUE(rapl.quantities.empty());
  EXPECT_EQ(rapl.path, "/tmp/powercap");
  EXPECT_EQ(rapl.output, "cpu.log");

  const auto &nvml = config.readers()[1];
  EXPECT_EQ(nvml.src, cfg::source::nvml);
  EXPECT_EQ(nvml.quantities,
            (std::vector<pwr::quantity>{pwr::quantity::power,
                                        pwr::quantity::energy}));
  EXPECT_FALSE(nvml.path);
  EXPECT_EQ(nvml.output, "gpu.log");
}

TEST(config, everything_optional) {
  auto config = parse("<config/>");
  EXPECT_FALSE(config.dt_read());
  EXPECT_FALSE(config.dt_write());
  EXPECT_FALSE(config.log_level());
  EXPECT_TRUE(config.readers().empty());

  cfg::config_t defaults;
  EXPECT_FALSE(defaults.dt_read());
  EXPECT_TRUE(defaults.readers().empty());
}

TEST(config, frequency) {
  auto config = parse("<config><freq>10</freq></config>");
  ASSERT_TRUE(config.dt_read());
  EXPECT_EQ(*config.dt_read(), 100ms);
}

TEST(config, interval_overrides_frequency) {
  auto config = parse("<config><freq>10</freq><interval>2</interval></config>");
  ASSERT_TRUE(config.dt_read());
  EXPECT_EQ(*config.dt_read(), 2s);
}

TEST(config, invalid_values) {
  expect_error("<config><interval>0</interval></config>",
               cfg::errc::invalid_interval);
  expect_error("<config><interval>abc</interval></config>",
               cfg::errc::invalid_interval);
  expect_error("<config><freq>-1</freq></config>", cfg::errc::invalid_freq);
  expect_error("<config><write-interval>0</write-interval></config>",
               cfg::errc::invalid_write_interval);
  expect_error("<config><log-level>loud</log-level></config>",
               cfg::errc::invalid_log_level);
  expect_error("<config><readers><rocm/></readers></config>",
               cfg::errc::invalid_reader);
  expect_error(
      "<config><readers><nvml quantities=\"power,voltage\"/></readers></config>",
      cfg::errc::invalid_quantity);
  expect_error("<config><readers><nvml quantities=\"\"/></readers></config>",
               cfg::errc::invalid_quantity);
  expect_error("<config><readers><rapl output=\"\"/></readers></config>",
               cfg::errc::empty_output);
  expect_error("<config><readers><rapl path=\"\"/></readers></config>",
               cfg::errc::empty_path);
}

TEST(config, out_of_range_intervals) {
  expect_error("<config><interval>inf</interval></config>",
               cfg::errc::invalid_interval);
  expect_error("<config><interval>nan</interval></config>",
               cfg::errc::invalid_interval);
  expect_error("<config><interval>1e30</interval></config>",
               cfg::errc::invalid_interval);
  expect_error("<config><freq>1e-300</freq></config>",
               cfg::errc::invalid_freq);
  expect_error("<config><freq>nan</freq></config>", cfg::errc::invalid_freq);
  expect_error("<config><write-interval>1e30</write-interval></config>",
               cfg::errc::invalid_write_interval);
  expect_error("<config><write-interval>-inf</write-interval></config>",
               cfg::errc::invalid_write_interval);
}

TEST(config, seconds_to_duration) {
  EXPECT_EQ(cfg::seconds_to_duration(0.5), 500ms);
  EXPECT_EQ(cfg::seconds_to_duration(3600.0), 1h);
  EXPECT_FALSE(cfg::seconds_to_duration(1e-12));
  EXPECT_FALSE(cfg::seconds_to_duration(0.0));
  EXPECT_FALSE(cfg::seconds_to_duration(-2.0));
  EXPECT_FALSE(cfg::seconds_to_duration(1e30));
  EXPECT_FALSE(cfg::seconds_to_duration(
      std::numeric_limits<double>::infinity()));
  EXPECT_FALSE(cfg::seconds_to_duration(
      std::numeric_limits<double>::quiet_NaN()));
}

TEST(config, malformed_documents) {
  expect_error("<config><interval>1</config>", cfg::errc::config_bad_format);
  expect_error("<settings/>", cfg::errc::config_no_config);
}

TEST(config, error_category) {
  std::error_code ec = cfg::errc::config_no_config;
  EXPECT_EQ(ec.category(), cfg::config_category());
  EXPECT_STREQ(ec.category().name(), "config");
  EXPECT_EQ(ec.message(), "Node <config></config> not found");
}

TEST(config, source_names) {
  EXPECT_EQ(cfg::source_from_string("rapl"), cfg::source::rapl);
  EXPECT_EQ(cfg::source_from_string("nvml"), cfg::source::nvml);
  EXPECT_FALSE(cfg::source_from_string("RAPL"));
  EXPECT_STREQ(cfg::to_string(cfg::source::nvml), "nvml");
}
