// nvml_reader_test.cpp

#include <pwr/nvml_reader.hpp>

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <utility>

using namespace pwr;

namespace {
// device d reports 10 * d + 1 (energy), 10 * d + 2 (temperature),
// 10 * d + 3 (power) unless the pair is marked as failing
class fake_device_source : public nvml_reader::device_source {
private:
  size_t _count;
  std::map<std::pair<quantity, size_t>, std::error_code> _failures;

public:
  explicit fake_device_source(size_t count) : _count(count), _failures() {}

  void fail(quantity q, size_t idx, std::error_code ec) {
    _failures[{q, idx}] = ec;
  }

  size_t num_devices() const noexcept override { return _count; }

  result<double> read(quantity q, size_t idx) const noexcept override {
    auto it = _failures.find({q, idx});
    if (it != _failures.end())
      return result<double>(nonstd::unexpect, it->second);
    double base = 10.0 * idx;
    switch (q) {
    case quantity::energy:
      return base + 1;
    case quantity::temperature:
      return base + 2;
    case quantity::power:
      return base + 3;
    }
    return result<double>(nonstd::unexpect, errc::unsupported_quantity);
  }
};

std::unique_ptr<nvml_reader>
try_create(const std::vector<quantity> &q = {quantity::power}) {
  try {
    return std::make_unique<nvml_reader>(q);
  } catch (const exception &) {
    return nullptr;
  }
}
} // namespace

TEST(nvml_reader, units) {
  testing::internal::CaptureStderr();
  auto rdr = try_create({quantity::energy, quantity::power,
                         quantity::temperature});
  testing::internal::GetCapturedStderr();
  if (!rdr)
    GTEST_SKIP() << "NVML is not available";
  EXPECT_EQ(rdr->get_unit(quantity::energy), units::millijoules());
  EXPECT_EQ(rdr->get_unit(quantity::power), units::milliwatts());
  EXPECT_EQ(rdr->get_unit(quantity::temperature), units::celsius());
  EXPECT_FALSE(rdr->energy_without_power());
}

TEST(nvml_reader, tags_and_reads) {
  testing::internal::CaptureStderr();
  auto rdr = try_create();
  testing::internal::GetCapturedStderr();
  if (!rdr)
    GTEST_SKIP() << "NVML is not available";
  auto tags = rdr->tags();
  ASSERT_EQ(tags.size(), rdr->num_devices());
  for (size_t ix = 0; ix < tags.size(); ix++)
    EXPECT_EQ(tags[ix], "gpu-" + std::to_string(ix));
  EXPECT_EQ(rdr->read().size(), tags.size());
  EXPECT_EQ(rdr->name(), "nvmlreader");

  testing::internal::CaptureStderr();
  EXPECT_EQ(rdr->read_on_device(quantity::power, tags.size()), 0.0);
  testing::internal::GetCapturedStderr();
}

TEST(nvml_reader, unavailable_library_throws_library_error) {
  testing::internal::CaptureStderr();
  try {
    nvml_reader rdr;
    testing::internal::GetCapturedStderr();
    GTEST_SKIP() << "NVML is available";
  } catch (const exception &e) {
    testing::internal::GetCapturedStderr();
    EXPECT_TRUE(e.code() == errc::not_implemented ||
                e.code().category() == gpu_category());
  }
}

TEST(nvml_reader, null_device_source_throws) {
  try {
    nvml_reader rdr(nullptr, {quantity::power});
    FAIL() << "expected an exception";
  } catch (const exception &e) {
    EXPECT_EQ(e.code(), errc::invalid_reader);
  }
}

TEST(nvml_reader, tags_from_device_source) {
  nvml_reader rdr(std::make_unique<fake_device_source>(3), {quantity::power});
  EXPECT_EQ(rdr.num_devices(), 3u);
  EXPECT_EQ(rdr.tags(),
            (std::vector<std::string>{"gpu-0", "gpu-1", "gpu-2"}));
}

TEST(nvml_reader, read_is_quantity_major) {
  nvml_reader rdr(std::make_unique<fake_device_source>(2),
                  {quantity::temperature, quantity::energy});
  ASSERT_EQ(rdr.quantities(),
            (std::vector<quantity>{quantity::temperature, quantity::energy}));
  readings values = rdr.read();
  ASSERT_EQ(values.size(), 4u);
  EXPECT_DOUBLE_EQ(values[0], 2.0);
  EXPECT_DOUBLE_EQ(values[1], 12.0);
  EXPECT_DOUBLE_EQ(values[2], 1.0);
  EXPECT_DOUBLE_EQ(values[3], 11.0);
}

TEST(nvml_reader, all_quantities_in_requested_order) {
  nvml_reader rdr(std::make_unique<fake_device_source>(1),
                  {quantity::energy, quantity::temperature, quantity::power});
  EXPECT_EQ(rdr.read(), (readings{1.0, 2.0, 3.0}));
}

TEST(nvml_reader, failed_device_query_reads_zero) {
  auto source = std::make_unique<fake_device_source>(3);
  source->fail(quantity::energy, 1, errc::no_such_device);
  nvml_reader rdr(std::move(source), {quantity::energy, quantity::power});

  testing::internal::CaptureStderr();
  readings values = rdr.read();
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(values, (readings{1.0, 0.0, 21.0, 3.0, 13.0, 23.0}));
  EXPECT_NE(err.find("failed to get energy for device 1"), std::string::npos);
}

TEST(nvml_reader, out_of_range_device_reads_zero) {
  nvml_reader rdr(std::make_unique<fake_device_source>(2), {quantity::power});

  testing::internal::CaptureStderr();
  double value = rdr.read_on_device(quantity::power, 2);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(value, 0.0);
  EXPECT_NE(err.find("device index 2 out of range"), std::string::npos);
  EXPECT_DOUBLE_EQ(rdr.read_on_device(quantity::power, 1), 13.0);
}
