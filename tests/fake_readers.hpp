// fake_readers.hpp

#pragma once

#include <pwr/reader.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pwr::test {
// energy counters in joules that grow by (column + 1) per read
class fake_energy_reader : public reader {
private:
  std::vector<std::string> _tags;
  std::atomic<size_t> _reads;

public:
  explicit fake_energy_reader(
      std::vector<std::string> tags = {"fake-0", "fake-1"},
      const std::vector<quantity> &q = {quantity::energy},
      quantity_policy policy = quantity_policy::fail_fast)
      : reader({{quantity::energy, units::joules()},
                {quantity::temperature, units::celsius()}},
               q, policy),
        _tags(std::move(tags)), _reads(0) {}

  std::vector<std::string> tags() const override { return _tags; }

  readings read() override {
    size_t n = ++_reads;
    readings retval;
    for (quantity q : quantities())
      for (size_t col = 0; col < _tags.size(); col++)
        retval.push_back(q == quantity::energy
                             ? static_cast<double>(n * (col + 1))
                             : 40.0 + col);
    return retval;
  }

  std::string name() const override { return "fakereader"; }

  size_t reads() const noexcept { return _reads; }
};

// power-only reader; no power is derived for it
class fake_power_reader : public reader {
public:
  fake_power_reader()
      : reader({{quantity::power, units::watts()}}, {quantity::power},
               quantity_policy::fail_fast) {}

  std::vector<std::string> tags() const override { return {"gpu-0"}; }
  readings read() override { return {100.0}; }
  std::string name() const override { return "fakepower"; }
};

// takes longer than any sensible interval
class slow_reader : public fake_energy_reader {
private:
  std::chrono::milliseconds _delay;

public:
  explicit slow_reader(std::chrono::milliseconds delay)
      : fake_energy_reader({"slow-0"}), _delay(delay) {}

  readings read() override {
    std::this_thread::sleep_for(_delay);
    return fake_energy_reader::read();
  }
};

// fails on the nth read
class failing_reader : public fake_energy_reader {
private:
  size_t _fail_at;
  size_t _count;

public:
  explicit failing_reader(size_t fail_at)
      : fake_energy_reader({"bad-0"}), _fail_at(fail_at), _count(0) {}

  readings read() override {
    if (++_count >= _fail_at)
      throw std::runtime_error("sensor disappeared");
    return fake_energy_reader::read();
  }
};
// fails on the nth read with an exception not derived from std::exception
class odd_failing_reader : public fake_energy_reader {
public:
  struct sensor_fault {
    int code;
  };

private:
  size_t _fail_at;
  size_t _count;

public:
  explicit odd_failing_reader(size_t fail_at)
      : fake_energy_reader({"odd-0"}), _fail_at(fail_at), _count(0) {}

  readings read() override {
    if (++_count >= _fail_at)
      throw sensor_fault{5};
    return fake_energy_reader::read();
  }
};
} // namespace pwr::test
