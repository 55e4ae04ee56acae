// rapl_reader.hpp

#pragma once

#include <pwr/reader.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pwr {
namespace detail {
struct file_descriptor {
  static result<file_descriptor> create(const char *file);

  int value;

  ~file_descriptor() noexcept;

  file_descriptor(const file_descriptor &) = delete;
  file_descriptor &operator=(const file_descriptor &) = delete;

  file_descriptor(file_descriptor &&fd) noexcept;
  file_descriptor &operator=(file_descriptor &&other) noexcept;

private:
  explicit file_descriptor(int fd) noexcept;
};
} // namespace detail

// one powercap energy counter, e.g. /sys/class/powercap/intel-rapl:0:0
class rapl_device final : public reader {
private:
  std::filesystem::path _path;
  std::optional<std::string> _name;
  uint64_t _max_energy_range;
  std::optional<detail::file_descriptor> _energy;
  std::string _tag;

public:
  explicit rapl_device(std::filesystem::path path,
                       const std::vector<quantity> & = {quantity::energy},
                       quantity_policy = quantity_policy::log_and_skip);

  std::vector<std::string> tags() const override;
  readings read() override;
  std::string name() const override;

  matrix compute_energy_delta(const matrix &) const override;
  using reader::compute_energy_delta;

  // raw counter value in microjoules
  result<uint64_t> read_energy() const;

  const std::filesystem::path &path() const noexcept;
  const std::optional<std::string> &domain() const noexcept;
  uint64_t max_energy_range() const noexcept;
  const std::string &tag() const noexcept;
};

// every powercap energy counter found under a directory
class rapl_reader final : public reader {
public:
  static constexpr const char default_dir[] =
      "/sys/class/powercap/intel-rapl/subsystem";

private:
  std::filesystem::path _dir;
  std::vector<std::unique_ptr<rapl_device>> _devices;
  std::vector<std::string> _tags;

public:
  explicit rapl_reader(std::filesystem::path dir = default_dir,
                       const std::vector<quantity> & = {quantity::energy},
                       quantity_policy = quantity_policy::log_and_skip);

  std::vector<std::string> tags() const override;
  readings read() override;
  std::string name() const override;

  matrix compute_energy_delta(const matrix &) const override;
  using reader::compute_energy_delta;

  // zero and a logged error on failure
  uint64_t read_energy_on_device(size_t idx) const;

  const std::filesystem::path &directory() const noexcept;
  size_t num_devices() const noexcept;
  const rapl_device &device(size_t idx) const;
};

// domain name derived from the powercap path and its name files,
// e.g. intel-rapl:0:1 under package-0 with name core -> cpu-0-core
std::string rapl_domain_name(const std::filesystem::path &path,
                             const std::string &unnamed_tag = "unknown");
} // namespace pwr
