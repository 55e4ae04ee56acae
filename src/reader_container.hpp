// reader_container.hpp

#pragma once

#include <pwr/reader.hpp>

#include <memory>
#include <string>
#include <vector>

namespace pwrtrack {
struct arguments;

namespace cfg {
struct config_t;
struct reader_entry;
} // namespace cfg

// the readers to track, with one output path each
class reader_container {
private:
  std::vector<std::unique_ptr<pwr::reader>> _readers;
  std::vector<std::string> _outputs;

public:
  // sources that fail to initialise are logged and skipped
  reader_container(const cfg::config_t &, const arguments &);

  size_t size() const noexcept;
  const std::vector<std::string> &outputs() const noexcept;

  std::vector<std::unique_ptr<pwr::reader>> release_readers();

private:
  void emplace_reader(const cfg::reader_entry &, const std::string &id);
};

std::vector<cfg::reader_entry> effective_entries(const cfg::config_t &,
                                                 const arguments &);
} // namespace pwrtrack
