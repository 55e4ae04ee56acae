// reader_container.cpp

#include "reader_container.hpp"
#include "cmdargs.hpp"
#include "config.hpp"

#include <pwr/log.hpp>
#include <pwr/nvml_reader.hpp>
#include <pwr/rapl_reader.hpp>

#include <algorithm>

using namespace pwrtrack;

namespace pwrtrack {
using pwr::log;
}

namespace {
std::unique_ptr<pwr::reader> create_reader(const cfg::reader_entry &entry) {
  switch (entry.src) {
  case cfg::source::rapl: {
    std::filesystem::path dir =
        entry.path ? *entry.path : pwr::rapl_reader::default_dir;
    if (entry.quantities.empty())
      return std::make_unique<pwr::rapl_reader>(std::move(dir));
    return std::make_unique<pwr::rapl_reader>(std::move(dir),
                                              entry.quantities);
  }
  case cfg::source::nvml:
    if (entry.quantities.empty())
      return std::make_unique<pwr::nvml_reader>();
    return std::make_unique<pwr::nvml_reader>(entry.quantities);
  }
  throw cfg::exception(cfg::errc::invalid_reader);
}
} // namespace

std::vector<cfg::reader_entry>
pwrtrack::effective_entries(const cfg::config_t &config,
                            const arguments &args) {
  std::vector<cfg::reader_entry> retval;
  // command line selects the sources, keeping matching config attributes
  if (!args.readers.empty()) {
    for (auto src : args.readers) {
      auto it = std::find_if(
          config.readers().begin(), config.readers().end(),
          [src](const cfg::reader_entry &e) { return e.src == src; });
      if (it != config.readers().end())
        retval.push_back(*it);
      else
        retval.emplace_back(src);
    }
    return retval;
  }
  if (!config.readers().empty())
    return config.readers();
  retval.emplace_back(cfg::source::rapl);
  retval.emplace_back(cfg::source::nvml);
  return retval;
}

reader_container::reader_container(const cfg::config_t &config,
                                   const arguments &args)
    : _readers(), _outputs() {
  for (const auto &entry : effective_entries(config, args)) {
    try {
      emplace_reader(entry, args.id);
    } catch (const std::exception &e) {
      log::logline(log::error, "error creating %s reader: %s",
                   cfg::to_string(entry.src), e.what());
    }
  }
  if (_readers.empty())
    throw pwr::exception(pwr::errc::no_devices_found,
                         "no reader could be created");
}

void reader_container::emplace_reader(const cfg::reader_entry &entry,
                                      const std::string &id) {
  auto rdr = create_reader(entry);
  std::string output;
  if (entry.output)
    output = *entry.output;
  else if (!id.empty())
    output = rdr->name() + "_" + id + ".log";
  log::logline(log::success, "created %s reader with %zu devices",
               cfg::to_string(entry.src), rdr->tags().size());
  _readers.push_back(std::move(rdr));
  _outputs.push_back(std::move(output));
}

size_t reader_container::size() const noexcept { return _readers.size(); }

const std::vector<std::string> &reader_container::outputs() const noexcept {
  return _outputs;
}

std::vector<std::unique_ptr<pwr::reader>> reader_container::release_readers() {
  return std::move(_readers);
}
