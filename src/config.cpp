// config.cpp

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>

#include <nonstd/expected.hpp>
#include <pugixml.hpp>

using namespace pwrtrack;
using namespace pwrtrack::cfg;

static constexpr std::string_view error_messages[] = {
    "I/O error when loading config file",
    "Config file not found",
    "Out of memory when loading config file",
    "Config file is badly formatted",
    "Node <config></config> not found",
    "interval must be a positive decimal number of seconds",
    "frequency must be a positive decimal number",
    "write interval must be a positive decimal number of seconds",
    "log level must be one of debug, info, success, warning or error",
    "readers: reader must be <rapl/> or <nvml/>",
    "readers: quantities must be energy, power or temperature, separated by "
    "a comma",
    "readers: attribute 'output' cannot be empty",
    "readers: attribute 'path' cannot be empty",
};

static_assert(static_cast<size_t>(errc::empty_path) ==
                  sizeof(error_messages) / sizeof(error_messages[0]),
              "cfg::errc number of entries does not match message array size");

namespace {
template <typename T> using result = nonstd::expected<T, std::error_code>;

struct config_category_t : std::error_category {
  const char *name() const noexcept override { return "config"; }

  std::string message(int ev) const override {
    auto ec = static_cast<errc>(ev);
    if (ec >= errc::config_io_error && ec <= errc::empty_path)
      return std::string(error_messages[ev - 1]);
    return "(unrecognized error code)";
  }
};

const config_category_t config_category_v;

template <typename T> std::string remove_spaces(T &&txt) {
  std::string ret(std::forward<T>(txt));
  ret.erase(std::remove_if(ret.begin(), ret.end(),
                           [](unsigned char c) { return std::isspace(c); }),
            ret.end());
  return ret;
}

std::vector<std::string_view> split_line(std::string_view line,
                                         std::string_view delim) {
  std::vector<std::string_view> tokens;
  std::string_view::size_type current = 0;
  std::string_view::size_type next;
  while ((next = line.find_first_of(delim, current)) !=
         std::string_view::npos) {
    tokens.emplace_back(&line[current], next - current);
    current = next + delim.length();
  }
  if (current < line.length())
    tokens.emplace_back(&line[current], line.length() - current);
  return tokens;
}

result<std::optional<config_t::duration>>
get_interval(const pugi::xml_node &nconfig) {
  using namespace pugi;
  using rettype = result<std::optional<config_t::duration>>;
  xml_node nfreq = nconfig.child("freq");
  xml_node nint = nconfig.child("interval");
  // <interval/> overrides <freq/>
  if (nint) {
    auto interval = seconds_to_duration(nint.text().as_double(0.0));
    if (!interval)
      return rettype(nonstd::unexpect, errc::invalid_interval);
    return interval;
  }
  if (nfreq) {
    double freq = nfreq.text().as_double(0.0);
    if (!(freq > 0.0))
      return rettype(nonstd::unexpect, errc::invalid_freq);
    auto interval = seconds_to_duration(1.0 / freq);
    if (!interval)
      return rettype(nonstd::unexpect, errc::invalid_freq);
    return interval;
  }
  return std::nullopt;
}

result<std::optional<config_t::duration>>
get_write_interval(const pugi::xml_node &nconfig) {
  using rettype = result<std::optional<config_t::duration>>;
  pugi::xml_node nwrite = nconfig.child("write-interval");
  if (!nwrite)
    return std::nullopt;
  auto interval = seconds_to_duration(nwrite.text().as_double(0.0));
  if (!interval)
    return rettype(nonstd::unexpect, errc::invalid_write_interval);
  return interval;
}

result<std::optional<pwr::log::level>>
get_log_level(const pugi::xml_node &nconfig) {
  using rettype = result<std::optional<pwr::log::level>>;
  pugi::xml_node nlevel = nconfig.child("log-level");
  if (!nlevel)
    return std::nullopt;
  auto lvl = pwr::log::level_from_string(remove_spaces(nlevel.child_value()));
  if (!lvl)
    return rettype(nonstd::unexpect, errc::invalid_log_level);
  return lvl;
}

result<std::vector<pwr::quantity>> get_quantities(const pugi::xml_node &nrdr) {
  using rettype = result<std::vector<pwr::quantity>>;
  std::vector<pwr::quantity> retval;
  pugi::xml_attribute attr = nrdr.attribute("quantities");
  if (!attr)
    return retval;
  std::string value = remove_spaces(attr.value());
  if (value.empty())
    return rettype(nonstd::unexpect, errc::invalid_quantity);
  for (auto token : split_line(value, ",")) {
    auto q = pwr::quantity_from_string(token);
    if (!q)
      return rettype(nonstd::unexpect, errc::invalid_quantity);
    retval.push_back(*q);
  }
  return retval;
}

result<std::optional<std::string>>
get_nonempty_attribute(const pugi::xml_node &node, const char *name,
                       errc on_empty) {
  using rettype = result<std::optional<std::string>>;
  pugi::xml_attribute attr = node.attribute(name);
  if (!attr)
    return std::nullopt;
  if (!*attr.value())
    return rettype(nonstd::unexpect, on_empty);
  return attr.value();
}

reader_entry get_reader_entry(const pugi::xml_node &nrdr) {
  auto src = source_from_string(nrdr.name());
  if (!src)
    throw exception(errc::invalid_reader);
  reader_entry entry(*src);

  auto quantities = get_quantities(nrdr);
  if (!quantities)
    throw exception(quantities.error());
  entry.quantities = std::move(*quantities);

  auto output = get_nonempty_attribute(nrdr, "output", errc::empty_output);
  if (!output)
    throw exception(output.error());
  entry.output = std::move(*output);

  if (entry.src == source::rapl) {
    auto path = get_nonempty_attribute(nrdr, "path", errc::empty_path);
    if (!path)
      throw exception(path.error());
    entry.path = std::move(*path);
  }
  return entry;
}
} // namespace

std::error_code pwrtrack::cfg::make_error_code(errc x) noexcept {
  return {static_cast<int>(x), config_category_v};
}

const std::error_category &pwrtrack::cfg::config_category() noexcept {
  return config_category_v;
}

const char *pwrtrack::cfg::to_string(source s) noexcept {
  switch (s) {
  case source::rapl:
    return "rapl";
  case source::nvml:
    return "nvml";
  }
  return "unknown";
}

std::optional<source> pwrtrack::cfg::source_from_string(std::string_view str) {
  if (str == "rapl")
    return source::rapl;
  if (str == "nvml")
    return source::nvml;
  return std::nullopt;
}

reader_entry::reader_entry(source s)
    : src(s), quantities(), path(std::nullopt), output(std::nullopt) {}

struct config_t::impl {
  std::optional<duration> dt_read;
  std::optional<duration> dt_write;
  std::optional<pwr::log::level> log_level;
  std::vector<reader_entry> readers;

  impl();
  impl(std::istream &);
};

config_t::impl::impl() : dt_read(), dt_write(), log_level(), readers() {}

config_t::impl::impl(std::istream &is) : impl() {
  using namespace pugi;
  xml_document doc;
  xml_parse_result parse_result = doc.load(is);
  if (!parse_result) {
    switch (parse_result.status) {
    case status_file_not_found:
      throw exception(errc::config_not_found);
    case status_io_error:
      throw exception(errc::config_io_error);
    case status_out_of_memory:
      throw exception(errc::config_out_of_mem);
    default:
      throw exception(errc::config_bad_format);
    }
  }
  // <config></config>
  xml_node nconfig = doc.child("config");
  if (!nconfig)
    throw exception(errc::config_no_config);

  auto res_interval = get_interval(nconfig);
  if (!res_interval)
    throw exception(res_interval.error());
  dt_read = *res_interval;

  auto res_write = get_write_interval(nconfig);
  if (!res_write)
    throw exception(res_write.error());
  dt_write = *res_write;

  auto res_level = get_log_level(nconfig);
  if (!res_level)
    throw exception(res_level.error());
  log_level = *res_level;

  // <readers></readers> - optional
  for (xml_node nrdr : nconfig.child("readers").children()) {
    if (nrdr.type() != node_element)
      continue;
    readers.push_back(get_reader_entry(nrdr));
  }
}

config_t::config_t() : _impl(std::make_shared<impl>()) {}

config_t::config_t(std::istream &is) : _impl(std::make_shared<impl>(is)) {}

const std::optional<config_t::duration> &config_t::dt_read() const noexcept {
  return _impl->dt_read;
}

const std::optional<config_t::duration> &config_t::dt_write() const noexcept {
  return _impl->dt_write;
}

const std::optional<pwr::log::level> &config_t::log_level() const noexcept {
  return _impl->log_level;
}

const std::vector<reader_entry> &config_t::readers() const noexcept {
  return _impl->readers;
}

std::optional<config_t::duration>
pwrtrack::cfg::seconds_to_duration(double seconds) noexcept {
  using seconds_d = std::chrono::duration<double>;
  if (!std::isfinite(seconds) || seconds <= 0.0 ||
      seconds >= seconds_d(config_t::duration::max()).count())
    return std::nullopt;
  auto retval =
      std::chrono::duration_cast<config_t::duration>(seconds_d(seconds));
  if (retval.count() <= 0)
    return std::nullopt;
  return retval;
}

std::ostream &pwrtrack::cfg::operator<<(std::ostream &os,
                                        const reader_entry &x) {
  os << to_string(x.src) << ": quantities: ";
  if (x.quantities.empty())
    os << "default";
  for (auto it = x.quantities.begin(); it != x.quantities.end(); ++it)
    os << (it == x.quantities.begin() ? "" : ",") << *it;
  os << ", path: " << (x.path ? *x.path : "n/a");
  os << ", output: " << (x.output ? *x.output : "n/a");
  return os;
}

std::ostream &pwrtrack::cfg::operator<<(std::ostream &os, const config_t &x) {
  auto print_duration = [&os](const std::optional<config_t::duration> &d) {
    if (d)
      os << std::chrono::duration<double>(*d).count() << " s";
    else
      os << "n/a";
  };
  os << "interval: ";
  print_duration(x.dt_read());
  os << ", write interval: ";
  print_duration(x.dt_write());
  os << "\nreaders:";
  for (const auto &r : x.readers())
    os << "\n  " << r;
  return os;
}
