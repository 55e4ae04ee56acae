// rapl_reader.cpp

#include <pwr/log.hpp>
#include <pwr/rapl_reader.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <regex>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
constexpr char EVENT_PKG_PREFIX[] = "package-";
constexpr char EVENT_CPU_PREFIX[] = "cpu-";

// begin helper functions

ssize_t read_buff(int fd, char *buffer, size_t buffsz) {
  ssize_t ret;
  ret = pread(fd, buffer, buffsz - 1, 0);
  if (ret >= 0)
    buffer[ret] = '\0';
  return ret;
}

pwr::result<uint64_t> read_uint64(int fd) {
  using rettype = pwr::result<uint64_t>;
  constexpr static const size_t MAX_UINT64_SZ = 24;
  char buffer[MAX_UINT64_SZ];
  char *end;
  ssize_t ret = read_buff(fd, buffer, MAX_UINT64_SZ);
  if (ret < 0)
    return rettype(nonstd::unexpect, errno, std::system_category());
  errno = 0;
  uint64_t value = static_cast<uint64_t>(strtoull(buffer, &end, 10));
  if (buffer == end || errno == ERANGE)
    return rettype(nonstd::unexpect, pwr::errc::readings_not_valid);
  return value;
}

pwr::result<std::string> read_line(const fs::path &file) {
  using rettype = pwr::result<std::string>;
  auto fd = pwr::detail::file_descriptor::create(file.c_str());
  if (!fd)
    return rettype(nonstd::unexpect, fd.error());
  char buffer[128];
  if (read_buff(fd->value, buffer, sizeof(buffer)) < 0)
    return rettype(nonstd::unexpect, errno, std::system_category());
  std::string line(buffer);
  line.erase(line.find_last_not_of(" \t\r\n") + 1);
  line.erase(0, line.find_first_not_of(" \t\r\n"));
  return line;
}

// package-0 -> cpu-0
std::string domain_alias(const std::string &name) {
  constexpr size_t prefix_len = sizeof(EVENT_PKG_PREFIX) - 1;
  if (name.compare(0, prefix_len, EVENT_PKG_PREFIX))
    return name;
  std::string rest = name.substr(prefix_len);
  return EVENT_CPU_PREFIX + rest.substr(0, rest.find('-'));
}

// intel-rapl:0:1 is a child of intel-rapl:0; in the flat powercap class
// directory the parent is a sibling, in the device tree it is the parent
fs::path parent_domain(const fs::path &path) {
  static const std::regex last_index(":[0-9]+$");
  fs::path sibling = std::regex_replace(path.string(), last_index, "");
  std::error_code ec;
  if (!fs::exists(sibling, ec) && path.has_parent_path() &&
      path.parent_path().filename() == sibling.filename())
    return path.parent_path();
  return sibling;
}

fs::path without_trailing_separator(fs::path path) {
  std::string str = path.string();
  while (str.size() > 1 && str.back() == '/')
    str.pop_back();
  return str;
}
} // namespace

namespace pwr {
namespace detail {
result<file_descriptor> file_descriptor::create(const char *file) {
  int fd = open(file, O_RDONLY);
  if (fd == -1)
    return result<file_descriptor>(nonstd::unexpect, errno,
                                   std::system_category());
  return file_descriptor(fd);
}

file_descriptor::file_descriptor(int fd) noexcept : value(fd) {}

file_descriptor::file_descriptor(file_descriptor &&other) noexcept
    : value(std::exchange(other.value, -1)) {}

file_descriptor::~file_descriptor() noexcept {
  if (value >= 0 && close(value) == -1)
    log::logline(log::error, "error closing file descriptor %d: %s", value,
                 std::system_category().message(errno).c_str());
}

file_descriptor &file_descriptor::operator=(file_descriptor &&other) noexcept {
  if (this != &other) {
    if (value >= 0)
      close(value);
    value = std::exchange(other.value, -1);
  }
  return *this;
}
} // namespace detail

std::string rapl_domain_name(const fs::path &path,
                             const std::string &unnamed_tag) {
  static const std::regex child_domain(":[0-9]+:[0-9]+$");
  static const std::regex trailing_digits("[0-9]+$");

  std::string str = without_trailing_separator(path).string();
  std::string domain;
  if (std::regex_search(str, child_domain))
    domain = rapl_domain_name(parent_domain(str), unnamed_tag) + "-";

  if (auto name = read_line(fs::path(str) / "name"); name && !name->empty())
    domain += domain_alias(*name);
  else if (std::smatch m; std::regex_search(str, m, trailing_digits))
    domain += m.str();
  else
    domain += unnamed_tag;
  return domain;
}

rapl_device::rapl_device(fs::path path, const std::vector<quantity> &q,
                         quantity_policy policy)
    : reader({{quantity::energy, units::microjoules()}}, q, policy),
      _path(without_trailing_separator(std::move(path))), _name(),
      _max_energy_range(0), _energy(), _tag() {
  if (auto name = read_line(_path / "name"))
    _name = std::move(*name);
  else
    log::logline(log::warning, "name file not found for %s: %s",
                 _path.c_str(), name.error().message().c_str());

  auto max_fd = detail::file_descriptor::create((_path / "max_energy_range_uj").c_str());
  if (!max_fd)
    log::logline(log::warning, "max energy range file not found for %s: %s",
                 _path.c_str(), max_fd.error().message().c_str());
  else if (auto max = read_uint64(max_fd->value))
    _max_energy_range = *max;
  else
    log::logline(log::warning, "invalid max energy range for %s: %s",
                 _path.c_str(), max.error().message().c_str());

  if (auto fd = detail::file_descriptor::create((_path / "energy_uj").c_str()))
    _energy = std::move(*fd);
  else
    log::logline(log::warning, "energy file not found for %s: %s",
                 _path.c_str(), fd.error().message().c_str());

  _tag = rapl_domain_name(_path);
  log::logline(log::debug, "added RAPL device %s as %s (max range %llu uJ)",
               _path.c_str(), _tag.c_str(),
               static_cast<unsigned long long>(_max_energy_range));
}

std::vector<std::string> rapl_device::tags() const { return {_tag}; }

readings rapl_device::read() {
  if (quantities().empty())
    return {};
  if (auto energy = read_energy())
    return {static_cast<double>(*energy)};
  else
    log::logline(log::error, "failed to read energy for %s: %s",
                 _path.c_str(), energy.error().message().c_str());
  return {0.0};
}

std::string rapl_device::name() const { return "rapldevice"; }

matrix rapl_device::compute_energy_delta(const matrix &energy) const {
  matrix delta = reader::compute_energy_delta(energy);
  for (auto &row : delta)
    if (!row.empty() && row.front() < 0)
      row.front() += static_cast<double>(_max_energy_range);
  return delta;
}

result<uint64_t> rapl_device::read_energy() const {
  if (!_energy)
    return result<uint64_t>(nonstd::unexpect, errc::counter_not_open);
  return read_uint64(_energy->value);
}

const fs::path &rapl_device::path() const noexcept { return _path; }

const std::optional<std::string> &rapl_device::domain() const noexcept {
  return _name;
}

uint64_t rapl_device::max_energy_range() const noexcept {
  return _max_energy_range;
}

const std::string &rapl_device::tag() const noexcept { return _tag; }

rapl_reader::rapl_reader(fs::path dir, const std::vector<quantity> &q,
                         quantity_policy policy)
    : reader({{quantity::energy, units::microjoules()}}, q, policy),
      _dir(std::move(dir)), _devices(), _tags() {
  std::vector<fs::path> found;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      _dir, fs::directory_options::skip_permission_denied, ec);
  if (ec)
    log::logline(log::warning, "cannot open RAPL directory %s: %s",
                 _dir.c_str(), ec.message().c_str());
  for (fs::recursive_directory_iterator end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec))
      continue;
    if (fs::exists(it->path() / "energy_uj", entry_ec))
      found.push_back(it->path());
  }
  if (ec)
    log::logline(log::warning, "error walking RAPL directory %s: %s",
                 _dir.c_str(), ec.message().c_str());

  std::sort(found.begin(), found.end());
  size_t unknown = 0;
  for (auto &path : found) {
    auto &dev = _devices.emplace_back(std::make_unique<rapl_device>(
        std::move(path), std::vector<quantity>{quantity::energy}, policy));
    std::string tag = dev->tag();
    if (tag.find("unknown") != std::string::npos)
      tag = "unknown-" + std::to_string(unknown++);
    _tags.push_back(std::move(tag));
  }
  if (_devices.empty())
    log::logline(log::warning, "no RAPL devices found in %s", _dir.c_str());
  else
    log::logline(log::info, "found %zu RAPL devices in %s", _devices.size(),
                 _dir.c_str());
}

std::vector<std::string> rapl_reader::tags() const { return _tags; }

readings rapl_reader::read() {
  readings retval;
  if (quantities().empty())
    return retval;
  retval.reserve(_devices.size());
  for (size_t ix = 0; ix < _devices.size(); ix++)
    retval.push_back(static_cast<double>(read_energy_on_device(ix)));
  return retval;
}

std::string rapl_reader::name() const { return "raplreader"; }

matrix rapl_reader::compute_energy_delta(const matrix &energy) const {
  matrix delta = reader::compute_energy_delta(energy);
  // each counter wraps independently at its own range
  for (auto &row : delta)
    for (size_t col = 0; col < row.size() && col < _devices.size(); col++)
      if (row[col] < 0)
        row[col] += static_cast<double>(_devices[col]->max_energy_range());
  return delta;
}

uint64_t rapl_reader::read_energy_on_device(size_t idx) const {
  if (idx >= _devices.size()) {
    log::logline(log::error, "device index %zu out of range", idx);
    return 0;
  }
  auto energy = _devices[idx]->read_energy();
  if (!energy) {
    log::logline(log::error, "failed to read energy for device %zu: %s", idx,
                 energy.error().message().c_str());
    return 0;
  }
  return *energy;
}

const fs::path &rapl_reader::directory() const noexcept { return _dir; }

size_t rapl_reader::num_devices() const noexcept { return _devices.size(); }

const rapl_device &rapl_reader::device(size_t idx) const {
  if (idx >= _devices.size())
    throw exception(errc::no_such_device);
  return *_devices[idx];
}
} // namespace pwr
