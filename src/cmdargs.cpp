// cmdargs.cpp

#include "cmdargs.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>

#include <getopt.h>

using namespace pwrtrack;

extern int opterr;
extern int optopt;
extern int optind;
extern char *optarg;

namespace {
std::optional<arguments::duration> parse_seconds_argument(const char *option,
                                                          const char *value) {
  char *end = nullptr;
  errno = 0;
  double seconds = std::strtod(value, &end);
  if (errno || end == value || *end) {
    std::cerr << option << ": invalid number of seconds '" << value << "'\n";
    return std::nullopt;
  }
  auto retval = cfg::seconds_to_duration(seconds);
  if (!retval)
    std::cerr << option << ": must be a positive, finite number of seconds\n";
  return retval;
}

struct parameter {
  inline static const auto pad = std::setw(30);

  const char *text;

  friend std::ostream &operator<<(std::ostream &os, const parameter &p) {
    os << "  " << std::left << pad << p.text;
    return os;
  }
};

void print_usage(const char *program_name) {
  std::cout << "Usage:\n\n";
  std::cout << program_name << " <options>\n\n";

  std::ios::fmtflags flags(std::cout.flags());

  std::cout << "options:\n";

  std::cout << parameter{"-h, --help"} << "print this message and exit"
            << "\n";

  std::cout << parameter{"-c, --config <file>"}
            << "(optional) read from configuration file <file>"
            << "\n";

  std::cout << parameter{"-t, --dt-read <seconds>"}
            << "seconds between reads, overrides config value (default: 1)"
            << "\n";

  std::cout << parameter{"-w, --dt-write <seconds>"}
            << "seconds between writes to the output files, "
            << "overrides config value (default: 3600)"
            << "\n";

  std::cout << parameter{"-i, --id <suffix>"}
            << "(optional) name default outputs <reader>_<suffix>.log"
            << "\n";

  std::cout << parameter{"-r, --reader {rapl,nvml}"}
            << "track this source, may be repeated; "
            << "overrides the readers in the config (default: rapl and nvml)"
            << "\n";

  std::cout << parameter{"-l, --log-level <level>"}
            << "minimum log level: debug, info, success, warning or error "
            << "(default: debug)"
            << "\n";

  std::cout << parameter{"--log <file>"}
            << "(optional) write log to <file> (default: stdout)"
            << "\n";

  std::cout << parameter{"-q, --quiet"}
            << "suppress log messages except errors to stderr (default: off)"
            << "\n";

  std::cout.flush();
  std::cout.flags(flags);
}
} // namespace

std::ostream &pwrtrack::operator<<(std::ostream &os, const arguments &args) {
  auto print_duration = [&os](const std::optional<arguments::duration> &d) {
    if (d)
      os << std::chrono::duration<double>(*d).count() << " s";
    else
      os << "n/a";
  };
  os << "config: " << (args.config.empty() ? "n/a" : args.config);
  os << ", interval: ";
  print_duration(args.dt_read);
  os << ", write interval: ";
  print_duration(args.dt_write);
  os << ", id: " << (args.id.empty() ? "n/a" : args.id);
  os << ", readers:";
  if (args.readers.empty())
    os << " n/a";
  for (auto src : args.readers)
    os << " " << cfg::to_string(src);
  return os;
}

std::optional<arguments> pwrtrack::parse_arguments(int argc,
                                                   char *const argv[]) {
  int c;
  int option_index = 0;
  bool quiet = false;
  std::string config;
  std::string logpath;
  std::string id;
  std::optional<arguments::duration> dt_read;
  std::optional<arguments::duration> dt_write;
  std::optional<pwr::log::level> level;
  std::vector<cfg::source> readers;

  struct option long_options[] = {
      {"help", no_argument, nullptr, 'h'},
      {"config", required_argument, nullptr, 'c'},
      {"dt-read", required_argument, nullptr, 't'},
      {"dt-write", required_argument, nullptr, 'w'},
      {"id", required_argument, nullptr, 'i'},
      {"reader", required_argument, nullptr, 'r'},
      {"log-level", required_argument, nullptr, 'l'},
      {"log", required_argument, nullptr, 0x100},
      {"quiet", no_argument, nullptr, 'q'},
      {nullptr, 0, nullptr, 0}};

  // start a fresh scan on every call
  optind = 0;
  while ((c = getopt_long(argc, argv, "hqc:t:w:i:r:l:", long_options,
                          &option_index)) != -1) {
    switch (c) {
    case 'c':
      config = optarg;
      if (config.empty()) {
        std::cerr << "-c/--config cannot be empty\n";
        return std::nullopt;
      }
      break;
    case 't':
      dt_read = parse_seconds_argument("-t/--dt-read", optarg);
      if (!dt_read)
        return std::nullopt;
      break;
    case 'w':
      dt_write = parse_seconds_argument("-w/--dt-write", optarg);
      if (!dt_write)
        return std::nullopt;
      break;
    case 'i':
      id = optarg;
      if (id.empty()) {
        std::cerr << "-i/--id cannot be empty\n";
        return std::nullopt;
      }
      break;
    case 'r': {
      auto src = cfg::source_from_string(optarg);
      if (!src) {
        std::cerr << "-r/--reader: unknown reader '" << optarg
                  << "'; must be rapl or nvml\n";
        return std::nullopt;
      }
      if (std::find(readers.begin(), readers.end(), *src) == readers.end())
        readers.push_back(*src);
    } break;
    case 'l':
      level = pwr::log::level_from_string(optarg);
      if (!level) {
        std::cerr << "-l/--log-level: unknown level '" << optarg << "'\n";
        return std::nullopt;
      }
      break;
    case 0x100:
      logpath = optarg;
      if (logpath.empty()) {
        std::cerr << "--log cannot be empty\n";
        return std::nullopt;
      }
      break;
    case 'q':
      quiet = true;
      break;
    case 'h':
    case '?':
    default:
      // getopt already printed an error message
      print_usage(argv[0]);
      return std::nullopt;
    }
  }

  if (optind != argc) {
    std::cerr << "unexpected argument '" << argv[optind] << "'\n";
    return std::nullopt;
  }

  if (quiet && !logpath.empty()) {
    std::cerr << "both -q/--quiet and --log provided\n";
    return std::nullopt;
  }

  return arguments{std::move(config),
                   dt_read,
                   dt_write,
                   std::move(id),
                   std::move(readers),
                   log_args{quiet, std::move(logpath), level}};
}
