/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski
///
/// parcelgen: generates cadastral parcels (or road blocks) from road
/// centerline and building point shapefiles.

#include "Pipeline.hpp"
#include "CadIo.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace fs = std::filesystem;

using namespace cadastre;

namespace {

std::atomic<bool> Interrupted{false};

extern "C" void OnInterrupt(int) { Interrupted = true; }

class InterruptObserver : public ProgressObserver {
public:
  bool cancelled() const override { return Interrupted.load(); }
}; // InterruptObserver

struct Options {
  std::vector<std::string> inputs;
  std::string roads;
  std::string points;
  double bufferM   = 10.0;
  double minAreaM2 = 250.0;
  double maxAreaM2 = 2000.0;
  std::string crs = "AUTO";
  std::string sourceCrs = "EPSG:4326";
  std::string mode = "parcels";
  double extentBufferPct = Tune::DefaultExtentBufferPct;
  bool noBlockFilter = false;
  std::string output;
  std::string formatName;
  OutputFormat format = OutputFormat::Wkt;
  std::string logLevel = "info";
  std::string configFile;
}; // Options

void Usage(std::ostream& os, const po::options_description& desc) {
  os << "Usage:\n"
     << "  parcelgen [options] --input <shp|dir>... --roads <layer>"
        " [--points <layer>] --output <file>\n\n"
     << desc << '\n';
} // Usage

std::optional<Options> ParseArgs(int argc, const char* argv[]) {
  auto opts = Options{};

  auto desc = po::options_description("Options");
  desc.add_options()
    ("help,h", "Show help.")
    ("config,c", po::value<std::string>(&opts.configFile),
      "INI-style file with any of the long options below.")
    ("input,i", po::value<std::vector<std::string>>(&opts.inputs)
        ->multitoken()->composing(),
      "Shapefile(s), or directories of shapefiles, to load as layers.")
    ("roads,r", po::value<std::string>(&opts.roads)->required(),
      "Road centerline layer (file stem).")
    ("points,p", po::value<std::string>(&opts.points),
      "Building point layer (file stem); required in parcels mode.")
    ("buffer,b", po::value<double>(&opts.bufferM)->default_value(10.0),
      "Road reserve half-width in metres.")
    ("min-area", po::value<double>(&opts.minAreaM2)->default_value(250.0),
      "Minimum parcel area in square metres.")
    ("max-area", po::value<double>(&opts.maxAreaM2)->default_value(2000.0),
      "Maximum parcel area in square metres; 0 for no maximum.")
    ("crs", po::value<std::string>(&opts.crs)->default_value("AUTO"),
      "Target metric CRS: EPSG:<code>, AEQD:<lat>,<lon>, LOCAL or AUTO.")
    ("source-crs", po::value<std::string>(&opts.sourceCrs)
        ->default_value("EPSG:4326"),
      "CRS of the input shapefiles.")
    ("mode,m", po::value<std::string>(&opts.mode)->default_value("parcels"),
      ("Output: " + Spellings<Mode>() + ".").c_str())
    ("extent-buffer", po::value<double>(&opts.extentBufferPct)
        ->default_value(Tune::DefaultExtentBufferPct),
      "Voronoi extent growth in percent, 10 to 30.")
    ("no-block-filter", po::bool_switch(&opts.noBlockFilter),
      "In blocks mode, keep blocks of every area.")
    ("output,o", po::value<std::string>(&opts.output)->required(),
      "Output file path.")
    ("format,f", po::value<std::string>(&opts.formatName),
      ("Output format, " + Spellings<OutputFormat>(" or ")
       + " (default: from the output extension).").c_str())
    ("log-level", po::value<std::string>(&opts.logLevel)->default_value("info"),
      "trace, debug, info, warn, error, critical or off.");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help") != 0U) {
      Usage(std::cout, desc);
      return std::nullopt;
    }

    // Command-line values were stored first, so they take precedence.
    if (vm.count("config") != 0U) {
      const auto& file = vm["config"].as<std::string>();
      po::store(po::parse_config_file<char>(file.c_str(), desc), vm);
    }

    po::notify(vm);
  }
  catch (const po::error& e) {
    std::cerr << "Command line error: " << e.what() << "\n\n";
    Usage(std::cerr, desc);
    std::exit(ExitUsage);
  }

  if (opts.inputs.empty()) {
    std::cerr << "Error: at least one --input is required.\n";
    std::exit(ExitUsage);
  }

  if (opts.formatName.empty()) {
    opts.format = FormatFor(opts.output);
  } else if (const auto f = FromChars<OutputFormat>(opts.formatName)) {
    opts.format = *f;
  } else {
    std::cerr << "Error: --format must be "
              << Spellings<OutputFormat>(" or ") << ".\n";
    std::exit(ExitUsage);
  }

  return opts;
} // ParseArgs

Request MakeRequest(const Options& opts) {
  auto rq = Request{};
  rq.roads = opts.roads;
  if (!opts.points.empty())
    rq.points = opts.points;
  rq.buffer = geom::FromMetres(opts.bufferM);
  rq.area.min = geom::FromSquareMetres(opts.minAreaM2);
  rq.area.max = geom::FromSquareMetres(opts.maxAreaM2);
  rq.crs = Crs::Parse(opts.crs);
  const auto mode = FromChars<Mode>(opts.mode);
  if (!mode)
    throw ConfigError{std::format("--mode must be one of {}", Spellings<Mode>())};
  rq.mode = *mode;
  rq.extentBufferPct = opts.extentBufferPct;
  rq.filterBlocks = !opts.noBlockFilter;
  Validate(rq);
  return rq;
} // MakeRequest

LayerStore LoadInputs(const std::vector<std::string>& inputs, const Crs& crs) {
  auto store = LayerStore{};
  for (const auto& in: inputs) {
    const auto path = fs::path{in};
    if (!fs::is_directory(path)) {
      store.add(ReadShp(path, crs));
      continue;
    }
    auto files = std::vector<fs::path>{};
    for (const auto& entry: fs::directory_iterator{path}) {
      if (entry.is_regular_file() && entry.path().extension() == ".shp")
        files.push_back(entry.path());
    }
    std::ranges::sort(files);
    for (const auto& f: files)
      store.add(ReadShp(f, crs));
  }
  return store;
} // LoadInputs

} // local

int main(int argc, const char* argv[]) {
  try {
    const auto opts = ParseArgs(argc, argv);
    if (!opts)
      return ExitSuccess;

    auto request = Request{};
    auto sourceCrs = Crs{};
    try {
      log::Init(log::ParseLevel(opts->logLevel));
      request = MakeRequest(*opts);
      sourceCrs = Crs::Parse(opts->sourceCrs);
    } catch (const ConfigError& x) {
      std::cerr << "Error: " << x.what() << '\n';
      return ExitUsage;
    }

    std::signal(SIGINT, OnInterrupt);

    const auto store = LoadInputs(opts->inputs, sourceCrs);
    auto observer = InterruptObserver{};
    auto outcome = Run(store, request, observer);
    if (outcome.outcome == Outcome::Cancelled)
      log::Logger().warn("{}", outcome.message);
    if (outcome.outcome != Outcome::Succeeded)
      return ExitStatus(outcome.outcome);

    const auto& result = *outcome.result;
    const auto& s = result.stats;
    if (request.mode == Mode::Parcels) {
      log::Logger().info("points {}, cells {}, blocks {}, after subtract {}, "
                         "after clamp {}, kept {}",
                         s.pointCount, s.cellCount, s.blockCount,
                         s.afterSubtract, s.afterClamp, s.finalCount);
    } else {
      log::Logger().info("blocks {}, kept {}", s.blockCount, s.finalCount);
    }
    if (!result.warnings.empty())
      log::Logger().info("{} warnings, see above", result.warnings.size());
    return ExitStatus(SaveOrDump(result.layer, opts->output, opts->format,
                                 std::cout));
  }
  catch (std::exception& x) {
    std::cerr << "Exception: " << x.what() << '\n';
  }
  catch (...) {
    std::cerr << "Unknown exception\n";
  }

  return ExitFailure;
} // main
