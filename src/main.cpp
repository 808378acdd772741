#include "ColorListFile.h"
#include "GamutFilter.h"
#include "Logging.h"
#include "SievePipeline.h"

#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <opencv2/core.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace {
const int kExitOk = 0;
const int kExitError = 1;
const int kExitUsage = 2;

struct ThresholdOption {
  const char* name;
  PerceptualRegion region;
};

const ThresholdOption kThresholdOptions[] = {
    {"threshold-neutral", PerceptualRegion::Neutral},
    {"threshold-pastel", PerceptualRegion::Pastel},
    {"threshold-dark", PerceptualRegion::Dark},
    {"threshold-saturated", PerceptualRegion::Saturated},
    {"threshold-very-saturated", PerceptualRegion::VerySaturated},
};

// Fills params from the parsed options. Returns false with a usage message on bad values.
bool BuildParams(const po::variables_map& vm, SievePipeline::Params& params, std::string& outError) {
  if (!SievePipeline::ParseMode(vm["mode"].as<std::string>(), params.mode)) {
    outError = "Unknown mode '" + vm["mode"].as<std::string>() + "' (perceptual, print-unique, gamut, partition).";
    return false;
  }
  if (!SievePipeline::ParseGamutOrder(vm["gamut-order"].as<std::string>(), params.gamutOrder)) {
    outError = "Unknown gamut order '" + vm["gamut-order"].as<std::string>() + "' (none, before, after).";
    return false;
  }
  if (params.mode != SievePipeline::Mode::Perceptual && params.gamutOrder != SievePipeline::GamutOrder::None) {
    outError = "--gamut-order only applies to perceptual mode.";
    return false;
  }

  params.coarseStep = vm["coarse-step"].as<int>();
  params.gamut.tolerance = vm["tolerance"].as<int>();

  for (const ThresholdOption& opt : kThresholdOptions) {
    if (vm.count(opt.name)) params.dedup.thresholds.Set(opt.region, vm[opt.name].as<double>());
  }

  if (vm.count("families") && !HueFamilyClassifier::ParseList(vm["families"].as<std::string>(), params.families, outError)) {
    return false;
  }

  return SievePipeline::Validate(params, outError);
}

bool WritePartition(const std::string& prefix, const SievePipeline::Params& params,
                    const HueFamilyPartition& partition, std::string& outError) {
  std::vector<std::string> paths;
  std::vector<RgbList> lists;
  for (HueFamily family : params.families) {
    RgbList colors;
    for (const FamilyMember& m : partition.Members(family)) colors.push_back(m.color);
    paths.push_back(prefix + "_" + HueFamilyClassifier::Name(family) + ".txt");
    lists.push_back(std::move(colors));
  }
  return ColorListFile::SaveAll(paths, lists, outError);
}
} // namespace

int main(int argc, char* argv[]) {
  po::options_description desc("colorsieve: perceptual color list reduction\nUsage: colorsieve -i colors.txt -o out.txt [options]");
  // clang-format off
  desc.add_options()
    ("help,h", "show this help")
    ("input,i", po::value<std::string>(), "color list to read (header line, then R, G, B rows)")
    ("output,o", po::value<std::string>(), "color list to write; output prefix in partition mode")
    ("mode", po::value<std::string>()->default_value("perceptual"), "perceptual | print-unique | gamut | partition")
    ("profile", po::value<std::string>(), "ICC printer profile (print-unique, gamut, --gamut-order before|after)")
    ("gamut-order", po::value<std::string>()->default_value("none"), "none | before | after: gamut filter around perceptual dedup")
    ("tolerance", po::value<int>()->default_value(2), "gamut round-trip tolerance in device units")
    ("threshold-neutral", po::value<double>(), "dE2000 threshold for neutral colors (default 0.5)")
    ("threshold-pastel", po::value<double>(), "dE2000 threshold for pastel colors (default 0.7)")
    ("threshold-dark", po::value<double>(), "dE2000 threshold for dark colors (default 0.8)")
    ("threshold-saturated", po::value<double>(), "dE2000 threshold for saturated colors (default 1.2)")
    ("threshold-very-saturated", po::value<double>(), "dE2000 threshold for very saturated colors (default 1.5)")
    ("coarse-step", po::value<int>()->default_value(0), "snap channels to multiples of N and keep one color per cell first (0 = off)")
    ("families", po::value<std::string>(), "hue families for partition mode, comma separated (default all)")
    ("threads", po::value<int>()->default_value(0), "worker threads for parallel loops (0 = OpenCV default)")
    ("config", po::value<std::string>(), "INI file with any of the long options; command line wins")
    ("log-level", po::value<std::string>()->default_value("3"), "0..5 or fatal|error|warning|info|debug|trace");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return kExitOk;
    }

    // Values already stored from the command line are not overwritten.
    if (vm.count("config")) {
      po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(), desc), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << desc << "\n";
    return kExitUsage;
  }

  unsigned int logLevel = 3;
  if (!ParseLoggingLevel(vm["log-level"].as<std::string>(), logLevel)) {
    std::cerr << "Error: invalid --log-level '" << vm["log-level"].as<std::string>() << "'\n";
    return kExitUsage;
  }
  SetLoggingLevel(logLevel);
  BOOST_LOG_TRIVIAL(debug) << "Log level " << LoggingLevelName(GetLoggingLevel());

  if (!vm.count("input") || !vm.count("output")) {
    std::cerr << "Error: --input and --output are required\n";
    std::cerr << desc << "\n";
    return kExitUsage;
  }
  const std::string inputPath = vm["input"].as<std::string>();
  const std::string outputPath = vm["output"].as<std::string>();

  SievePipeline::Params params;
  std::string err;
  if (!BuildParams(vm, params, err)) {
    std::cerr << "Error: " << err << "\n";
    return kExitUsage;
  }

  // The profile is opened before any color is read.
  std::unique_ptr<IccRoundTripTransform> device;
  if (SievePipeline::NeedsDevice(params)) {
    if (!vm.count("profile")) {
      std::cerr << "Error: mode '" << SievePipeline::ModeName(params.mode) << "' needs --profile\n";
      return kExitUsage;
    }
    device = IccRoundTripTransform::Open(vm["profile"].as<std::string>(), err);
    if (!device) {
      BOOST_LOG_TRIVIAL(error) << err;
      return kExitError;
    }
  }

  const int threads = vm["threads"].as<int>();
  if (threads > 0) cv::setNumThreads(threads);

  RgbList colors;
  if (!ColorListFile::Load(inputPath, colors, err)) {
    BOOST_LOG_TRIVIAL(error) << err;
    return kExitError;
  }

  SievePipeline::Output out;
  if (!SievePipeline::Run(colors, params, device.get(), out, err)) {
    BOOST_LOG_TRIVIAL(error) << err;
    return kExitError;
  }

  const bool saved = params.mode == SievePipeline::Mode::Partition
                         ? WritePartition(outputPath, params, out.partition, err)
                         : ColorListFile::Save(outputPath, out.colors, err);
  if (!saved) {
    BOOST_LOG_TRIVIAL(error) << err;
    return kExitError;
  }

  BOOST_LOG_TRIVIAL(info) << "Done: " << out.summary.input << " colors in, " << out.summary.output << " out.";
  return kExitOk;
}
