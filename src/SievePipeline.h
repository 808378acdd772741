#pragma once

#include "ColorTypes.h"
#include "DedupConfig.h"
#include "GamutFilter.h"
#include "HueFamilyClassifier.h"
#include "PerceptualDeduplicator.h"

#include <string>
#include <vector>

// SievePipeline:
// - Independent of the command line and of file I/O.
// - Runs one of the color list reductions:
//   perceptual    [coarse grid] -> [gamut before] -> perceptual dedup -> [gamut after]
//   print-unique  [coarse grid] -> one color per printed value
//   gamut         [coarse grid] -> in-gamut colors
//   partition     grid reduction -> hue family partition
// Either the whole run succeeds or out is left empty and outError says why.
class SievePipeline {
public:
  enum class Mode { Perceptual, PrintUnique, Gamut, Partition };
  enum class GamutOrder { None, Before, After };

  // Grid step partition mode uses when coarseStep is 0.
  static constexpr int kPartitionStep = 2;

  struct Params {
    Mode mode = Mode::Perceptual;
    GamutOrder gamutOrder = GamutOrder::None;
    int coarseStep = 0; // 0 disables the pre-pass
    std::vector<HueFamily> families = HueFamilyClassifier::AllFamilies();
    DedupConfig dedup;
    GamutFilter::Params gamut;
  };

  struct StageCount {
    std::string stage;
    size_t count = 0;
  };

  struct Summary {
    size_t input = 0;
    size_t output = 0;
    std::vector<StageCount> stages;
    DedupStats dedup;
    PrintUniqueStats printUnique;

    double ReductionPercent() const { return input == 0 ? 0.0 : 100.0 * (input - output) / input; }
  };

  struct Output {
    RgbList colors;                // every mode except partition
    HueFamilyPartition partition;  // partition mode only
    Summary summary;
  };

  static bool NeedsDevice(const Params& params);
  static bool Validate(const Params& params, std::string& outError);

  // device may be null unless NeedsDevice(params).
  static bool Run(const RgbList& input,
                  const Params& params,
                  const DeviceTransform* device,
                  Output& out,
                  std::string& outError);

  static const char* ModeName(Mode mode);
  static bool ParseMode(const std::string& text, Mode& outMode);
  static const char* GamutOrderName(GamutOrder order);
  static bool ParseGamutOrder(const std::string& text, GamutOrder& outOrder);

private:
  static RgbList RunPerceptual(const RgbList& colors, const Params& params, const DeviceTransform* device, Summary& summary);
};
