#include "SievePipeline.h"

#include "ColorSetOps.h"

#include <boost/log/trivial.hpp>
#include <opencv2/core.hpp>

#include <iomanip>
#include <stdexcept>
#include <utility>

namespace {
void RecordStage(SievePipeline::Summary& summary, const std::string& stage, size_t count) {
  SievePipeline::StageCount s;
  s.stage = stage;
  s.count = count;
  summary.stages.push_back(s);
  BOOST_LOG_TRIVIAL(info) << "[" << stage << "] " << count << " colors";
}
} // namespace

bool SievePipeline::NeedsDevice(const Params& params) {
  switch (params.mode) {
  case Mode::PrintUnique:
  case Mode::Gamut: return true;
  case Mode::Perceptual: return params.gamutOrder != GamutOrder::None;
  case Mode::Partition: return false;
  }
  return false;
}

bool SievePipeline::Validate(const Params& params, std::string& outError) {
  outError.clear();
  if (params.coarseStep < 0 || params.coarseStep > 255) {
    outError = "Coarse grid step must be within [0, 255].";
    return false;
  }
  if (params.mode == Mode::Perceptual && !params.dedup.Validate(outError)) return false;
  if (NeedsDevice(params) && !GamutFilter::ValidateParams(params.gamut, outError)) return false;
  if (params.mode == Mode::Partition && params.families.empty()) {
    outError = "Partition mode needs at least one hue family.";
    return false;
  }
  return true;
}

RgbList SievePipeline::RunPerceptual(const RgbList& colors, const Params& params, const DeviceTransform* device, Summary& summary) {
  RgbList work = colors;

  if (params.gamutOrder == GamutOrder::Before) {
    work = GamutFilter::KeepInGamut(*device, work, params.gamut);
    RecordStage(summary, "gamut", work.size());
  }

  const PerceptualDeduplicator dedup(params.dedup);
  DedupResult result = dedup.Run(work);
  summary.dedup = result.stats;
  work.swap(result.colors);
  RecordStage(summary, "perceptual", work.size());

  if (params.gamutOrder == GamutOrder::After) {
    work = GamutFilter::KeepInGamut(*device, work, params.gamut);
    RecordStage(summary, "gamut", work.size());
  }
  return work;
}

bool SievePipeline::Run(const RgbList& input,
                        const Params& params,
                        const DeviceTransform* device,
                        Output& out,
                        std::string& outError) {
  outError.clear();
  out = Output();

  if (!Validate(params, outError)) return false;
  if (NeedsDevice(params) && !device) {
    outError = std::string("Mode '") + ModeName(params.mode) + "' needs a device profile.";
    return false;
  }

  Output result;
  result.summary.input = input.size();
  BOOST_LOG_TRIVIAL(info) << "Pipeline '" << ModeName(params.mode) << "' on " << input.size() << " colors"
                          << (params.mode == Mode::Perceptual ? std::string(", gamut ") + GamutOrderName(params.gamutOrder)
                                                              : std::string());

  try {
    RgbList work;
    if (params.mode == Mode::Partition) {
      const int step = params.coarseStep > 0 ? params.coarseStep : kPartitionStep;
      work = ColorSetOps::ReduceToGrid(input, step);
      RecordStage(result.summary, "grid", work.size());
    } else if (params.coarseStep > 0) {
      work = ColorSetOps::ReduceToGrid(input, params.coarseStep);
      RecordStage(result.summary, "grid", work.size());
    } else {
      work = input;
    }

    switch (params.mode) {
    case Mode::Perceptual:
      work = RunPerceptual(work, params, device, result.summary);
      break;
    case Mode::PrintUnique:
      work = GamutFilter::UniqueByPrintedValue(*device, work, params.gamut, &result.summary.printUnique);
      RecordStage(result.summary, "print-unique", work.size());
      break;
    case Mode::Gamut:
      work = GamutFilter::KeepInGamut(*device, work, params.gamut);
      RecordStage(result.summary, "gamut", work.size());
      break;
    case Mode::Partition:
      result.partition = HueFamilyClassifier::Partition(work, params.families);
      RecordStage(result.summary, "partition", work.size() - result.partition.unassigned);
      break;
    }

    if (params.mode == Mode::Partition) {
      result.summary.output = work.size() - result.partition.unassigned;
    } else {
      result.summary.output = work.size();
      result.colors.swap(work);
    }
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  } catch (const std::exception& e) {
    outError = std::string("Pipeline error: ") + e.what();
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Pipeline done: " << result.summary.input << " -> " << result.summary.output << " ("
                          << std::fixed << std::setprecision(1) << result.summary.ReductionPercent() << "% removed)";
  out = std::move(result);
  return true;
}

const char* SievePipeline::ModeName(Mode mode) {
  switch (mode) {
  case Mode::Perceptual: return "perceptual";
  case Mode::PrintUnique: return "print-unique";
  case Mode::Gamut: return "gamut";
  case Mode::Partition: return "partition";
  }
  return "unknown";
}

bool SievePipeline::ParseMode(const std::string& text, Mode& outMode) {
  for (Mode m : {Mode::Perceptual, Mode::PrintUnique, Mode::Gamut, Mode::Partition}) {
    if (text == ModeName(m)) {
      outMode = m;
      return true;
    }
  }
  return false;
}

const char* SievePipeline::GamutOrderName(GamutOrder order) {
  switch (order) {
  case GamutOrder::None: return "none";
  case GamutOrder::Before: return "before";
  case GamutOrder::After: return "after";
  }
  return "unknown";
}

bool SievePipeline::ParseGamutOrder(const std::string& text, GamutOrder& outOrder) {
  for (GamutOrder o : {GamutOrder::None, GamutOrder::Before, GamutOrder::After}) {
    if (text == GamutOrderName(o)) {
      outOrder = o;
      return true;
    }
  }
  return false;
}
