#include "PerceptualDeduplicator.h"

#include "ColorSpaceConverter.h"
#include "DeltaE2000.h"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <stdexcept>

KeepSet::KeepSet(size_t count) : keep_(count, 1), processed_(count, 0), kept_(count) {}

void KeepSet::Drop(size_t index) {
  if (keep_[index] == 0) return;
  keep_[index] = 0;
  --kept_;
}

PerceptualDeduplicator::PerceptualDeduplicator(const DedupConfig& config) : config_(config) {
  std::string err;
  if (!config_.Validate(err)) {
    throw std::invalid_argument("Invalid dedup configuration: " + err);
  }
}

std::vector<uint32_t> PerceptualDeduplicator::ProcessingOrder(const LabList& labs) {
  std::vector<uint32_t> order(labs.size());
  std::iota(order.begin(), order.end(), 0u);
  std::stable_sort(order.begin(), order.end(), [&labs](uint32_t lhs, uint32_t rhs) {
    return labs[lhs][0] > labs[rhs][0];
  });
  return order;
}

PerceptualDeduplicator::Plan PerceptualDeduplicator::Prepare(const LabList& labs) const {
  Plan plan(config_.CellSize());
  plan.labs = labs;

  plan.regions.resize(labs.size());
  for (size_t i = 0; i < labs.size(); ++i) {
    plan.regions[i] = RegionClassifier::Classify(labs[i]);
  }

  plan.grid.Build(plan.labs);
  plan.order = ProcessingOrder(plan.labs);
  return plan;
}

size_t PerceptualDeduplicator::Step(const Plan& plan, KeepSet& keep, uint32_t index) const {
  if (!keep.IsOpen(index)) return 0;

  const LabColor& lab = plan.labs[index];
  const double threshold = config_.thresholds.For(plan.regions[index]);

  // Coarse phase: everything in the 5x5x5 neighborhood, then drop stale grid entries.
  std::vector<uint32_t> candidates;
  plan.grid.Gather(plan.grid.CellOf(lab), candidates);
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [&](uint32_t j) { return j == index || !keep.IsKept(j); }),
                   candidates.end());

  size_t dropped = 0;
  if (!candidates.empty()) {
    // Exact phase. Distances are computed against a frozen KeepSet; drops are applied serially
    // afterwards, so the parallel path yields the same survivors as the serial one.
    std::vector<double> distances;
    const bool parallel = config_.parallelDistances && candidates.size() >= config_.parallelMinCandidates;
    DeltaE2000::DistanceToMany(lab, plan.labs, candidates, distances, parallel);

    for (size_t k = 0; k < candidates.size(); ++k) {
      if (distances[k] < threshold && keep.IsKept(candidates[k])) {
        keep.Drop(candidates[k]);
        ++dropped;
      }
    }
  }

  keep.MarkProcessed(index);
  BOOST_LOG_TRIVIAL(trace) << "dedup: color " << index << " (" << RegionClassifier::Name(plan.regions[index])
                           << ", threshold " << threshold << ") checked " << candidates.size()
                           << " candidates, dropped " << dropped;
  return dropped;
}

DedupResult PerceptualDeduplicator::Run(const RgbList& colors) const {
  return Run(colors, ColorSpaceConverter::RgbToLab(colors));
}

DedupResult PerceptualDeduplicator::Run(const RgbList& colors, const LabList& labs) const {
  if (labs.size() != colors.size()) {
    throw std::invalid_argument("PerceptualDeduplicator::Run: color and Lab lists differ in size.");
  }

  DedupResult result;
  result.stats.input = colors.size();
  if (colors.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Perceptual filter: empty input, nothing to do.";
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Perceptual filter: " << colors.size() << " colors.";
  const Plan plan = Prepare(labs);

  for (PerceptualRegion region : plan.regions) {
    ++result.stats.regionCounts[static_cast<size_t>(region)];
  }
  BOOST_LOG_TRIVIAL(info) << "Region distribution:";
  for (int r = 0; r < kPerceptualRegionCount; ++r) {
    const PerceptualRegion region = static_cast<PerceptualRegion>(r);
    BOOST_LOG_TRIVIAL(info) << "  " << std::left << std::setw(15) << RegionClassifier::Name(region)
                            << std::right << std::setw(10) << result.stats.regionCounts[r]
                            << " colors (dE2000 threshold " << config_.thresholds.For(region) << ")";
  }
  result.stats.occupiedCells = plan.grid.OccupiedCells();
  BOOST_LOG_TRIVIAL(info) << "Lab grid: cell " << plan.grid.CellSize() << ", "
                          << plan.grid.OccupiedCells() << " occupied cells.";

  KeepSet keep(colors.size());
  size_t processed = 0;
  size_t removed = 0;
  for (uint32_t index : plan.order) {
    if (!keep.IsKept(index)) continue;
    removed += Step(plan, keep, index);
    ++processed;
    if (config_.progressInterval != 0 && processed % config_.progressInterval == 0) {
      BOOST_LOG_TRIVIAL(debug) << "  processed " << processed << "/" << colors.size()
                               << " | kept " << keep.KeptCount() << " | removed " << removed;
    }
  }

  result.keep = keep.Mask();
  result.colors.reserve(keep.KeptCount());
  result.labs.reserve(keep.KeptCount());
  for (size_t i = 0; i < colors.size(); ++i) {
    if (keep.IsKept(i)) {
      result.colors.push_back(colors[i]);
      result.labs.push_back(labs[i]);
    } else {
      ++result.stats.regionRemoved[static_cast<size_t>(plan.regions[i])];
    }
  }
  result.stats.kept = result.colors.size();
  result.stats.removed = removed;

  BOOST_LOG_TRIVIAL(info) << "Perceptual filter: kept " << result.stats.kept << ", removed "
                          << result.stats.removed << " near-duplicates.";
  return result;
}
