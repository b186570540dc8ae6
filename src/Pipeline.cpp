/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "Pipeline.hpp"
#include "Blocks.hpp"
#include "Overlay.hpp"
#include "Project.hpp"
#include "RoadReserve.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/area.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <limits>
#include <utility>

namespace cadastre {

const char* Name(Mode x) noexcept {
  switch (x) {
    case Mode::Parcels: return "parcels";
    case Mode::Blocks:  return "blocks";
    default: return nullptr;
  }
} // Name(Mode)

const char* Name(Outcome x) noexcept {
  switch (x) {
    case Outcome::Succeeded: return "succeeded";
    case Outcome::Failed:    return "failed";
    case Outcome::Cancelled: return "cancelled";
    default: return nullptr;
  }
} // Name(Outcome)

int ExitStatus(Outcome x) noexcept {
  switch (x) {
    case Outcome::Succeeded: return ExitSuccess;
    case Outcome::Cancelled: return ExitCancelled;
    default: return ExitFailure;
  }
} // ExitStatus(Outcome)

void Validate(const Request& request) {
  if (request.roads.empty())
    throw ConfigError{"no road layer named"};
  if (const auto d = geom::Metres(request.buffer); !(d > 0.0 && std::isfinite(d)))
    throw ConfigError{std::format("buffer distance must be positive and finite, "
                                  "got {} m", d)};
  request.area.validate();
  if (!(request.extentBufferPct >= Tune::MinExtentBufferPct
        && request.extentBufferPct <= Tune::MaxExtentBufferPct))
  {
    throw ConfigError{std::format(
        "extent buffer must be within [{}, {}] percent, got {}",
        Tune::MinExtentBufferPct, Tune::MaxExtentBufferPct,
        request.extentBufferPct)};
  }
  if (request.crs.isResolved()
      && (request.crs.isGeographic() || !request.crs.isMetric()))
  {
    throw ConfigError{std::format("target CRS {} is not a metric projection",
                                  request.crs.id())};
  }
  if (!Name(request.mode))
    throw ConfigError{"invalid mode"};
} // Validate

Inputs ResolveInputs(const LayerStore& store, std::string_view roadName,
                     std::optional<std::string_view> pointName, Mode mode)
{
  auto find = [&](std::string_view name, GeometryType type, const char* role) {
    const auto* layer = store.find(name);
    if (!layer)
      throw MissingInputError{std::format("{} layer '{}' not found", role, name),
                              store.names()};
    if (layer->type() != type)
      throw MissingInputError{std::format("{} layer '{}' has {} geometry, "
                                          "expected {}", role, name,
                                          Name(layer->type()), Name(type)),
                              store.names()};
    return layer;
  };
  auto inputs = Inputs{};
  inputs.roads = find(roadName, GeometryType::Line, "road");
  if (pointName)
    inputs.points = find(*pointName, GeometryType::Point, "point");
  else if (mode == Mode::Parcels)
    throw MissingInputError{"parcel mode needs a point layer", store.names()};
  return inputs;
} // ResolveInputs

namespace {

std::optional<std::string_view> PointName(const Request& request) {
  if (!request.points)
    return std::nullopt;
  return std::string_view{*request.points};
} // PointName

// Reports each stage to the log and the observer.  Between stages a pending
// cancellation is honoured; after the last one the result stands.
class Stages {
public:
  Stages(ProgressObserver& observer, Result& result, int total)
    : _observer{observer}, _result{result}, _total{total} { }

  void done(int step, std::string message, std::size_t featureCount) {
    report(step, std::move(message), featureCount);
    if (step < _total && _observer.cancelled()) {
      log::Logger().warn("cancelled after step {} of {}", step, _total);
      throw Cancelled{step};
    }
  } // done

  void report(int step, std::string message, std::size_t featureCount) {
    log::Logger().info("[{}/{}] {}", step, _total, message);
    _observer.step(Progress{step, _total, std::move(message), featureCount});
  } // report

  void warn(std::string message) {
    log::Logger().warn("{}", message);
    _observer.warn(message);
    _result.warnings.push_back(std::move(message));
  } // warn

private:
  ProgressObserver& _observer;
  Result& _result;
  int _total;
}; // Stages

std::string AreaText(const AreaWindow& area) {
  if (area.bounded())
    return std::format("{}-{} m²", geom::SquareMetres(area.min),
                       geom::SquareMetres(area.max));
  return std::format(">= {} m²", geom::SquareMetres(area.min));
} // AreaText

void LogAreaRange(const Layer& candidates, const AreaWindow& window) {
  if (candidates.empty())
    return;
  auto lo = std::numeric_limits<double>::max();
  auto hi = 0.0;
  auto inRange = 0;
  for (const auto& f: candidates) {
    const auto a = ggl::area(std::get<xy::MultiPolygon>(f.geometry));
    lo = std::min(lo, a);
    hi = std::max(hi, a);
    if (window.contains(geom::FromSquareMetres(a)))
      ++inRange;
  }
  log::Logger().info("area range: {:.1f} - {:.1f} m², {} within {}",
                     lo, hi, inRange, AreaText(window));
} // LogAreaRange

} // local

Result ParcelPipeline::run(const LayerStore& store,
                           ProgressObserver& observer) const
{
  const auto& rq = _request;
  auto result = Result{};
  auto stages = Stages{observer, result, Steps};

  const auto inputs = ResolveInputs(store, rq.roads, PointName(rq), rq.mode);
  const auto target = ResolveAuto(rq.crs, *inputs.roads, inputs.points);
  stages.done(1, "parcel mode: creating individual parcels",
              inputs.roads->size() + inputs.points->size());

  const auto roads  = Project(*inputs.roads,  target);
  const auto points = Project(*inputs.points, target);
  stages.done(2, std::format("reprojected layers to {}", target.id()),
              roads.size() + points.size());

  const auto reserve = BuildRoadReserve(roads, rq.buffer);
  if (reserve.empty())
    stages.warn("no roads: the building extent becomes a single block");
  stages.done(3, std::format("buffered roads by {} m", geom::Metres(rq.buffer)),
              reserve.size());

  const auto tess = Tessellate(points, rq.extentBufferPct);
  result.stats.pointCount = tess.pointCount;
  result.stats.cellCount  = tess.cellCount;
  result.stats.undercount = tess.undercount();
  log::Logger().info("points: {}, Voronoi polygons: {}",
                     tess.pointCount, tess.cellCount);
  if (tess.undercount()) {
    stages.warn(std::format("{} points did not get Voronoi polygons; "
                            "they coincide with other points",
                            tess.undercount()));
  }
  stages.done(4, "created Voronoi polygons from points", tess.cellCount);

  const auto candidates = SubtractRoads(tess.cells, reserve);
  result.stats.afterSubtract = candidates.size();
  LogAreaRange(candidates, rq.area);
  stages.done(5, "subtracted road reserves from parcels", candidates.size());

  const auto blocks = ExtractBlocksFromReserve(reserve, rq.buffer,
                                               Envelope(points));
  result.stats.blockCount = blocks.size();
  stages.done(6, std::format("created {} blocks from the road network",
                             blocks.size()), blocks.size());

  const auto clamped = ClampToBlocks(candidates, blocks);
  result.stats.afterClamp = clamped.size();
  if (clamped.empty() && !candidates.empty())
    stages.warn("no parcel candidate lies inside a block");
  stages.done(7, "intersected parcels with blocks", clamped.size());

  auto parcels = FilterByArea(clamped, rq.area);
  stages.done(8, std::format("filtered by area ({})", AreaText(rq.area)),
              parcels.size());

  parcels.rename("parcels");
  result.stats.finalCount = parcels.size();
  result.layer = std::move(parcels);
  stages.done(9, std::format("parcels created: {} features",
                             result.layer.size()), result.layer.size());
  return result;
} // ParcelPipeline::run

Result BlockPipeline::run(const LayerStore& store,
                          ProgressObserver& observer) const
{
  const auto& rq = _request;
  auto result = Result{};
  auto stages = Stages{observer, result, Steps};

  const auto inputs = ResolveInputs(store, rq.roads, PointName(rq), rq.mode);
  const auto target = ResolveAuto(rq.crs, *inputs.roads, inputs.points);
  stages.done(1, "blocks mode: creating road-enclosed blocks only",
              inputs.roads->size());

  auto hint = std::optional<xy::Box>{};
  if (inputs.points)
    hint = Envelope(Project(*inputs.points, target));
  auto blocks = ExtractBlocks(*inputs.roads, rq.buffer, target, hint);
  result.stats.blockCount = blocks.size();
  stages.done(2, std::format("buffered roads by {} m and created blocks",
                             geom::Metres(rq.buffer)), blocks.size());

  if (rq.filterBlocks) {
    blocks = FilterByArea(blocks, rq.area);
    stages.done(3, std::format("filtered by area ({})", AreaText(rq.area)),
                blocks.size());
  } else {
    stages.done(3, "area filter disabled for blocks", blocks.size());
  }

  result.stats.finalCount = blocks.size();
  result.layer = std::move(blocks);
  stages.done(4, std::format("blocks created: {} features",
                             result.layer.size()), result.layer.size());
  return result;
} // BlockPipeline::run

Pipeline MakePipeline(const Request& request) {
  if (request.mode == Mode::Blocks)
    return BlockPipeline{request};
  return ParcelPipeline{request};
} // MakePipeline

Result Generate(const LayerStore& store, const Request& request,
                ProgressObserver& observer)
{
  Validate(request);
  const auto pipeline = MakePipeline(request);
  return std::visit([&](const auto& p) { return p.run(store, observer); },
                    pipeline);
} // Generate

RunOutcome Run(const LayerStore& store, const Request& request,
               ProgressObserver& observer)
{
  auto out = RunOutcome{};
  try {
    out.result = Generate(store, request, observer);
    out.outcome = Outcome::Succeeded;
    out.message = std::format("{} created: {} features",
                              Name(request.mode), out.result->layer.size());
  } catch (const Cancelled& x) {
    out.outcome = Outcome::Cancelled;
    out.message = std::format("{} (after step {})", x.what(), x.step());
  } catch (const std::exception& x) {
    out.outcome = Outcome::Failed;
    out.message = x.what();
    log::Logger().error("processing failed: {}", x.what());
  }
  return out;
} // Run

} // cadastre
