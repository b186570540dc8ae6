/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski
///
/// Parcel and block generation: configuration, progress reporting, and the
/// two pipeline variants that chain the geometric stages.

#pragma once
#include "CadLayer.hpp"
#include "AreaFilter.hpp"
#include "Tessellate.hpp"
#include "enum_help.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cadastre {

enum class Mode { Parcels = 1, Blocks };

const char* Name(Mode x) noexcept;

template<>
struct EnumValues<Mode> : EnumList<Mode, Mode::Parcels, Mode::Blocks> { };

/// Everything one run needs.  Checked once by Validate, never modified.
struct Request {
  std::string roads;                  // line layer name
  std::optional<std::string> points;  // point layer name; unused for blocks
  geom::Distance buffer = geom::FromMetres(10.0);
  AreaWindow area;
  Crs crs = Crs::Auto();
  Mode mode = Mode::Parcels;
  double extentBufferPct = Tune::DefaultExtentBufferPct;
  bool filterBlocks = true;           // blocks mode applies `area` too
}; // Request

/// Throws ConfigError describing the first invalid parameter.
void Validate(const Request& request);

struct Inputs {
  const RawLayer* roads  = nullptr;
  const RawLayer* points = nullptr; // null in blocks mode without points
}; // Inputs

/// Looks up the input layers and checks their geometry types.
/// Throws MissingInputError listing the layers in `store`.
Inputs ResolveInputs(const LayerStore& store, std::string_view roadName,
                     std::optional<std::string_view> pointName, Mode mode);

struct Progress {
  int step  = 0;
  int total = 0;
  std::string message;
  std::size_t featureCount = 0;
}; // Progress

/// Receives progress synchronously between stages; `cancelled` is polled
/// after every step.
class ProgressObserver {
public:
  virtual ~ProgressObserver() = default;
  virtual void step(const Progress&) { }
  virtual void warn(const std::string&) { }
  virtual bool cancelled() const { return false; }
}; // ProgressObserver

class NullObserver : public ProgressObserver { };

struct Stats {
  std::size_t pointCount    = 0;
  std::size_t cellCount     = 0;
  std::size_t undercount    = 0;
  std::size_t blockCount    = 0;
  std::size_t afterSubtract = 0;
  std::size_t afterClamp    = 0;
  std::size_t finalCount    = 0;
}; // Stats

struct Result {
  Layer layer;
  Stats stats;
  std::vector<std::string> warnings;
}; // Result

/// Resolve, reproject, road reserve, tessellate, subtract, blocks, clamp,
/// area filter.
class ParcelPipeline {
public:
  static constexpr int Steps = 9;
  explicit ParcelPipeline(const Request& request) : _request{request} { }
  Result run(const LayerStore& store, ProgressObserver& observer) const;
private:
  const Request& _request;
}; // ParcelPipeline

/// Resolve, blocks, optional area filter.
class BlockPipeline {
public:
  static constexpr int Steps = 4;
  explicit BlockPipeline(const Request& request) : _request{request} { }
  Result run(const LayerStore& store, ProgressObserver& observer) const;
private:
  const Request& _request;
}; // BlockPipeline

using Pipeline = std::variant<ParcelPipeline, BlockPipeline>;

/// The pipeline for `request.mode`; `request` must outlive it.
Pipeline MakePipeline(const Request& request);

/// Validates `request` and runs its pipeline.  Stage exceptions propagate
/// unchanged; a cancellation request raises Cancelled.
Result Generate(const LayerStore& store, const Request& request,
                ProgressObserver& observer);

enum class Outcome { Succeeded = 1, Failed, Cancelled };

const char* Name(Outcome x) noexcept;

/// ExitSuccess, ExitFailure or ExitCancelled.
int ExitStatus(Outcome x) noexcept;

struct RunOutcome {
  Outcome outcome = Outcome::Failed;
  std::string message;
  std::optional<Result> result; // set only on success
}; // RunOutcome

/// Generate, with every failure mapped to an outcome and a message.
RunOutcome Run(const LayerStore& store, const Request& request,
               ProgressObserver& observer);

} // cadastre
