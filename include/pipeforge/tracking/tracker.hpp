#pragma once

#include "pipeforge/run_log/run_log.hpp"
#include "pipeforge/util/enum.hpp"
#include "pipeforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pipeforge {

enum class TrackerType : std::uint8_t { None, Log };
BOOST_DESCRIBE_ENUM(TrackerType, None, Log)
PIPEFORGE_DEFINE_ENUM_SERDE(TrackerType, TrackerType::None)

// Experiment tracking hook fed with the events tasks emit.
class ITracker {
public:
  virtual ~ITracker() = default;

  virtual auto log_metric(std::string_view key, const JsonValue &value,
                          int step) -> void = 0;
  virtual auto log_parameter(std::string_view key, const JsonValue &value)
      -> void = 0;
};

class LogTracker final : public ITracker {
public:
  auto log_metric(std::string_view key, const JsonValue &value, int step)
      -> void override;
  auto log_parameter(std::string_view key, const JsonValue &value)
      -> void override;
};

// nullptr for TrackerType::None.
[[nodiscard]] auto create_tracker(TrackerType type)
    -> std::unique_ptr<ITracker>;

inline constexpr std::string_view kTrackLinePrefix = "pipeforge::track ";
inline constexpr std::string_view kParamLinePrefix = "pipeforge::param ";
inline constexpr std::string_view kEnvMetricPrefix = "PIPEFORGE_TRACK_";

struct TrackEvent {
  std::string key;
  JsonValue value;
  int step{0};
};

struct NodeEvents {
  std::vector<TrackEvent> metrics;
  ParameterMap parameters;
  // Protocol lines that could not be decoded.
  std::vector<std::string> malformed;
};

// Scans task stdout for `pipeforge::track {...}` and `pipeforge::param {...}`
// lines. Later parameter lines override earlier ones.
[[nodiscard]] auto parse_node_events(std::string_view output) -> NodeEvents;

// Metrics carried by `PIPEFORGE_TRACK_<NAME>` entries of an environment
// snapshot. Keys are lowercased; values are decoded as JSON when they parse,
// else kept as strings.
[[nodiscard]] auto
capture_env_metrics(const std::map<std::string, std::string> &environment)
    -> std::vector<MetricEntry>;

} // namespace pipeforge
