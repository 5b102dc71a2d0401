#include "pipeforge/tracking/tracker.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <glaze/json.hpp>

#include <utility>

namespace glz {
template <> struct meta<pipeforge::TrackEvent> {
  using T = pipeforge::TrackEvent;
  static constexpr auto value =
      object("key", &T::key, "value", &T::value, "step", &T::step);
};
} // namespace glz

namespace pipeforge {

auto LogTracker::log_metric(std::string_view key, const JsonValue &value,
                            int step) -> void {
  log::info("tracker metric {}={} step={}", key, dump_json(value), step);
}

auto LogTracker::log_parameter(std::string_view key, const JsonValue &value)
    -> void {
  log::info("tracker parameter {}={}", key, dump_json(value));
}

auto create_tracker(TrackerType type) -> std::unique_ptr<ITracker> {
  switch (type) {
  case TrackerType::Log:
    return std::make_unique<LogTracker>();
  case TrackerType::None:
    break;
  }
  return nullptr;
}

auto parse_node_events(std::string_view output) -> NodeEvents {
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  NodeEvents events;

  std::size_t pos = 0;
  while (pos < output.size()) {
    auto end = output.find('\n', pos);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    auto line = output.substr(pos, end - pos);
    pos = end + 1;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (line.starts_with(kTrackLinePrefix)) {
      const auto body = line.substr(kTrackLinePrefix.size());
      TrackEvent event{};
      if (auto ec = glz::read<kOpts>(event, body); ec || event.key.empty()) {
        events.malformed.emplace_back(line);
        continue;
      }
      events.metrics.push_back(std::move(event));
    } else if (line.starts_with(kParamLinePrefix)) {
      const auto body = line.substr(kParamLinePrefix.size());
      ParameterMap params;
      if (auto ec = glz::read<kOpts>(params, body); ec) {
        events.malformed.emplace_back(line);
        continue;
      }
      for (auto &[name, value] : params) {
        events.parameters.insert_or_assign(name, std::move(value));
      }
    }
  }
  return events;
}

auto capture_env_metrics(const std::map<std::string, std::string> &environment)
    -> std::vector<MetricEntry> {
  std::vector<MetricEntry> out;
  for (const auto &[name, raw] : environment) {
    if (!name.starts_with(kEnvMetricPrefix) ||
        name.size() == kEnvMetricPrefix.size()) {
      continue;
    }
    auto key = boost::algorithm::to_lower_copy(
        name.substr(kEnvMetricPrefix.size()));
    auto parsed = parse_json(boost::algorithm::trim_copy(raw));
    JsonValue value{};
    if (parsed) {
      value = std::move(*parsed);
    } else {
      value = JsonValue(raw);
    }
    out.push_back(MetricEntry{.key = std::move(key), .value = std::move(value)});
  }
  return out;
}

} // namespace pipeforge
