#include <clipsight/vision/frame_sampler.hpp>
#include <algorithm>
#include <array>

namespace clipsight::vision {

namespace {

constexpr std::int64_t kStartZoneEndPct = 15;
constexpr std::int64_t kMiddleZoneBeginPct = 25;
constexpr std::int64_t kMiddleZoneEndPct = 75;
constexpr std::int64_t kEndZoneBeginPct = 85;

std::int64_t pct_floor(std::int64_t total, std::int64_t pct) { return total * pct / 100; }
std::int64_t pct_ceil(std::int64_t total, std::int64_t pct) { return (total * pct + 99) / 100; }

/// k indices evenly spaced inside \p range, each centred in its sub-interval. k <= size.
void spread(const FrameRange& range, std::int64_t k, std::vector<std::int64_t>& out) {
  const std::int64_t size = range.size();
  for (std::int64_t i = 0; i < k; ++i) {
    out.push_back(range.begin + ((2 * i + 1) * size) / (2 * k));
  }
}

/// Samples wanted per zone before capacity limits: {start, middle, end}.
std::array<std::int64_t, 3> zone_shares(std::int64_t n) {
  if (n <= 0) return {0, 0, 0};
  if (n == 1) return {0, 1, 0};
  if (n == 2) return {1, 0, 1};
  const std::int64_t s = std::max<std::int64_t>(1, n * 3 / 10);
  const std::int64_t m = std::max<std::int64_t>(1, n * 4 / 10);
  return {s, m, n - s - m};
}

}  // namespace

TimelineZones timeline_zones(std::int64_t total_frames) {
  TimelineZones z;
  if (total_frames <= 0) return z;
  if (total_frames == 1) {
    z.start = {0, 1};
    z.middle = {1, 1};
    z.end = {1, 1};
    return z;
  }

  const std::int64_t start_end =
      std::max<std::int64_t>(1, pct_ceil(total_frames, kStartZoneEndPct));
  const std::int64_t end_begin = std::max(
      start_end, std::min(total_frames - 1, pct_floor(total_frames, kEndZoneBeginPct)));
  const std::int64_t mid_begin =
      std::max(start_end, pct_floor(total_frames, kMiddleZoneBeginPct));
  const std::int64_t mid_end =
      std::max(mid_begin, std::min(end_begin, pct_ceil(total_frames, kMiddleZoneEndPct)));

  z.start = {0, start_end};
  z.middle = {mid_begin, mid_end};
  z.end = {end_begin, total_frames};
  return z;
}

std::vector<std::int64_t> plan_sample_positions(std::int64_t total_frames,
                                                std::size_t sample_count) {
  std::vector<std::int64_t> positions;
  if (total_frames <= 0 || sample_count == 0) return positions;

  const auto n = static_cast<std::int64_t>(sample_count);
  if (total_frames <= n) {
    positions.resize(static_cast<std::size_t>(total_frames));
    for (std::int64_t i = 0; i < total_frames; ++i) positions[static_cast<std::size_t>(i)] = i;
    return positions;
  }

  const TimelineZones z = timeline_zones(total_frames);
  const std::array<const FrameRange*, 3> zones = {&z.start, &z.middle, &z.end};
  std::array<std::int64_t, 3> take = zone_shares(n);

  // Clamp to zone capacity, then hand the overflow to zones with room: middle, start, end.
  std::int64_t overflow = 0;
  for (std::size_t i = 0; i < 3; ++i) {
    const std::int64_t cap = zones[i]->size();
    if (take[i] > cap) {
      overflow += take[i] - cap;
      take[i] = cap;
    }
  }
  for (std::size_t i : {std::size_t{1}, std::size_t{0}, std::size_t{2}}) {
    const std::int64_t room = zones[i]->size() - take[i];
    const std::int64_t moved = std::min(room, overflow);
    take[i] += moved;
    overflow -= moved;
  }

  positions.reserve(sample_count);
  for (std::size_t i = 0; i < 3; ++i) {
    spread(*zones[i], take[i], positions);
  }

  // Zones alone too small for n: fill evenly from the gaps between them.
  if (overflow > 0) {
    std::vector<std::int64_t> gaps;
    for (std::int64_t i = z.start.end; i < z.middle.begin; ++i) gaps.push_back(i);
    for (std::int64_t i = std::max(z.middle.end, z.start.end); i < z.end.begin; ++i) {
      gaps.push_back(i);
    }
    const auto g = static_cast<std::int64_t>(gaps.size());
    for (std::int64_t i = 0; i < overflow && i < g; ++i) {
      positions.push_back(gaps[static_cast<std::size_t>(((2 * i + 1) * g) / (2 * overflow))]);
    }
  }

  std::sort(positions.begin(), positions.end());
  positions.erase(std::unique(positions.begin(), positions.end()), positions.end());
  return positions;
}

FrameSampler::FrameSampler(std::unique_ptr<IVideoSource> source,
                           std::vector<std::int64_t> positions,
                           std::chrono::steady_clock::time_point deadline,
                           std::stop_token stop)
    : source_(std::move(source)),
      positions_(std::move(positions)),
      fps_(source_->fps()),
      deadline_(deadline),
      stop_(std::move(stop)) {}

std::expected<FrameSampler, core::PipelineError> FrameSampler::create(
    std::unique_ptr<IVideoSource> source, SamplerOptions options, std::stop_token stop) {
  if (!source) {
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }
  if (options.sample_count == 0) {
    return std::unexpected(core::PipelineError::InvalidConfig);
  }
  const std::int64_t total = source->frame_count();
  if (total <= 0) {
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }
  auto positions = plan_sample_positions(total, options.sample_count);
  const auto deadline = std::chrono::steady_clock::now() + options.decode_timeout;
  return FrameSampler(std::move(source), std::move(positions), deadline, std::move(stop));
}

std::expected<std::optional<core::RawFrame>, core::PipelineError> FrameSampler::next() {
  if (finished_) {
    return std::nullopt;
  }

  while (cursor_ < positions_.size()) {
    if (stop_.stop_requested()) {
      finished_ = true;
      release();
      return std::unexpected(core::PipelineError::Cancelled);
    }
    if (std::chrono::steady_clock::now() > deadline_) {
      finished_ = true;
      release();
      return std::unexpected(core::PipelineError::UnreadableVideo);
    }

    const std::int64_t index = positions_[cursor_++];
    auto image = source_->read(index);
    if (!image) {
      if (image.error() == core::PipelineError::InvalidFrame) {
        ++skipped_;
        continue;
      }
      finished_ = true;
      release();
      return std::unexpected(image.error());
    }

    ++decoded_;
    core::RawFrame frame;
    frame.index = index;
    frame.timestamp_ms = fps_ > 0.0 ? 1000.0 * static_cast<double>(index) / fps_ : 0.0;
    frame.image = std::move(*image);
    return frame;
  }

  finished_ = true;
  release();
  if (decoded_ == 0) {
    return std::unexpected(core::PipelineError::UnreadableVideo);
  }
  return std::nullopt;
}

}  // namespace clipsight::vision
