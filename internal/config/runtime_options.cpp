#include "runtime_options.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace plancast::config {

using namespace plancast::runtime::config;

namespace {

void Apply(const plancast::runtime::config::TierLimits& from, quota::TierLimits* to) {
  if (from.has_max_projects_per_period()) to->max_projects_per_period = from.max_projects_per_period();
  if (from.has_max_file_size_mb()) to->max_file_size_mb = from.max_file_size_mb();
  if (from.has_max_upload_mb_per_period()) to->max_upload_mb_per_period = from.max_upload_mb_per_period();
}

} // namespace

std::string ToBindAddress(const RuntimeConfig& config) {
  return config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
}

storage::ArtifactStoreOptions ToArtifactStoreOptions(const StorageConfig& config) {
  storage::ArtifactStoreOptions options;
  if (!config.artifact_root().empty()) options.root = config.artifact_root();
  options.fsync = config.fsync();
  return options;
}

geometry::SidecarOptions ToSidecarOptions(const GeometryConfig& config) {
  geometry::SidecarOptions options;
  if (!config.sidecar_suffix().empty()) options.suffix = config.sidecar_suffix();
  return options;
}

scaling::ScalerOptions ToScalerOptions(const PipelineConfig& config) {
  scaling::ScalerOptions options;
  if (config.scaling().min_pixels_per_unit() > 0.0) options.min_pixels_per_unit = config.scaling().min_pixels_per_unit();
  if (config.scaling().max_pixels_per_unit() > 0.0) options.max_pixels_per_unit = config.scaling().max_pixels_per_unit();
  if (options.min_pixels_per_unit > options.max_pixels_per_unit) {
    throw std::invalid_argument("pipeline.scaling: min_pixels_per_unit exceeds max_pixels_per_unit");
  }
  return options;
}

modeling::ModelBuilderOptions ToModelBuilderOptions(const PipelineConfig& config) {
  modeling::ModelBuilderOptions options;
  if (config.wall_height() > 0.0) options.wall_height = config.wall_height();
  if (config.wall_thickness() > 0.0) options.wall_thickness = config.wall_thickness();
  if (config.min_wall_length() > 0.0) options.min_wall_length = config.min_wall_length();
  return options;
}

core::PipelineOptions ToPipelineOptions(const RuntimeConfig& config, const modeling::MeshWriterRegistry& writers) {
  core::PipelineOptions options;

  if (config.pipeline().export_formats_size() > 0) {
    options.export_formats.clear();
    for (const auto& format : config.pipeline().export_formats()) {
      const auto normalized = modeling::NormalizeFormat(format);
      if (!writers.Find(normalized)) {
        throw std::invalid_argument("pipeline.export_formats: no writer for '" + format + "'");
      }
      if (std::find(options.export_formats.begin(), options.export_formats.end(), normalized) == options.export_formats.end()) {
        options.export_formats.push_back(normalized);
      }
    }
  }

  if (config.uploads().allowed_formats_size() > 0) {
    options.allowed_formats.clear();
    for (const auto& format : config.uploads().allowed_formats()) {
      options.allowed_formats.push_back(modeling::NormalizeFormat(format));
    }
  }
  if (config.uploads().max_upload_mb() > 0.0) options.max_upload_mb = config.uploads().max_upload_mb();

  return options;
}

quota::QuotaPolicy ToQuotaPolicy(const QuotaConfig& config) {
  quota::QuotaPolicy policy;
  if (config.period_days() > 0) policy.period_days = config.period_days();
  if (config.has_free()) Apply(config.free(), &policy.free);
  if (config.has_pro()) Apply(config.pro(), &policy.pro);
  if (config.has_enterprise()) Apply(config.enterprise(), &policy.enterprise);
  return policy;
}

std::size_t ToWorkerCount(const WorkerConfig& config) {
  if (config.threads() > 0) return config.threads();
  return std::max<std::size_t>(1, std::thread::hardware_concurrency() / 2);
}

} // namespace plancast::config
