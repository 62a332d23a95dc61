#pragma once

#include <cstddef>
#include <string>

#include "config/config.pb.h"
#include "internal/core/project_state_machine.hpp"
#include "internal/geometry/sidecar_geometry_extractor.hpp"
#include "internal/modeling/model_builder.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/scaling/coordinate_scaler.hpp"
#include "internal/storage/artifact_store.hpp"

namespace plancast::config {

/*
  Translators from RuntimeConfig to per-component options.

  Unset (zero / empty) config fields keep the option struct's default.
*/

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

std::string ToBindAddress(const plancast::runtime::config::RuntimeConfig& config);

storage::ArtifactStoreOptions ToArtifactStoreOptions(const plancast::runtime::config::StorageConfig& config);

geometry::SidecarOptions ToSidecarOptions(const plancast::runtime::config::GeometryConfig& config);

scaling::ScalerOptions ToScalerOptions(const plancast::runtime::config::PipelineConfig& config);

modeling::ModelBuilderOptions ToModelBuilderOptions(const plancast::runtime::config::PipelineConfig& config);

// Throws std::invalid_argument for an export format no writer handles.
core::PipelineOptions ToPipelineOptions(const plancast::runtime::config::RuntimeConfig& config, const modeling::MeshWriterRegistry& writers);

quota::QuotaPolicy ToQuotaPolicy(const plancast::runtime::config::QuotaConfig& config);

std::size_t ToWorkerCount(const plancast::runtime::config::WorkerConfig& config);

} // namespace plancast::config
