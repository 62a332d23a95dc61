#include "project_state_machine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <functional>
#include <stdexcept>

#include "internal/core/db_error.hpp"
#include "internal/core/record_codec.hpp"
#include "internal/geometry/geometry_extractor.hpp"
#include "internal/model/metadata.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/modeling/mesh_writer.hpp"
#include "internal/modeling/model_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/scaling/coordinate_scaler.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"

namespace plancast::core {

using plancast::observability::IntField;
using plancast::observability::StringField;
using namespace plancast::v1;

namespace {

constexpr const char* kStepUpload = "upload";

constexpr const char* kExtraction = "extraction";
constexpr const char* kScaling    = "scaling";
constexpr const char* kBuilding   = "building";
constexpr const char* kExport     = "export";

constexpr const char* kPersistence = "persistence";

// Stage failure that carries diagnostics to persist with the error.
class StageFailed : public std::runtime_error {
 public:
  StageFailed(const std::string& msg, MetadataMap metadata) : std::runtime_error(msg), metadata_(std::move(metadata)) {}

  const MetadataMap& metadata() const {
    return metadata_;
  }

 private:
  MetadataMap metadata_;
};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

int64_t AsInt(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<ScaleReference> ReferenceOf(const Project& project) {
  if (!project.has_scale_reference() || project.scale_reference().kind_case() == ScaleReference::KIND_NOT_SET) {
    return std::nullopt;
  }
  return project.scale_reference();
}

MetadataMap Merge(MetadataMap base, const MetadataMap& extra) {
  for (const auto& [key, value] : extra.entries()) {
    (*base.mutable_entries())[key] = value;
  }
  return base;
}

void LogHalted(uint64_t project_id, const std::string& stage) {
  PLANCAST_LOG_INFO("pipeline run stopped; project is no longer processing", {IntField("project_id", AsInt(project_id)), StringField("stage", stage)});
}

} // namespace

ProjectStateMachine::ProjectStateMachine(std::shared_ptr<db::Repository> repository, std::shared_ptr<quota::QuotaGate> quota,
                                         std::shared_ptr<usage::UsageLedger> ledger, std::shared_ptr<lease::RunLeaseTable> leases,
                                         PipelineStages stages, PipelineOptions options)
    : repository_(std::move(repository)),
      quota_(std::move(quota)),
      ledger_(std::move(ledger)),
      leases_(std::move(leases)),
      stages_(std::move(stages)),
      options_(std::move(options)) {
  if (!stages_.extractor || !stages_.scaler || !stages_.builder) {
    throw std::invalid_argument("project state machine requires extractor, scaler and builder");
  }
  for (auto& format : options_.allowed_formats) format = Lower(format);
}

std::shared_ptr<std::shared_mutex> ProjectStateMachine::ProjectMutex(uint64_t project_id) {
  std::lock_guard<std::mutex> lock(project_mutexes_guard_);
  auto&                       project_mutex = project_mutexes_[project_id];
  if (!project_mutex) {
    project_mutex = std::make_shared<std::shared_mutex>();
  }
  return project_mutex;
}

std::shared_ptr<std::shared_mutex> ProjectStateMachine::FindProjectMutex(uint64_t project_id) {
  std::lock_guard<std::mutex> lock(project_mutexes_guard_);
  auto                        it = project_mutexes_.find(project_id);
  return it == project_mutexes_.end() ? nullptr : it->second;
}

std::size_t ProjectStateMachine::TrackedProjectCount() {
  std::lock_guard<std::mutex> lock(project_mutexes_guard_);
  return project_mutexes_.size();
}

// ------------------------------------------------------------------
// Persistence helpers
// ------------------------------------------------------------------

Project ProjectStateMachine::Load(db::Transaction& tx, uint64_t project_id) {
  auto record = repository_->GetProject(tx, project_id);
  if (!record) throw util::NotFound("project " + std::to_string(project_id) + " not found");
  return ToProto(*record);
}

void ProjectStateMachine::Store(db::Transaction& tx, Project& project) {
  *project.mutable_updated_at() = util::ToProto(util::Now());
  ThrowIfDbError(repository_->UpdateProject(tx, ToRecord(project)), "update project " + std::to_string(project.id()));
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

InputDescriptor ProjectStateMachine::ValidateInput(const InputDescriptor& input) const {
  if (input.filename().empty()) throw util::InvalidInput("filename is required");
  if (input.original_filename().empty()) throw util::InvalidInput("original filename is required");
  if (input.input_path().empty()) throw util::InvalidInput("input path is required");

  if (!std::isfinite(input.file_size_mb()) || input.file_size_mb() <= 0.0) {
    throw util::InvalidInput("file size must be a positive number of MB");
  }

  InputDescriptor normalized = input;
  auto            format     = Lower(input.file_format());
  if (!format.empty() && format.front() == '.') format.erase(format.begin());
  if (std::find(options_.allowed_formats.begin(), options_.allowed_formats.end(), format) == options_.allowed_formats.end()) {
    throw util::InvalidInput("unsupported file format '" + input.file_format() + "'");
  }
  normalized.set_file_format(format);

  if (options_.max_upload_mb > 0.0 && input.file_size_mb() > options_.max_upload_mb) {
    throw util::InvalidInput("file exceeds the upload limit of " + std::to_string(options_.max_upload_mb) + " MB");
  }
  return normalized;
}

Project ProjectStateMachine::Create(uint64_t user_id, const InputDescriptor& input, const std::optional<ScaleReference>& scale_reference) {
  const auto normalized = ValidateInput(input);

  User user;
  {
    auto tx     = repository_->Begin();
    auto record = repository_->GetUser(*tx, user_id);
    tx->Commit();
    if (!record) throw util::NotFound("user " + std::to_string(user_id) + " not found");
    user = ToProto(*record);
  }

  quota_->Enforce(user, normalized.file_size_mb());

  Project project;
  project.set_user_id(user_id);
  *project.mutable_input() = normalized;
  if (scale_reference && scale_reference->kind_case() != ScaleReference::KIND_NOT_SET) {
    *project.mutable_scale_reference() = *scale_reference;
  }
  project.set_status(PROJECT_STATUS_PENDING);
  project.set_current_step(kStepUpload);
  project.set_progress_percent(0);

  const auto now                 = util::ToProto(util::Now());
  *project.mutable_created_at() = now;
  *project.mutable_updated_at() = now;

  auto record = ToRecord(project);
  auto tx     = repository_->Begin();
  ThrowIfDbError(repository_->InsertProject(*tx, record), "create project");
  tx->Commit();

  PLANCAST_LOG_INFO("project created", {IntField("project_id", AsInt(record.id)), IntField("user_id", AsInt(user_id)),
                                        StringField("file_format", normalized.file_format())});
  return ToProto(record);
}

// ------------------------------------------------------------------
// Run
// ------------------------------------------------------------------

RunTicket ProjectStateMachine::StartRun(uint64_t project_id) {
  RunTicket ticket;
  StartRun(project_id, [&](RunTicket&& started) { ticket = std::move(started); });
  return ticket;
}

void ProjectStateMachine::StartRun(uint64_t project_id, const std::function<void(RunTicket&&)>& dispatch) {
  auto lease = leases_->Acquire(project_id);

  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (project.status() != PROJECT_STATUS_PENDING) {
    throw util::IllegalTransition("project " + std::to_string(project_id) + " is " + std::string(model::ToString(project.status())) +
                                  "; only pending projects can run");
  }

  auto owner = repository_->GetUser(*tx, project.user_id());
  if (!owner) throw util::NotFound("user " + std::to_string(project.user_id()) + " not found");

  // Counted against the same snapshot the upload entry is appended to.
  quota_->Enforce(*tx, ToProto(*owner), project.input().file_size_mb());

  const auto started_at = util::Now();
  project.set_status(PROJECT_STATUS_PROCESSING);
  project.set_progress_percent(0);
  *project.mutable_started_at() = util::ToProto(started_at);
  Store(*tx, project);

  UsageEntry upload;
  upload.set_user_id(project.user_id());
  upload.set_project_id(project_id);
  upload.set_action(USAGE_ACTION_UPLOAD);
  upload.set_endpoint("pipeline.run");
  upload.set_file_size_mb(project.input().file_size_mb());
  model::Put(*upload.mutable_request_metadata(), "filename", model::Text(project.input().original_filename()));
  model::Put(*upload.mutable_request_metadata(), "file_format", model::Text(project.input().file_format()));
  ledger_->Append(*tx, upload);

  // A throwing dispatch rolls back the transition and the upload entry.
  dispatch(RunTicket(project_id, std::move(lease), started_at));
  tx->Commit();

  PLANCAST_LOG_INFO("project processing started", {IntField("project_id", AsInt(project_id))});
}

ProjectSnapshot ProjectStateMachine::Run(uint64_t project_id) {
  return Execute(StartRun(project_id));
}

bool ProjectStateMachine::BeginStage(uint64_t project_id, const std::string& stage) {
  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (project.status() != PROJECT_STATUS_PROCESSING) return false;

  project.set_current_step(stage);
  Store(*tx, project);
  tx->Commit();

  PLANCAST_LOG_INFO("pipeline stage started", {IntField("project_id", AsInt(project_id)), StringField("stage", stage)});
  return true;
}

bool ProjectStateMachine::CompleteStage(uint64_t project_id, const std::string& stage, uint32_t progress, const MetadataMap& metadata) {
  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (project.status() != PROJECT_STATUS_PROCESSING) return false;

  project.set_current_step(stage);
  project.set_progress_percent(std::max(project.progress_percent(), progress));
  model::Put(*project.mutable_processing_metadata(), stage, model::Nested(metadata));
  Store(*tx, project);
  tx->Commit();
  return true;
}

bool ProjectStateMachine::FailStage(uint64_t project_id, const std::string& stage, const std::string& cause, const MetadataMap& metadata) {
  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (project.status() != PROJECT_STATUS_PROCESSING) return false;

  auto diagnostics = metadata;
  model::Put(diagnostics, "error", model::Text(cause));

  project.set_status(PROJECT_STATUS_FAILED);
  project.set_current_step(stage);
  project.set_error_message(stage + " stage failed: " + cause);
  model::Put(*project.mutable_processing_metadata(), stage, model::Nested(std::move(diagnostics)));
  *project.mutable_completed_at() = util::ToProto(util::Now());
  Store(*tx, project);
  tx->Commit();

  PLANCAST_LOG_WARN("pipeline stage failed", {IntField("project_id", AsInt(project_id)), StringField("stage", stage), StringField("error", cause)});
  observability::Metrics::Instance().RecordProjectOutcome("failed");
  return true;
}

bool ProjectStateMachine::Finish(const RunTicket& ticket, const MetadataMap& export_metadata, const MetadataMap& output_files,
                                 const std::vector<std::string>& formats) {
  const auto                          project_id = ticket.project_id();
  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (project.status() != PROJECT_STATUS_PROCESSING) return false;

  const auto finished_at = util::Now();
  project.set_status(PROJECT_STATUS_COMPLETED);
  project.set_current_step(kExport);
  project.set_progress_percent(100);
  *project.mutable_output_files() = output_files;
  model::Put(*project.mutable_processing_metadata(), kExport, model::Nested(export_metadata));
  *project.mutable_completed_at() = util::ToProto(finished_at);
  Store(*tx, project);

  const double seconds = std::chrono::duration<double>(finished_at - ticket.started_at_).count();

  UsageEntry processing;
  processing.set_user_id(project.user_id());
  processing.set_project_id(project_id);
  processing.set_action(USAGE_ACTION_PROCESSING);
  processing.set_endpoint("pipeline.run");
  processing.set_file_size_mb(project.input().file_size_mb());
  processing.set_processing_seconds(seconds);
  std::string joined;
  for (const auto& format : formats) {
    if (!joined.empty()) joined += ",";
    joined += format;
  }
  model::Put(*processing.mutable_request_metadata(), "formats", model::Text(joined));
  ledger_->Append(*tx, processing);

  tx->Commit();

  PLANCAST_LOG_INFO("project completed", {IntField("project_id", AsInt(project_id)), StringField("formats", joined),
                                          observability::DoubleField("processing_seconds", seconds)});
  observability::Metrics::Instance().RecordProjectOutcome("completed");
  return true;
}

ProjectSnapshot ProjectStateMachine::Execute(RunTicket&& ticket_in) {
  RunTicket ticket = std::move(ticket_in);
  if (!ticket.valid()) {
    throw std::invalid_argument("execute: run ticket does not hold a lease");
  }
  const uint64_t id = ticket.project_id();

  try {
    return RunStages(ticket);
  } catch (const std::exception& e) {
    // Stage errors are recorded inside RunStages; this is the store failing
    // between stages. Leave the project terminal before the lease goes.
    PLANCAST_LOG_ERROR("pipeline run aborted", {IntField("project_id", AsInt(id)), StringField("error", e.what())});
    try {
      if (!FailStage(id, kPersistence, e.what(), MetadataMap{})) LogHalted(id, kPersistence);
    } catch (const std::exception& record_error) {
      PLANCAST_LOG_ERROR("could not record pipeline failure",
                         {IntField("project_id", AsInt(id)), StringField("error", record_error.what())});
    }
    throw;
  }
}

ProjectSnapshot ProjectStateMachine::RunStages(const RunTicket& ticket) {
  const uint64_t id = ticket.project_id();

  const auto project   = Get(id);
  const auto reference = ReferenceOf(project);

  // Runs one stage. nullopt means the run must stop: the stage failed
  // (already recorded) or the project left processing.
  auto attempt = [&](const std::string& stage, const std::function<MetadataMap()>& body) -> std::optional<MetadataMap> {
    if (!BeginStage(id, stage)) {
      LogHalted(id, stage);
      return std::nullopt;
    }

    observability::SpanScope span("pipeline." + stage);
    span.SetAttribute("project_id", AsInt(id));

    const auto start       = std::chrono::steady_clock::now();
    auto       duration_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count(); };

    std::string cause;
    MetadataMap diagnostics;
    try {
      auto metadata = body();
      const auto ms = duration_ms();
      model::Put(metadata, "duration_ms", model::Number(ms));
      observability::Metrics::Instance().ObserveStageDurationMs(stage, ms);
      return metadata;
    } catch (const StageFailed& e) {
      cause       = e.what();
      diagnostics = e.metadata();
    } catch (const std::exception& e) {
      cause = e.what();
    }

    span.RecordException(cause);
    model::Put(diagnostics, "duration_ms", model::Number(duration_ms()));
    if (!FailStage(id, stage, cause, diagnostics)) LogHalted(id, stage);
    return std::nullopt;
  };

  auto advance = [&](const std::string& stage, uint32_t progress, const std::optional<MetadataMap>& metadata) {
    if (!metadata) return false;
    if (!CompleteStage(id, stage, progress, *metadata)) {
      LogHalted(id, stage);
      return false;
    }
    return true;
  };

  model::RawGeometry    raw;
  model::ScaledGeometry scaled;
  model::Model3D        model3d;

  const bool built = advance(kExtraction, 25, attempt(kExtraction, [&] {
                       raw = stages_.extractor->Extract(project.input().input_path());

                       MetadataMap metadata;
                       model::Put(metadata, "rooms", model::Number(static_cast<double>(raw.rooms.size())));
                       model::Put(metadata, "walls", model::Number(static_cast<double>(raw.walls.size())));
                       model::Put(metadata, "image_width", model::Number(raw.image_width));
                       model::Put(metadata, "image_height", model::Number(raw.image_height));
                       model::Put(metadata, "embedded_reference", model::Text(raw.scale_reference ? "yes" : "no"));
                       return metadata;
                     })) &&
                     advance(kScaling, 50, attempt(kScaling, [&] {
                       scaled = stages_.scaler->Scale(raw, reference);

                       MetadataMap metadata;
                       model::Put(metadata, "units_per_pixel", model::Number(scaled.units_per_pixel));
                       model::Put(metadata, "reference_source", model::Text(scaled.reference_source));
                       model::Put(metadata, "building_width", model::Number(scaled.building_width));
                       model::Put(metadata, "building_length", model::Number(scaled.building_length));
                       model::Put(metadata, "building_area", model::Number(scaled.building_area));
                       if (!scaled.warnings.empty()) {
                         MetadataMap warnings;
                         for (std::size_t i = 0; i < scaled.warnings.size(); ++i) {
                           model::Put(warnings, std::to_string(i), model::Text(scaled.warnings[i]));
                         }
                         model::Put(metadata, "warnings", model::Nested(std::move(warnings)));
                       }
                       return metadata;
                     })) &&
                     advance(kBuilding, 75, attempt(kBuilding, [&] {
                       model3d = stages_.builder->Build(scaled);

                       MetadataMap metadata;
                       model::Put(metadata, "meshes", model::Number(static_cast<double>(model3d.meshes.size())));
                       model::Put(metadata, "vertices", model::Number(static_cast<double>(model3d.VertexCount())));
                       model::Put(metadata, "triangles", model::Number(static_cast<double>(model3d.TriangleCount())));
                       model::Put(metadata, "wall_height", model::Number(stages_.builder->options().wall_height));
                       model::Put(metadata, "width", model::Number(model3d.bounds.max.x - model3d.bounds.min.x));
                       model::Put(metadata, "length", model::Number(model3d.bounds.max.y - model3d.bounds.min.y));
                       model::Put(metadata, "height", model::Number(model3d.bounds.max.z - model3d.bounds.min.z));
                       return metadata;
                     }));
  if (!built) {
    return GetStatus(id);
  }

  MetadataMap              output_files;
  std::vector<std::string> exported;

  auto export_metadata = attempt(kExport, [&] {
    const auto result = stages_.builder->Export(id, model3d, options_.export_formats);

    MetadataMap files;
    for (const auto& [format, path] : result.files) {
      model::Put(files, format, model::Path(path));
      model::Put(output_files, format, model::Path(path));
      exported.push_back(format);
    }
    MetadataMap failures;
    for (const auto& [format, message] : result.failures) {
      model::Put(failures, format, model::Text(message));
    }

    MetadataMap metadata;
    model::Put(metadata, "files", model::Nested(files));
    if (!result.failures.empty()) {
      model::Put(metadata, "failures", model::Nested(failures));
    }

    if (result.files.empty()) {
      std::string detail;
      for (const auto& [format, message] : result.failures) {
        if (!detail.empty()) detail += "; ";
        detail += message;
      }
      throw StageFailed(detail.empty() ? "no export formats configured" : "no export format succeeded: " + detail, metadata);
    }
    return metadata;
  });

  if (export_metadata && !Finish(ticket, *export_metadata, output_files, exported)) {
    LogHalted(id, kExport);
  }
  return GetStatus(id);
}

// ------------------------------------------------------------------
// Cancel / Reset / reads
// ------------------------------------------------------------------

ProjectSnapshot ProjectStateMachine::Cancel(uint64_t project_id) {
  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (model::IsTerminal(project.status())) {
    tx->Commit();
    return ToSnapshot(project);
  }

  project.set_status(PROJECT_STATUS_CANCELLED);
  *project.mutable_completed_at() = util::ToProto(util::Now());
  Store(*tx, project);
  tx->Commit();

  PLANCAST_LOG_INFO("project cancelled", {IntField("project_id", AsInt(project_id)), StringField("step", project.current_step())});
  observability::Metrics::Instance().RecordProjectOutcome("cancelled");
  return ToSnapshot(project);
}

ProjectSnapshot ProjectStateMachine::Reset(uint64_t project_id) {
  std::unique_lock<std::shared_mutex> project_lock(*ProjectMutex(project_id));

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  if (!model::CanTransition(project.status(), PROJECT_STATUS_PENDING)) {
    throw util::IllegalTransition("project " + std::to_string(project_id) + " is " + std::string(model::ToString(project.status())) +
                                  "; only failed projects can be reset");
  }

  project.set_status(PROJECT_STATUS_PENDING);
  project.set_current_step(kStepUpload);
  project.set_progress_percent(0);
  project.clear_error_message();
  project.clear_output_files();
  project.clear_processing_metadata();
  project.clear_started_at();
  project.clear_completed_at();
  Store(*tx, project);
  tx->Commit();

  PLANCAST_LOG_INFO("project reset", {IntField("project_id", AsInt(project_id))});
  return ToSnapshot(project);
}

ProjectSnapshot ProjectStateMachine::GetStatus(uint64_t project_id) {
  return ToSnapshot(Get(project_id));
}

Project ProjectStateMachine::Get(uint64_t project_id) {
  // A project nobody has written in this process needs no lock: the read is
  // one transaction. Unknown ids must not leave a mutex entry behind.
  std::shared_lock<std::shared_mutex> project_lock;
  if (auto project_mutex = FindProjectMutex(project_id)) {
    project_lock = std::shared_lock<std::shared_mutex>(*project_mutex);
  }

  auto tx      = repository_->Begin();
  auto project = Load(*tx, project_id);
  tx->Commit();
  return project;
}

std::vector<Project> ProjectStateMachine::ListByUser(uint64_t user_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListProjectsByUser(*tx, user_id);
  tx->Commit();

  std::vector<Project> out;
  out.reserve(records.size());
  for (const auto& record : records) out.push_back(ToProto(record));
  return out;
}

} // namespace plancast::core
