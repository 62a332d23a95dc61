#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/lease/run_lease_table.hpp"
#include "internal/util/time.hpp"
#include "plancast/v1/types.pb.h"

namespace plancast::geometry {
class GeometryExtractor;
}
namespace plancast::scaling {
class CoordinateScaler;
}
namespace plancast::modeling {
class ModelBuilder;
}
namespace plancast::quota {
class QuotaGate;
}
namespace plancast::usage {
class UsageLedger;
}

namespace plancast::core {

struct PipelineOptions {
  std::vector<std::string> export_formats{"glb", "obj", "stl"};
  std::vector<std::string> allowed_formats{"jpg", "jpeg", "png", "pdf"};
  double                   max_upload_mb = 16.0; // 0 = unlimited
};

struct PipelineStages {
  std::shared_ptr<geometry::GeometryExtractor>     extractor;
  std::shared_ptr<const scaling::CoordinateScaler> scaler;
  std::shared_ptr<const modeling::ModelBuilder>    builder;
};

/*
  Proof that a project has been moved to processing and holds the run
  lease. Produced by StartRun, consumed by Execute.
*/
class RunTicket {
 public:
  RunTicket() = default;

  RunTicket(RunTicket&&) noexcept            = default;
  RunTicket& operator=(RunTicket&&) noexcept = default;

  uint64_t project_id() const {
    return project_id_;
  }

  bool valid() const {
    return lease_.valid();
  }

 private:
  friend class ProjectStateMachine;

  RunTicket(uint64_t project_id, lease::RunLease lease, util::TimePoint started_at)
      : project_id_(project_id), lease_(std::move(lease)), started_at_(started_at) {}

  uint64_t        project_id_ = 0;
  lease::RunLease lease_;
  util::TimePoint started_at_{};
};

/*
  ProjectStateMachine

  Sole writer of project lifecycle fields.

    pending -> processing -> completed | failed | cancelled
    pending -> cancelled
    failed  -> pending (Reset)

  Stage order and progress after each stage:
    extraction 25, scaling 50, building 75, export 100 (completed)

  Stage errors become status failed with "<stage> stage failed: <cause>";
  they are never rethrown. Every other error is thrown before anything
  is written.

  Stages run without locks. Each persistence step takes the project's
  mutex, re-reads the row and stops if the project is no longer
  processing, so a cancelled project is never overwritten.
*/
class ProjectStateMachine {
 public:
  ProjectStateMachine(std::shared_ptr<db::Repository> repository, std::shared_ptr<quota::QuotaGate> quota,
                      std::shared_ptr<usage::UsageLedger> ledger, std::shared_ptr<lease::RunLeaseTable> leases, PipelineStages stages,
                      PipelineOptions options);

  plancast::v1::Project Create(uint64_t user_id, const plancast::v1::InputDescriptor& input,
                               const std::optional<plancast::v1::ScaleReference>& scale_reference);

  // Acquires the run lease, re-checks the owner's quota and moves
  // pending -> processing with an upload usage entry.
  // Throws util::AlreadyRunning, util::NotFound, util::IllegalTransition,
  // util::QuotaExceeded.
  RunTicket StartRun(uint64_t project_id);

  // Same, but hands the ticket to dispatch before committing. If dispatch
  // throws, nothing is written and the project stays pending.
  void StartRun(uint64_t project_id, const std::function<void(RunTicket&&)>& dispatch);

  // Runs every stage; returns the final snapshot. If the store fails
  // between stages the project is failed at step "persistence" and the
  // error is rethrown.
  plancast::v1::ProjectSnapshot Execute(RunTicket&& ticket);

  plancast::v1::ProjectSnapshot Run(uint64_t project_id);

  // No-op on a terminal project.
  plancast::v1::ProjectSnapshot Cancel(uint64_t project_id);

  // failed -> pending; anything else throws util::IllegalTransition.
  plancast::v1::ProjectSnapshot Reset(uint64_t project_id);

  plancast::v1::ProjectSnapshot GetStatus(uint64_t project_id);

  plancast::v1::Project              Get(uint64_t project_id);
  std::vector<plancast::v1::Project> ListByUser(uint64_t user_id);

  const PipelineOptions& options() const {
    return options_;
  }

  // Projects holding a per-project mutex; only writes create one.
  std::size_t TrackedProjectCount();

 private:
  std::shared_ptr<std::shared_mutex> ProjectMutex(uint64_t project_id);
  std::shared_ptr<std::shared_mutex> FindProjectMutex(uint64_t project_id);

  plancast::v1::InputDescriptor ValidateInput(const plancast::v1::InputDescriptor& input) const;

  // Loads the row inside tx; throws util::NotFound.
  plancast::v1::Project Load(db::Transaction& tx, uint64_t project_id);
  void                  Store(db::Transaction& tx, plancast::v1::Project& project);

  plancast::v1::ProjectSnapshot RunStages(const RunTicket& ticket);

  // Each returns false when the project is no longer processing.
  bool BeginStage(uint64_t project_id, const std::string& stage);
  bool CompleteStage(uint64_t project_id, const std::string& stage, uint32_t progress, const plancast::v1::MetadataMap& metadata);
  bool FailStage(uint64_t project_id, const std::string& stage, const std::string& cause, const plancast::v1::MetadataMap& metadata);
  bool Finish(const RunTicket& ticket, const plancast::v1::MetadataMap& export_metadata, const plancast::v1::MetadataMap& output_files,
              const std::vector<std::string>& formats);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<quota::QuotaGate>     quota_;
  std::shared_ptr<usage::UsageLedger>   ledger_;
  std::shared_ptr<lease::RunLeaseTable> leases_;
  PipelineStages                        stages_;
  PipelineOptions                       options_;

  std::mutex                                                       project_mutexes_guard_;
  std::unordered_map<uint64_t, std::shared_ptr<std::shared_mutex>> project_mutexes_;
};

} // namespace plancast::core
