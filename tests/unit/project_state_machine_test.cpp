#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/util/message_differencer.h>

#include "internal/core/project_state_machine.hpp"
#include "internal/core/user_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geometry/geometry_extractor.hpp"
#include "internal/modeling/model_builder.hpp"
#include "internal/quota/quota_gate.hpp"
#include "internal/scaling/coordinate_scaler.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/usage/usage_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace plancast::v1;
using plancast::core::ProjectStateMachine;
using plancast::model::RawGeometry;

class ScriptedExtractor final : public plancast::geometry::GeometryExtractor {
 public:
  std::function<RawGeometry(const std::filesystem::path&)> script;

  RawGeometry Extract(const std::filesystem::path& image_path) override {
    return script(image_path);
  }
};

// Holds a stage until the test releases it.
class Gate {
 public:
  void Enter() {
    std::unique_lock lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [&] { return released_; });
  }

  void AwaitEntered() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return entered_; });
  }

  void Release() {
    {
      std::lock_guard lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    entered_  = false;
  bool                    released_ = false;
};

// Memory store that can fail one project update on request.
class FlakyRepository final : public plancast::db::Repository {
 public:
  std::string fail_update_at_step;

  std::unique_ptr<plancast::db::Transaction> Begin() override {
    return inner_.Begin();
  }

  plancast::db::Result InsertUser(plancast::db::Transaction& tx, plancast::db::model::UserRecord& user) override {
    return inner_.InsertUser(tx, user);
  }
  std::optional<plancast::db::model::UserRecord> GetUser(plancast::db::Transaction& tx, uint64_t id) override {
    return inner_.GetUser(tx, id);
  }
  plancast::db::Result UpdateUser(plancast::db::Transaction& tx, const plancast::db::model::UserRecord& user) override {
    return inner_.UpdateUser(tx, user);
  }

  plancast::db::Result InsertProject(plancast::db::Transaction& tx, plancast::db::model::ProjectRecord& project) override {
    return inner_.InsertProject(tx, project);
  }
  std::optional<plancast::db::model::ProjectRecord> GetProject(plancast::db::Transaction& tx, uint64_t id) override {
    return inner_.GetProject(tx, id);
  }
  std::vector<plancast::db::model::ProjectRecord> ListProjectsByUser(plancast::db::Transaction& tx, uint64_t user_id) override {
    return inner_.ListProjectsByUser(tx, user_id);
  }
  plancast::db::Result UpdateProject(plancast::db::Transaction& tx, const plancast::db::model::ProjectRecord& project) override {
    if (!fail_update_at_step.empty() && project.current_step == fail_update_at_step) {
      fail_update_at_step.clear();
      return plancast::db::Result::Err(plancast::db::ErrorCode::IOError, "disk full");
    }
    return inner_.UpdateProject(tx, project);
  }

  plancast::db::Result AppendUsage(plancast::db::Transaction& tx, plancast::db::model::UsageRecord& usage) override {
    return inner_.AppendUsage(tx, usage);
  }
  std::vector<plancast::db::model::UsageRecord> ListUsage(plancast::db::Transaction& tx, uint64_t user_id, uint64_t since_ms) override {
    return inner_.ListUsage(tx, user_id, since_ms);
  }
  plancast::db::model::UsageAggregate SumUsage(plancast::db::Transaction& tx, uint64_t user_id, const std::string& action_type,
                                               uint64_t since_ms) override {
    return inner_.SumUsage(tx, user_id, action_type, since_ms);
  }

 private:
  plancast::db::memory::MemoryRepository inner_;
};

RawGeometry Kitchen() {
  RawGeometry raw;
  raw.rooms.push_back({"kitchen", {{0, 0}, {120, 0}, {120, 80}, {0, 80}}});
  raw.walls.push_back({{0, 0}, {120, 0}});
  return raw;
}

ScaleReference OneTwentyPixelsIsThree() {
  ScaleReference ref;
  ref.mutable_length()->set_pixel_length(120);
  ref.mutable_length()->set_real_length(3.0);
  return ref;
}

InputDescriptor Upload(double size_mb = 2.0, const std::string& format = "png") {
  InputDescriptor input;
  input.set_filename("stored-plan.png");
  input.set_original_filename("plan.png");
  input.set_input_path("/uploads/stored-plan.png");
  input.set_file_size_mb(size_mb);
  input.set_file_format(format);
  return input;
}

struct Harness {
  std::shared_ptr<FlakyRepository>                   repository = std::make_shared<FlakyRepository>();
  std::shared_ptr<plancast::usage::UsageLedger>      ledger     = std::make_shared<plancast::usage::UsageLedger>(repository);
  std::shared_ptr<ScriptedExtractor>                 extractor  = std::make_shared<ScriptedExtractor>();
  std::shared_ptr<plancast::storage::ArtifactStore>  artifacts;
  std::shared_ptr<ProjectStateMachine>               machine;
  uint64_t                                           user_id = 0;

  explicit Harness(std::vector<std::string> export_formats = {"glb", "obj", "stl"}, plancast::quota::QuotaPolicy policy = {}) {
    static std::atomic<int> counter{0};
    const auto              root = std::filesystem::temp_directory_path() / "plancast_state_machine_tests" / std::to_string(counter++);
    std::filesystem::remove_all(root);
    artifacts = std::make_shared<plancast::storage::ArtifactStore>(plancast::storage::ArtifactStoreOptions{root, false});

    extractor->script = [](const std::filesystem::path&) { return Kitchen(); };

    plancast::core::PipelineStages stages;
    stages.extractor = extractor;
    stages.scaler    = std::make_shared<plancast::scaling::CoordinateScaler>();
    stages.builder   = std::make_shared<plancast::modeling::ModelBuilder>(plancast::modeling::ModelBuilderOptions{}, artifacts);

    plancast::core::PipelineOptions options;
    options.export_formats = std::move(export_formats);

    machine = std::make_shared<ProjectStateMachine>(repository, std::make_shared<plancast::quota::QuotaGate>(ledger, policy), ledger,
                                                    plancast::lease::RunLeaseTable::Create(), std::move(stages), options);

    plancast::core::UserRegistry users(repository);
    user_id = users.Register({"owner@example.com"}).id();
  }

  uint64_t Create(std::optional<ScaleReference> ref = OneTwentyPixelsIsThree()) {
    return machine->Create(user_id, Upload(), ref).id();
  }

  std::vector<UsageEntry> Usage(UsageAction action) {
    std::vector<UsageEntry> out;
    for (auto& entry : ledger->List(user_id, std::chrono::hours(24))) {
      if (entry.action() == action) out.push_back(entry);
    }
    return out;
  }
};

const MetadataMap& StageMetadata(const Project& project, const std::string& stage) {
  return project.processing_metadata().entries().at(stage).map();
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateStartsPending() {
  Harness h;
  auto    project = h.machine->Create(h.user_id, Upload(2.0, ".PNG"), OneTwentyPixelsIsThree());

  assert(project.id() > 0);
  assert(project.status() == PROJECT_STATUS_PENDING);
  assert(project.current_step() == "upload");
  assert(project.progress_percent() == 0);
  assert(project.input().file_format() == "png");
  assert(project.has_created_at());
  assert(!project.has_started_at());
  assert(project.scale_reference().length().pixel_length() == 120);
}

void TestHappyPathCompletesWithAllFormats() {
  Harness    h;
  const auto id       = h.Create();
  const auto snapshot = h.machine->Run(id);

  assert(snapshot.status() == PROJECT_STATUS_COMPLETED);
  assert(snapshot.progress_percent() == 100);
  assert(snapshot.error_message().empty());
  assert(snapshot.output_files().size() == 3);
  for (const auto& [format, path] : snapshot.output_files()) {
    assert(h.artifacts->Exists(path));
    assert(std::filesystem::path(path).filename() == "model." + format);
  }
  assert(snapshot.has_started_at() && snapshot.has_completed_at());

  const auto project = h.machine->Get(id);
  const auto scaling = StageMetadata(project, "scaling");
  assert(std::abs(scaling.entries().at("units_per_pixel").number() - 0.025) < 1e-12);
  assert(scaling.entries().at("reference_source").text() == "upload");
  assert(StageMetadata(project, "extraction").entries().at("rooms").number() == 1);
  assert(StageMetadata(project, "building").entries().at("meshes").number() == 2);
  assert(StageMetadata(project, "export").entries().at("files").map().entries().size() == 3);

  const auto uploads = h.Usage(USAGE_ACTION_UPLOAD);
  assert(uploads.size() == 1);
  assert(uploads[0].project_id() == id);
  assert(uploads[0].file_size_mb() == 2.0);

  const auto processing = h.Usage(USAGE_ACTION_PROCESSING);
  assert(processing.size() == 1);
  assert(processing[0].processing_seconds() >= 0.0);
  assert(processing[0].request_metadata().entries().at("formats").text() == "glb,obj,stl");
}

void TestMissingReferenceFailsScaling() {
  Harness    h;
  const auto id       = h.Create(std::nullopt);
  const auto snapshot = h.machine->Run(id);

  assert(snapshot.status() == PROJECT_STATUS_FAILED);
  assert(snapshot.error_message().find("scaling") != std::string::npos);
  assert(snapshot.error_message().find("missing scale reference") != std::string::npos);
  assert(snapshot.current_step() == "scaling");
  assert(snapshot.progress_percent() == 25);
  assert(snapshot.has_completed_at());
  assert(snapshot.output_files().empty());

  const auto project = h.machine->Get(id);
  assert(StageMetadata(project, "scaling").entries().at("error").text().find("missing scale reference") != std::string::npos);
  assert(h.Usage(USAGE_ACTION_PROCESSING).empty());
}

void TestZeroLengthReferenceFailsScaling() {
  Harness        h;
  ScaleReference zero;
  zero.mutable_length()->set_pixel_length(0);
  zero.mutable_length()->set_real_length(3.0);

  const auto id       = h.Create(zero);
  const auto snapshot = h.machine->Run(id);

  assert(snapshot.status() == PROJECT_STATUS_FAILED);
  assert(snapshot.error_message().rfind("scaling stage failed: ", 0) == 0);
  assert(snapshot.progress_percent() == 25);
  assert(snapshot.output_files().empty());
  assert(h.Usage(USAGE_ACTION_PROCESSING).empty());
}

void TestEmbeddedReferenceIsUsed() {
  Harness h;
  h.extractor->script = [](const std::filesystem::path&) {
    auto raw = Kitchen();
    raw.scale_reference.emplace();
    raw.scale_reference->set_units_per_pixel(0.05);
    return raw;
  };

  const auto id       = h.Create(std::nullopt);
  const auto snapshot = h.machine->Run(id);
  assert(snapshot.status() == PROJECT_STATUS_COMPLETED);
  assert(StageMetadata(h.machine->Get(id), "scaling").entries().at("reference_source").text() == "geometry");
}

void TestExtractionAndBuildFailuresNameTheStage() {
  Harness h;
  h.extractor->script = [](const std::filesystem::path& path) -> RawGeometry {
    throw plancast::util::GeometryExtractionError("segmentation timed out for " + path.string());
  };
  const auto extraction = h.machine->Run(h.Create());
  assert(extraction.status() == PROJECT_STATUS_FAILED);
  assert(extraction.error_message().rfind("extraction stage failed: segmentation timed out", 0) == 0);
  assert(extraction.progress_percent() == 0);

  h.extractor->script = [](const std::filesystem::path&) {
    RawGeometry raw;
    raw.rooms.push_back({"sliver", {{0, 0}, {10, 10}, {20, 20}}});
    return raw;
  };
  const auto building = h.machine->Run(h.Create());
  assert(building.status() == PROJECT_STATUS_FAILED);
  assert(building.error_message().rfind("building stage failed: ", 0) == 0);
  assert(building.progress_percent() == 50);
}

void TestPartialExportStillCompletes() {
  Harness    h({"obj", "fbx"});
  const auto id       = h.Create();
  const auto snapshot = h.machine->Run(id);

  assert(snapshot.status() == PROJECT_STATUS_COMPLETED);
  assert(snapshot.output_files().size() == 1);
  assert(snapshot.output_files().count("obj") == 1);

  const auto exported = StageMetadata(h.machine->Get(id), "export");
  assert(exported.entries().at("failures").map().entries().at("fbx").text().find("unsupported export format") != std::string::npos);
}

void TestAllExportFormatsFailing() {
  Harness    h({"fbx", "dae"});
  const auto id       = h.Create();
  const auto snapshot = h.machine->Run(id);

  assert(snapshot.status() == PROJECT_STATUS_FAILED);
  assert(snapshot.error_message().rfind("export stage failed: no export format succeeded", 0) == 0);
  assert(snapshot.progress_percent() == 75);
  assert(snapshot.output_files().empty());

  const auto exported = StageMetadata(h.machine->Get(id), "export");
  assert(exported.entries().at("failures").map().entries().size() == 2);
  assert(h.Usage(USAGE_ACTION_PROCESSING).empty());
}

void TestProgressIsMonotonic() {
  Harness    h;
  const auto id = h.Create();

  h.extractor->script = [&](const std::filesystem::path&) {
    // stages run without the project lock held
    const auto during = h.machine->GetStatus(id);
    assert(during.status() == PROJECT_STATUS_PROCESSING);
    assert(during.current_step() == "extraction");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return Kitchen();
  };

  std::atomic<bool>     done{false};
  std::vector<uint32_t> observed;
  std::thread           poller([&] {
    while (!done) {
      observed.push_back(h.machine->GetStatus(id).progress_percent());
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
  });

  const auto snapshot = h.machine->Run(id);
  done                = true;
  poller.join();

  assert(snapshot.progress_percent() == 100);
  for (std::size_t i = 1; i < observed.size(); ++i) {
    assert(observed[i - 1] <= observed[i]);
  }
}

void TestCancelIsIdempotentAndStatusIsReadOnly() {
  Harness    h;
  const auto id = h.Create();

  const auto first  = h.machine->GetStatus(id);
  const auto second = h.machine->GetStatus(id);
  assert(google::protobuf::util::MessageDifferencer::Equals(first, second));

  const auto cancelled = h.machine->Cancel(id);
  assert(cancelled.status() == PROJECT_STATUS_CANCELLED);
  assert(cancelled.has_completed_at());

  const auto stored = h.machine->GetStatus(id);
  const auto again  = h.machine->Cancel(id);
  assert(google::protobuf::util::MessageDifferencer::Equals(stored, again));
  assert(Throws<plancast::util::IllegalTransition>([&] { (void)h.machine->StartRun(id); }));

  const auto done = h.machine->Run(h.Create());
  assert(done.status() == PROJECT_STATUS_COMPLETED);
  const auto untouched = h.machine->Cancel(done.project_id());
  assert(google::protobuf::util::MessageDifferencer::Equals(done, untouched));

  assert(Throws<plancast::util::NotFound>([&] { (void)h.machine->Cancel(9999); }));
}

void TestCancelDuringRunIsNeverOverwritten() {
  Harness    h;
  const auto id = h.Create();

  Gate gate;
  h.extractor->script = [&](const std::filesystem::path&) {
    gate.Enter();
    return Kitchen();
  };

  auto            ticket = h.machine->StartRun(id);
  ProjectSnapshot final_snapshot;
  std::thread     runner([&] { final_snapshot = h.machine->Execute(std::move(ticket)); });

  gate.AwaitEntered();
  assert(h.machine->Cancel(id).status() == PROJECT_STATUS_CANCELLED);
  gate.Release();
  runner.join();

  assert(final_snapshot.status() == PROJECT_STATUS_CANCELLED);
  assert(final_snapshot.output_files().empty());
  assert(final_snapshot.error_message().empty());
  assert(h.machine->GetStatus(id).status() == PROJECT_STATUS_CANCELLED);
  assert(h.Usage(USAGE_ACTION_PROCESSING).empty());
}

void TestConcurrentRunIsRejected() {
  Harness    h;
  const auto id = h.Create();

  Gate gate;
  h.extractor->script = [&](const std::filesystem::path&) {
    gate.Enter();
    return Kitchen();
  };

  ProjectSnapshot first;
  std::thread     runner([&] { first = h.machine->Run(id); });

  gate.AwaitEntered();
  assert(Throws<plancast::util::AlreadyRunning>([&] { (void)h.machine->StartRun(id); }));
  assert(Throws<plancast::util::AlreadyRunning>([&] { (void)h.machine->Run(id); }));
  assert(h.machine->GetStatus(id).status() == PROJECT_STATUS_PROCESSING);

  gate.Release();
  runner.join();

  assert(first.status() == PROJECT_STATUS_COMPLETED);
  // the lease is gone, the state machine now refuses
  assert(Throws<plancast::util::IllegalTransition>([&] { (void)h.machine->StartRun(id); }));
  assert(h.Usage(USAGE_ACTION_UPLOAD).size() == 1);
}

void TestResetOnlyFromFailed() {
  Harness    h;
  const auto id = h.Create(std::nullopt);

  assert(Throws<plancast::util::IllegalTransition>([&] { (void)h.machine->Reset(id); }));
  assert(h.machine->Run(id).status() == PROJECT_STATUS_FAILED);

  const auto reset = h.machine->Reset(id);
  assert(reset.status() == PROJECT_STATUS_PENDING);
  assert(reset.progress_percent() == 0);
  assert(reset.current_step() == "upload");
  assert(reset.error_message().empty());
  assert(!reset.has_started_at() && !reset.has_completed_at());
  assert(h.machine->Get(id).processing_metadata().entries().empty());

  h.extractor->script = [](const std::filesystem::path&) {
    auto raw = Kitchen();
    raw.scale_reference.emplace();
    raw.scale_reference->set_units_per_pixel(0.025);
    return raw;
  };
  assert(h.machine->Run(id).status() == PROJECT_STATUS_COMPLETED);
  assert(Throws<plancast::util::IllegalTransition>([&] { (void)h.machine->Reset(id); }));
}

void TestRejectedCreateLeavesNoRecord() {
  Harness h;

  auto no_name = Upload();
  no_name.set_filename("");
  assert(Throws<plancast::util::InvalidInput>([&] { (void)h.machine->Create(h.user_id, no_name, std::nullopt); }));
  assert(Throws<plancast::util::InvalidInput>([&] { (void)h.machine->Create(h.user_id, Upload(2.0, "gif"), std::nullopt); }));
  assert(Throws<plancast::util::InvalidInput>([&] { (void)h.machine->Create(h.user_id, Upload(0.0), std::nullopt); }));
  assert(Throws<plancast::util::InvalidInput>([&] { (void)h.machine->Create(h.user_id, Upload(-1.0), std::nullopt); }));
  assert(Throws<plancast::util::InvalidInput>([&] { (void)h.machine->Create(h.user_id, Upload(16.5), std::nullopt); }));
  assert(Throws<plancast::util::NotFound>([&] { (void)h.machine->Create(h.user_id + 50, Upload(), std::nullopt); }));
  assert(h.machine->ListByUser(h.user_id).empty());
  assert(Throws<plancast::util::NotFound>([&] { (void)h.machine->GetStatus(12345); }));
  assert(Throws<plancast::util::NotFound>([&] { (void)h.machine->Get(12346); }));
  assert(h.machine->TrackedProjectCount() == 0);

  const auto id = h.Create();
  assert(h.machine->GetStatus(id).status() == PROJECT_STATUS_PENDING);
  assert(h.machine->TrackedProjectCount() == 0);
  assert(h.machine->Cancel(id).status() == PROJECT_STATUS_CANCELLED);
  assert(h.machine->TrackedProjectCount() == 1);
  assert(h.machine->GetStatus(id).status() == PROJECT_STATUS_CANCELLED);
}

void TestQuotaDenialLeavesNoRecord() {
  plancast::quota::QuotaPolicy policy;
  policy.free = {1, 4.0, 0.0};
  Harness h({"obj"}, policy);

  assert(Throws<plancast::util::QuotaExceeded>([&] { (void)h.machine->Create(h.user_id, Upload(5.0), std::nullopt); }));
  assert(h.machine->ListByUser(h.user_id).empty());

  const auto first = h.Create();
  assert(h.machine->Run(first).status() == PROJECT_STATUS_COMPLETED);

  bool quota_exceeded = false;
  try {
    (void)h.machine->Create(h.user_id, Upload(1.0), std::nullopt);
  } catch (const plancast::util::QuotaExceeded& e) {
    quota_exceeded = e.reason() == DENY_REASON_QUOTA_EXCEEDED;
  }
  assert(quota_exceeded);
  assert(h.machine->ListByUser(h.user_id).size() == 1);
}

void TestQuotaIsRecheckedWhenRunning() {
  plancast::quota::QuotaPolicy policy;
  policy.free = {2, 16.0, 0.0};
  Harness h({"obj"}, policy);

  // nothing has been uploaded yet, so every create is admitted
  std::vector<uint64_t> ids;
  for (int i = 0; i < 5; ++i) ids.push_back(h.Create());

  std::size_t completed = 0;
  std::size_t denied    = 0;
  for (const auto id : ids) {
    try {
      if (h.machine->Run(id).status() == PROJECT_STATUS_COMPLETED) ++completed;
    } catch (const plancast::util::QuotaExceeded& e) {
      assert(e.reason() == DENY_REASON_QUOTA_EXCEEDED);
      assert(h.machine->GetStatus(id).status() == PROJECT_STATUS_PENDING);
      ++denied;
    }
  }

  assert(completed == 2);
  assert(denied == 3);
  assert(h.Usage(USAGE_ACTION_UPLOAD).size() == 2);
  assert(h.Usage(USAGE_ACTION_PROCESSING).size() == 2);

  // the denied run released its lease; cancelling still works
  assert(h.machine->Cancel(ids[4]).status() == PROJECT_STATUS_CANCELLED);
}

void TestRejectedDispatchLeavesProjectPending() {
  Harness    h;
  const auto id = h.Create();

  const bool rejected = Throws<plancast::util::Unavailable>(
      [&] { h.machine->StartRun(id, [](plancast::core::RunTicket&&) { throw plancast::util::Unavailable("queue closed"); }); });
  assert(rejected);

  const auto snapshot = h.machine->GetStatus(id);
  assert(snapshot.status() == PROJECT_STATUS_PENDING);
  assert(!snapshot.has_started_at());
  assert(h.Usage(USAGE_ACTION_UPLOAD).empty());

  // lease was released with the dropped ticket
  assert(h.machine->Run(id).status() == PROJECT_STATUS_COMPLETED);
  assert(h.Usage(USAGE_ACTION_UPLOAD).size() == 1);
}

void TestStoreFailureBetweenStagesFailsProject() {
  Harness    h;
  const auto id = h.Create();

  h.repository->fail_update_at_step = "building";
  assert(Throws<std::runtime_error>([&] { (void)h.machine->Run(id); }));

  const auto snapshot = h.machine->GetStatus(id);
  assert(snapshot.status() == PROJECT_STATUS_FAILED);
  assert(snapshot.current_step() == "persistence");
  assert(snapshot.error_message().rfind("persistence stage failed: ", 0) == 0);
  assert(snapshot.error_message().find("disk full") != std::string::npos);
  assert(snapshot.progress_percent() == 50);
  assert(snapshot.has_completed_at());
  assert(snapshot.output_files().empty());

  // the lease went with the ticket; only the lifecycle refuses now
  assert(Throws<plancast::util::IllegalTransition>([&] { (void)h.machine->StartRun(id); }));
  assert(h.machine->Reset(id).status() == PROJECT_STATUS_PENDING);
  assert(h.machine->Run(id).status() == PROJECT_STATUS_COMPLETED);
}

void TestRandomOutcomesKeepErrorIffFailed() {
  std::mt19937                       rng(1234);
  std::uniform_int_distribution<int> pick(0, 4);

  const char* stage_names[] = {"", "extraction", "scaling", "building", "export"};

  for (int round = 0; round < 25; ++round) {
    const int outcome = pick(rng);
    Harness   h(outcome == 4 ? std::vector<std::string>{"fbx"} : std::vector<std::string>{"obj"});

    if (outcome == 1) {
      h.extractor->script = [](const std::filesystem::path&) -> RawGeometry { throw plancast::util::GeometryExtractionError("bad image"); };
    } else if (outcome == 3) {
      h.extractor->script = [](const std::filesystem::path&) {
        RawGeometry raw;
        raw.walls.push_back({{5, 5}, {5, 5}});
        return raw;
      };
    }

    const auto id       = h.Create(outcome == 2 ? std::nullopt : std::optional<ScaleReference>(OneTwentyPixelsIsThree()));
    const auto snapshot = h.machine->Run(id);

    assert((snapshot.status() == PROJECT_STATUS_FAILED) == !snapshot.error_message().empty());
    if (outcome == 0) {
      assert(snapshot.status() == PROJECT_STATUS_COMPLETED);
      assert(snapshot.progress_percent() == 100);
    } else {
      assert(snapshot.status() == PROJECT_STATUS_FAILED);
      assert(snapshot.error_message().rfind(std::string(stage_names[outcome]) + " stage failed: ", 0) == 0);
      assert(snapshot.progress_percent() == static_cast<uint32_t>((outcome - 1) * 25));
    }
  }
}

} // namespace

int main() {
  TestCreateStartsPending();
  TestHappyPathCompletesWithAllFormats();
  TestMissingReferenceFailsScaling();
  TestZeroLengthReferenceFailsScaling();
  TestEmbeddedReferenceIsUsed();
  TestExtractionAndBuildFailuresNameTheStage();
  TestPartialExportStillCompletes();
  TestAllExportFormatsFailing();
  TestProgressIsMonotonic();
  TestCancelIsIdempotentAndStatusIsReadOnly();
  TestCancelDuringRunIsNeverOverwritten();
  TestConcurrentRunIsRejected();
  TestResetOnlyFromFailed();
  TestRejectedCreateLeavesNoRecord();
  TestQuotaDenialLeavesNoRecord();
  TestQuotaIsRecheckedWhenRunning();
  TestRejectedDispatchLeavesProjectPending();
  TestStoreFailureBetweenStagesFailsProject();
  TestRandomOutcomesKeepErrorIffFailed();

  std::cout << "plancast_unit_project_state_machine: pass\n";
  return 0;
}
