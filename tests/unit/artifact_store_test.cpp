#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/storage/artifact_store.hpp"
#include "internal/storage/path_utils.hpp"

namespace {

using plancast::storage::ArtifactStore;
using plancast::storage::ArtifactStoreOptions;

std::filesystem::path FreshRoot(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "plancast_artifact_store_tests" / name;
  std::filesystem::remove_all(root);
  return root;
}

void TestReservePathIsDeterministic() {
  ArtifactStore store(ArtifactStoreOptions{FreshRoot("reserve"), false});

  const auto first  = store.ReservePath(7, "model.glb");
  const auto second = store.ReservePath(7, "model.glb");
  assert(first == second);
  assert(first == store.root() / "projects" / "7" / "model.glb");
  assert(std::filesystem::is_directory(first.parent_path()));
  assert(!store.Exists(first));
}

void TestWriteThenReadRoundTrip() {
  ArtifactStore store(ArtifactStoreOptions{FreshRoot("write"), true});

  const auto        path = store.ReservePath(1, "model.obj");
  const std::string body = "o mesh\nv 0 0 0\n";
  store.Write(path, body);

  assert(store.Exists(path));
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  const auto buffer = store.Read(path);
  assert(buffer->ToString() == body);

  // overwrite replaces the whole file
  store.Write(path, "x");
  assert(store.Read(path)->ToString() == "x");
}

void TestRejectsPathsOutsideRoot() {
  ArtifactStore store(ArtifactStoreOptions{FreshRoot("outside"), false});

  bool threw = false;
  try {
    store.Write(store.root() / ".." / "escape.bin", "nope");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  for (const std::string kind : {"", ".", "..", "a/b", "a\\b"}) {
    threw = false;
    try {
      (void)store.ReservePath(1, kind);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestFailedWriteLeavesNoTempFile() {
  ArtifactStore store(ArtifactStoreOptions{FreshRoot("failed"), false});

  // a non-empty directory where the artifact should go makes the final move fail
  const auto path = store.ReservePath(3, "model.stl");
  std::filesystem::create_directories(path / "occupied");

  bool threw = false;
  try {
    store.Write(path, "solid mesh\nendsolid mesh\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path.string() + ".tmp"));
  assert(std::filesystem::is_directory(path));
}

void TestRelativeRootIsMadeAbsolute() {
  const auto    cwd = std::filesystem::current_path();
  const auto    dir = FreshRoot("relative");
  std::filesystem::create_directories(dir);
  std::filesystem::current_path(dir);

  ArtifactStore store(ArtifactStoreOptions{"out", false});
  assert(store.root().is_absolute());
  assert(plancast::storage::IsUnder(dir, store.root()));

  std::filesystem::current_path(cwd);
}

} // namespace

int main() {
  TestReservePathIsDeterministic();
  TestWriteThenReadRoundTrip();
  TestRejectsPathsOutsideRoot();
  TestFailedWriteLeavesNoTempFile();
  TestRelativeRootIsMadeAbsolute();

  std::cout << "plancast_unit_artifact_store: pass\n";
  return 0;
}
