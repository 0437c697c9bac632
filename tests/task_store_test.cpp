#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/task_store.hpp"

namespace {

namespace fs = std::filesystem;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

class TempDir {
 public:
  explicit TempDir(const std::string& name)
      : path_(fs::temp_directory_path() / ("smallt-" + name)) {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  std::string File(const std::string& name) const { return (path_ / name).string(); }

 private:
  fs::path path_;
};

std::string ReadFile(const std::string& path) {
  std::ifstream input(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  output << content;
}

void TestMissingFileIsEmpty() {
  TempDir dir("store-missing");
  core::TaskStore store(dir.File("tasks.md"));
  Assert(store.Load().empty(), "Missing file must load as an empty list");
  Assert(!fs::exists(dir.File("tasks.md")), "Loading must not create the file");
}

void TestSaveThenLoad() {
  TempDir dir("store-save");
  const auto path = dir.File("tasks.md");
  core::TaskStore store(path);

  store.Save({{"Buy milk", false}, {"Walk dog", true}});
  Assert(ReadFile(path) == "- [ ] Buy milk\n- [x] Walk dog\n", "Saved file content mismatch");
  Assert(!fs::exists(path + ".tmp"), "Temp file must not survive a successful save");

  const auto tasks = store.Load();
  Assert(tasks.size() == 2, "Expected 2 tasks after reload");
  Assert(tasks[0].text == "Buy milk" && !tasks[0].done, "First reloaded task mismatch");
  Assert(tasks[1].text == "Walk dog" && tasks[1].done, "Second reloaded task mismatch");
}

void TestSaveOverwritesAndDropsNonTaskLines() {
  TempDir dir("store-overwrite");
  const auto path = dir.File("tasks.md");
  WriteFile(path, "# Task List\n\n- [x] Old task\nstray note\n- [ ] New task\n");

  core::TaskStore store(path);
  store.Save(store.Load());
  Assert(ReadFile(path) == "- [x] Old task\n- [ ] New task\n",
         "Non-task lines must be dropped on save");

  store.Save({});
  Assert(fs::exists(path), "Saving an empty list keeps the file");
  Assert(ReadFile(path).empty(), "Saving an empty list empties the file");
}

void TestLoadDirectoryFails() {
  TempDir dir("store-dir");
  const auto path = dir.File("tasks.md");
  fs::create_directories(path);

  core::TaskStore store(path);
  bool threw = false;
  try {
    store.Load();
  } catch (const std::runtime_error& ex) {
    threw = std::string{ex.what()}.find(path) != std::string::npos;
  }
  Assert(threw, "Loading a directory must throw with the path in the message");
}

void TestFailedSaveLeavesNoTempFile() {
  TempDir dir("store-fail");
  const auto path = dir.File("tasks.md");
  fs::create_directories(path);
  WriteFile(dir.File("tasks.md/keep"), "x");

  core::TaskStore store(path);
  bool threw = false;
  try {
    store.Save({{"Buy milk", false}});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Assert(threw, "Saving over a directory must throw");
  Assert(!fs::exists(path + ".tmp"), "Temp file must be removed after a failed save");
  Assert(fs::is_directory(path), "Target must be left as it was");
}

void TestSaveIntoMissingDirectoryFails() {
  TempDir dir("store-nodir");
  core::TaskStore store(dir.File("missing/tasks.md"));
  bool threw = false;
  try {
    store.Save({{"Buy milk", false}});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Assert(threw, "Saving into a missing directory must throw");
}

void TestSaveKeepsPermissions() {
  TempDir dir("store-perms");
  const auto path = dir.File("tasks.md");
  WriteFile(path, "- [ ] Private\n");
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write);

  core::TaskStore store(path);
  store.Save({{"Private", true}});
  Assert(ReadFile(path) == "- [x] Private\n", "Saved content mismatch");
  Assert(fs::status(path).permissions() == (fs::perms::owner_read | fs::perms::owner_write),
         "Save must keep the file's permission bits");
}

void TestSaveWritesThroughSymlink() {
  TempDir dir("store-link");
  const auto target = dir.File("real-tasks.md");
  const auto link = dir.File("tasks.md");
  WriteFile(target, "- [ ] Linked\n");
  fs::create_symlink(target, link);

  core::TaskStore store(link);
  store.Save({{"Linked", true}});
  Assert(fs::is_symlink(link), "Save must keep the symlink");
  Assert(ReadFile(target) == "- [x] Linked\n", "Save must write the link target");
  Assert(!fs::exists(link + ".tmp") && !fs::exists(target + ".tmp"),
         "Temp file must not survive a successful save");
}

void TestEmptyPathRejected() {
  bool threw = false;
  try {
    core::TaskStore store("");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Assert(threw, "Empty task file path must be rejected");
}

}  // namespace

int main() {
  try {
    TestMissingFileIsEmpty();
    TestSaveThenLoad();
    TestSaveOverwritesAndDropsNonTaskLines();
    TestLoadDirectoryFails();
    TestFailedSaveLeavesNoTempFile();
    TestSaveIntoMissingDirectoryFails();
    TestSaveKeepsPermissions();
    TestSaveWritesThroughSymlink();
    TestEmptyPathRejected();
  } catch (const std::exception& ex) {
    std::cerr << "task_store_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
