#ifndef __TB_FAKE_PROCESS_HANDLE__
#define __TB_FAKE_PROCESS_HANDLE__

#include "BridgeErrors.hpp"
#include "ProcessHandle.hpp"

namespace tb {
/**
 * A process that only does what the test tells it to.  Output and exit are
 * delivered synchronously on the calling thread.
 */
class FakeProcessHandle : public ProcessHandle {
 public:
  explicit FakeProcessHandle(int64_t _id)
      : id(_id), started(false), killCount(0), failWrites(false) {}

  virtual int64_t getId() const { return id; }
  virtual void start() { started = true; }
  virtual void write(const string& data) {
    lock_guard<mutex> guard(fakeMutex);
    if (failWrites) {
      throw std::runtime_error("Fake process is not accepting input");
    }
    input += data;
  }
  virtual void resize(int columns, int rows) {
    lock_guard<mutex> guard(fakeMutex);
    resizes.push_back(make_pair(columns, rows));
  }
  virtual void kill() { killCount++; }

  void simulateOutput(const string& data) { emitData(data); }
  void simulateExit(int exitCode) { emitExit(exitCode); }

  string getInput() {
    lock_guard<mutex> guard(fakeMutex);
    return input;
  }
  vector<pair<int, int>> getResizes() {
    lock_guard<mutex> guard(fakeMutex);
    return resizes;
  }
  bool isStarted() const { return started; }
  int getKillCount() const { return killCount; }
  void setFailWrites(bool fail) {
    lock_guard<mutex> guard(fakeMutex);
    failWrites = fail;
  }

 protected:
  int64_t id;
  atomic<bool> started;
  atomic<int> killCount;
  mutex fakeMutex;
  string input;
  vector<pair<int, int>> resizes;
  bool failWrites;
};

class FakeProcessSpawner : public ProcessSpawner {
 public:
  FakeProcessSpawner() : nextId(1000), failSpawn(false) {}

  virtual shared_ptr<ProcessHandle> spawn(const ProcessOptions& options) {
    lock_guard<mutex> guard(fakeMutex);
    if (failSpawn) {
      throw SpawnError("Could not execute " + options.file);
    }
    auto process = make_shared<FakeProcessHandle>(nextId++);
    spawned.push_back(process);
    spawnedOptions.push_back(options);
    return process;
  }

  shared_ptr<FakeProcessHandle> getProcess(size_t index) {
    lock_guard<mutex> guard(fakeMutex);
    return spawned.at(index);
  }
  ProcessOptions getOptions(size_t index) {
    lock_guard<mutex> guard(fakeMutex);
    return spawnedOptions.at(index);
  }
  size_t spawnCount() {
    lock_guard<mutex> guard(fakeMutex);
    return spawned.size();
  }
  void setNextId(int64_t id) {
    lock_guard<mutex> guard(fakeMutex);
    nextId = id;
  }
  void setFailSpawn(bool fail) {
    lock_guard<mutex> guard(fakeMutex);
    failSpawn = fail;
  }

 protected:
  mutex fakeMutex;
  int64_t nextId;
  bool failSpawn;
  vector<shared_ptr<FakeProcessHandle>> spawned;
  vector<ProcessOptions> spawnedOptions;
};
}  // namespace tb

#endif  // __TB_FAKE_PROCESS_HANDLE__
