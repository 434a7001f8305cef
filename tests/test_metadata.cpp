#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "fsn/diag/event_bus.h"
#include "fsn/error.h"
#include "fsn/node/filesystem.h"
#include "fsn/node/node.h"
#include "memory_adapter.h"
#include "test_support.h"

namespace {

using fsn::ErrorCode;
using fsn::node::Capability;
using fsn::node::CapabilitySet;
using fsn::node::Clock;
using fsn::node::Filesystem;
using fsn::testing::Expect;
using fsn::testing::ExpectError;
using fsn::testing::MemoryAdapter;

void TestFullCapabilities() {
  auto adapter = std::make_shared<MemoryAdapter>();
  adapter->AddFile("/etc/app.conf", "key=value");
  Filesystem fs(adapter, fsn::FilesystemOptions{});
  auto conf = fs.Get("/etc/app.conf");

  Expect(conf.Owner() == 1000 && conf.Group() == 1000, "default ownership");
  Expect(conf.SetOwner(0) && conf.Owner() == 0, "owner updated");
  Expect(conf.SetGroup(42) && conf.Group() == 42, "group updated");
  Expect(conf.Mode() == 0644, "default mode");
  Expect(conf.IsReadable() && conf.IsWritable() && !conf.IsExecutable(), "owner permission bits");
  Expect(conf.SetMode(0755) && conf.IsExecutable(), "mode updated");
  Expect(conf.SetMode(0044) && !conf.IsReadable(), "owner read bit cleared");

  const auto when = Clock::time_point(std::chrono::seconds(1'700'000'000));
  Expect(conf.SetModifyTime(when) && conf.ModifyTime() == when, "modify time");
  Expect(conf.SetAccessTime(when + std::chrono::seconds(5)) &&
             conf.AccessTime() == when + std::chrono::seconds(5),
         "access time");
  (void)conf.CreationTime();
  Expect(conf.Size() == 9, "size");

  ExpectError(ErrorCode::kNotFound, [&] { (void)fs.Get("/etc/none").SetMode(0600); },
              "setter on a missing node still reports NotFound");
}

void TestTouch() {
  auto adapter = std::make_shared<MemoryAdapter>();
  Filesystem fs(adapter, fsn::FilesystemOptions{});
  auto stamp = fs.Get("/var/run/app.stamp");

  const auto when = Clock::time_point(std::chrono::seconds(1'600'000'000));
  ExpectError(ErrorCode::kNotFound, [&] { (void)stamp.Touch(when); }, "touch without parents");
  Expect(stamp.Touch(when, std::nullopt, true), "touch creates the file and parents");
  Expect(stamp.IsFile() && stamp.Size() == 0, "touched file is empty");
  Expect(stamp.ModifyTime() == when && stamp.AccessTime() == when, "access time defaults to modify time");

  stamp.Write("data");
  Expect(stamp.Touch(), "touch an existing file");
  Expect(stamp.ReadString() == "data", "touch keeps content");
  Expect(stamp.ModifyTime() > when, "touch defaults to now");
}

void TestMissingCapabilities() {
  auto adapter = std::make_shared<MemoryAdapter>(CapabilitySet{Capability::kLinks});
  adapter->AddFile("/plain.txt", "abc");
  Filesystem fs(adapter, fsn::FilesystemOptions{});
  auto plain = fs.Get("/plain.txt");

  int unsupported_events = 0;
  fsn::diag::EventBus::Instance().Subscribe([&](const fsn::diag::Event& event) {
    if (event.event_id == "metadata_unsupported") {
      ++unsupported_events;
    }
  });

  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.Owner(); }, "owner unsupported");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.Group(); }, "group unsupported");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.Mode(); }, "mode unsupported");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.IsReadable(); }, "permission bits need mode");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.AccessTime(); }, "access time unsupported");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.ModifyTime(); }, "modify time unsupported");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.CreationTime(); }, "creation time unsupported");
  ExpectError(ErrorCode::kUnsupported, [&] { (void)plain.RealUrl(); }, "url unsupported");

  Expect(!plain.SetOwner(0), "owner setter returns false");
  Expect(!plain.SetMode(0600), "mode setter returns false");
  Expect(!plain.SetModifyTime(Clock::now()), "time setter returns false");
  Expect(unsupported_events == 3, "each skipped update is published");
  Expect(!plain.Touch(), "touch reports that times were not applied");
  Expect(plain.Size() == 3, "size needs no capability");

  fsn::diag::EventBus::Instance().ClearSubscribers();
}

void TestBackendRejectsAdvertisedCapability() {
  auto adapter = std::make_shared<MemoryAdapter>();
  adapter->AddFile("/ro.txt");
  adapter->RejectMetadataUpdates(true);
  Filesystem fs(adapter, fsn::FilesystemOptions{});
  Expect(!fs.Get("/ro.txt").SetMode(0600), "backend Unsupported becomes false");
  Expect(fs.Get("/ro.txt").Mode() == 0644, "mode untouched");
}

}  // namespace

int main() {
  fsn::diag::EventBus::Instance().ClearSubscribers();
  TestFullCapabilities();
  TestTouch();
  TestMissingCapabilities();
  TestBackendRejectsAdvertisedCapability();
  std::cout << "metadata tests ok\n";
  return 0;
}
