// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "power_manager/daemon/power_manager_adaptor.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <base/functional/bind.h>
#include <base/test/task_environment.h>
#include <brillo/dbus/async_event_sequencer.h>
#include <brillo/dbus/data_serialization.h>
#include <cros_config/fake_cros_config.h>
#include <dbus/message.h>
#include <dbus/mock_bus.h>
#include <dbus/mock_exported_object.h>
#include <dbus/object_path.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "power_manager/daemon/dbus_constants.h"
#include "power_manager/fake_battery_source.h"
#include "power_manager/fake_boot_animation_monitor.h"
#include "power_manager/fake_display_sink.h"
#include "power_manager/fake_settings_source.h"
#include "power_manager/mock_lights.h"
#include "power_manager/mock_suspend_inhibitor_backend.h"
#include "power_manager/power_settings.h"

namespace power_manager {
namespace {

using brillo::dbus_utils::AppendValueToWriter;
using testing::_;
using testing::AnyNumber;
using testing::Invoke;
using testing::NiceMock;

constexpr char kClientConnectionName[] = ":1.33";
constexpr int32_t kAppUid = 10001;
constexpr int32_t kAppPid = 2345;
constexpr int32_t kUserSleepReason =
    static_cast<int32_t>(GoToSleepReason::kUser);

class PowerManagerAdaptorTest : public testing::Test {
 public:
  PowerManagerAdaptorTest() {
    dbus::Bus::Options options;
    options.bus_type = dbus::Bus::SYSTEM;
    bus_ = new dbus::MockBus(options);
    exported_object_ = new dbus::MockExportedObject(
        bus_.get(), dbus::ObjectPath(kPowerManagerServicePath));
    ON_CALL(*bus_, GetExportedObject(_))
        .WillByDefault(testing::Return(exported_object_.get()));
    ON_CALL(*exported_object_, ExportMethod)
        .WillByDefault(Invoke(this, &PowerManagerAdaptorTest::ExportMethod));
    ON_CALL(*exported_object_, ExportMethodAndBlock)
        .WillByDefault(
            Invoke(this, &PowerManagerAdaptorTest::ExportMethodAndBlock));
    EXPECT_CALL(*exported_object_, SendSignal(_))
        .Times(AnyNumber())
        .WillRepeatedly(Invoke([this](dbus::Signal* signal) {
          sent_signals_.push_back(signal->GetMember());
        }));

    settings_.SetString(kStayOnWhilePluggedInSetting, "0");

    PowerStateEngine::Collaborators collaborators;
    collaborators.cros_config = &cros_config_;
    collaborators.task_runner = task_environment_.GetMainThreadTaskRunner();
    collaborators.clock = task_environment_.GetMockTickClock();
    collaborators.display_sink = &display_sink_;
    collaborators.battery = &battery_;
    collaborators.settings = &settings_;
    collaborators.lights = &lights_;
    collaborators.boot_animation_monitor = &boot_animation_monitor_;
    collaborators.suspend_backend = &suspend_backend_;
    collaborators.notifier = &notifier_;
    engine_ = std::make_unique<PowerStateEngine>(collaborators);
    engine_->Init();

    adaptor_ = std::make_unique<PowerManagerAdaptor>(bus_, engine_.get(),
                                                     &notifier_, &watcher_);
    auto sequencer =
        base::MakeRefCounted<brillo::dbus_utils::AsyncEventSequencer>();
    adaptor_->RegisterAsync(
        sequencer->GetHandler("Failed to register PowerManager", false));
    task_environment_.RunUntilIdle();
  }
  PowerManagerAdaptorTest(const PowerManagerAdaptorTest&) = delete;
  PowerManagerAdaptorTest& operator=(const PowerManagerAdaptorTest&) = delete;

  ~PowerManagerAdaptorTest() override {
    adaptor_.reset();
    engine_.reset();
  }

 protected:
  MOCK_METHOD(void,
              ResponseSender,
              (std::unique_ptr<dbus::Response> response),
              ());

  // Brings the engine to the booted state and moves the clock past the boot
  // time so that whole-millisecond event times are not stale.
  void Boot() {
    ASSERT_TRUE(engine_->SystemReady(nullptr));
    ASSERT_TRUE(engine_->OnBootCompleted(nullptr));
    task_environment_.FastForwardBy(base::Seconds(1));
  }

  int64_t NowMs() {
    return (task_environment_.NowTicks() - base::TimeTicks()).InMilliseconds();
  }

  std::unique_ptr<dbus::Response> CallMethod(dbus::MethodCall* method_call) {
    const std::string full_name =
        method_call->GetInterface() + "." + method_call->GetMember();

    std::unique_ptr<dbus::Response> response;
    EXPECT_CALL(*this, ResponseSender)
        .WillOnce([&response](std::unique_ptr<dbus::Response> result) {
          response = std::move(result);
        });
    auto response_sender = base::BindOnce(
        &PowerManagerAdaptorTest::ResponseSender, base::Unretained(this));
    method_call->SetSerial(1);
    method_call->SetSender(kClientConnectionName);

    auto iter = method_callbacks_.find(full_name);
    EXPECT_TRUE(iter != method_callbacks_.end()) << full_name;
    if (iter == method_callbacks_.end())
      return nullptr;
    iter->second.Run(method_call, std::move(response_sender));
    return response;
  }

  std::unique_ptr<dbus::Response> AcquireWakeLock(
      const std::string& handle,
      const std::vector<int32_t>& work_source_uids,
      const std::vector<std::string>& work_source_names) {
    dbus::MethodCall call(kPowerManagerInterface, kAcquireWakeLockMethod);
    dbus::MessageWriter writer(&call);
    writer.AppendString(handle);
    writer.AppendUint32(static_cast<uint32_t>(WakeLockLevel::kPartial));
    writer.AppendString("tag");
    writer.AppendString("com.example.app");
    AppendValueToWriter(&writer, work_source_uids);
    AppendValueToWriter(&writer, work_source_names);
    writer.AppendInt32(kAppUid);
    writer.AppendInt32(kAppPid);
    return CallMethod(&call);
  }

  std::unique_ptr<dbus::Response> CallWithTime(const char* method,
                                               int64_t event_time_ms) {
    dbus::MethodCall call(kPowerManagerInterface, method);
    dbus::MessageWriter writer(&call);
    writer.AppendInt64(event_time_ms);
    writer.AppendInt32(kAppUid);
    writer.AppendInt32(kAppPid);
    writer.AppendString("com.example.app");
    return CallMethod(&call);
  }

  std::unique_ptr<dbus::Response> GoToSleep(int64_t event_time_ms,
                                            int32_t reason) {
    dbus::MethodCall call(kPowerManagerInterface, kGoToSleepMethod);
    dbus::MessageWriter writer(&call);
    writer.AppendInt64(event_time_ms);
    writer.AppendInt32(reason);
    return CallMethod(&call);
  }

  static bool IsError(const std::unique_ptr<dbus::Response>& response) {
    return response &&
           response->GetMessageType() == dbus::Message::MESSAGE_ERROR;
  }

  static bool IsSuccess(const std::unique_ptr<dbus::Response>& response) {
    return response &&
           response->GetMessageType() == dbus::Message::MESSAGE_METHOD_RETURN;
  }

  base::test::SingleThreadTaskEnvironment task_environment_{
      base::test::TaskEnvironment::TimeSource::MOCK_TIME};
  scoped_refptr<dbus::MockBus> bus_;
  scoped_refptr<dbus::MockExportedObject> exported_object_;
  std::vector<std::string> sent_signals_;

  brillo::FakeCrosConfig cros_config_;
  FakeDisplaySink display_sink_;
  FakeBatterySource battery_;
  FakeSettingsSource settings_;
  NiceMock<MockLights> lights_;
  FakeBootAnimationMonitor boot_animation_monitor_;
  NiceMock<MockSuspendInhibitorBackend> suspend_backend_;
  Notifier notifier_{task_environment_.GetMainThreadTaskRunner()};
  DBusOwnerWatcher watcher_;
  std::unique_ptr<PowerStateEngine> engine_;
  std::unique_ptr<PowerManagerAdaptor> adaptor_;

 private:
  void ExportMethod(
      const std::string& interface_name,
      const std::string& method_name,
      const dbus::ExportedObject::MethodCallCallback& method_call_callback,
      dbus::ExportedObject::OnExportedCallback on_exported_callback) {
    method_callbacks_[interface_name + "." + method_name] =
        method_call_callback;
    task_environment_.GetMainThreadTaskRunner()->PostTask(
        FROM_HERE, base::BindOnce(std::move(on_exported_callback),
                                  interface_name, method_name, true));
  }

  bool ExportMethodAndBlock(
      const std::string& interface_name,
      const std::string& method_name,
      const dbus::ExportedObject::MethodCallCallback& method_call_callback) {
    method_callbacks_[interface_name + "." + method_name] =
        method_call_callback;
    return true;
  }

  std::map<std::string, dbus::ExportedObject::MethodCallCallback>
      method_callbacks_;
};

TEST_F(PowerManagerAdaptorTest, AcquireWakeLockChecksWorkSource) {
  Boot();
  EXPECT_TRUE(IsError(AcquireWakeLock("bad", {kAppUid, kAppUid + 1}, {"a"})));
  EXPECT_EQ(engine_->GetWakeLockSummaryForTesting() & kWakeLockCpu, 0);

  // Names are optional, but when present there is one per uid.
  EXPECT_TRUE(IsSuccess(AcquireWakeLock("no-names", {kAppUid}, {})));
  EXPECT_TRUE(
      IsSuccess(AcquireWakeLock("named", {kAppUid, kAppUid + 1}, {"a", "b"})));
  EXPECT_NE(engine_->GetWakeLockSummaryForTesting() & kWakeLockCpu, 0);
  EXPECT_THAT(engine_->Dump(), testing::HasSubstr("Wake Locks: size=2"));
}

TEST_F(PowerManagerAdaptorTest, UserActivityRejectsUnknownEvents) {
  Boot();
  const int32_t kInvalidEvents[] = {
      -1, static_cast<int32_t>(UserActivityEvent::kTouch) + 1};
  for (int32_t event : kInvalidEvents) {
    dbus::MethodCall call(kPowerManagerInterface, kUserActivityMethod);
    dbus::MessageWriter writer(&call);
    writer.AppendInt64(NowMs());
    writer.AppendInt32(event);
    writer.AppendUint32(0);
    writer.AppendInt32(kAppUid);
    EXPECT_TRUE(IsError(CallMethod(&call))) << event;
  }

  dbus::MethodCall call(kPowerManagerInterface, kUserActivityMethod);
  dbus::MessageWriter writer(&call);
  writer.AppendInt64(NowMs());
  writer.AppendInt32(static_cast<int32_t>(UserActivityEvent::kTouch));
  writer.AppendUint32(0);
  writer.AppendInt32(kAppUid);
  EXPECT_TRUE(IsSuccess(CallMethod(&call)));
}

TEST_F(PowerManagerAdaptorTest, GoToSleepRejectsUnknownReasons) {
  Boot();
  EXPECT_TRUE(IsError(GoToSleep(NowMs(), -1)));
  EXPECT_TRUE(IsError(
      GoToSleep(NowMs(), static_cast<int32_t>(GoToSleepReason::kTimeout) + 1)));
  EXPECT_EQ(engine_->GetWakefulness(), Wakefulness::kAwake);

  EXPECT_TRUE(
      IsSuccess(GoToSleep(NowMs(), kUserSleepReason)));
  EXPECT_EQ(engine_->GetWakefulness(), Wakefulness::kAsleep);
}

TEST_F(PowerManagerAdaptorTest, EventTimesAreMonotonicMilliseconds) {
  Boot();
  ASSERT_TRUE(
      IsSuccess(GoToSleep(NowMs(), kUserSleepReason)));
  task_environment_.FastForwardBy(base::Seconds(1));

  // A time in the future is rejected.
  EXPECT_TRUE(IsError(CallWithTime(kWakeUpMethod, NowMs() + 1000)));
  EXPECT_EQ(engine_->GetWakefulness(), Wakefulness::kAsleep);

  // A time from before the device went to sleep is stale.
  EXPECT_TRUE(IsSuccess(CallWithTime(kWakeUpMethod, NowMs() - 2000)));
  EXPECT_EQ(engine_->GetWakefulness(), Wakefulness::kAsleep);

  EXPECT_TRUE(IsSuccess(CallWithTime(kWakeUpMethod, NowMs())));
  EXPECT_EQ(engine_->GetWakefulness(), Wakefulness::kAwake);
}

TEST_F(PowerManagerAdaptorTest, WakeUpWithProximityCheck) {
  Boot();
  ASSERT_TRUE(
      IsSuccess(GoToSleep(NowMs(), kUserSleepReason)));
  task_environment_.FastForwardBy(base::Seconds(1));

  EXPECT_TRUE(IsError(
      CallWithTime(kWakeUpWithProximityCheckMethod, NowMs() + 1000)));
  // Without a proximity sensor this is a plain wake-up.
  EXPECT_TRUE(
      IsSuccess(CallWithTime(kWakeUpWithProximityCheckMethod, NowMs())));
  EXPECT_EQ(engine_->GetWakefulness(), Wakefulness::kAwake);
}

TEST_F(PowerManagerAdaptorTest, SetKeyboardLight) {
  Boot();
  EXPECT_CALL(lights_, SetBrightness(LightId::kCaps, kMaxBrightness));
  {
    dbus::MethodCall call(kPowerManagerInterface, kSetKeyboardLightMethod);
    dbus::MessageWriter writer(&call);
    writer.AppendBool(true);
    writer.AppendInt32(kKeyboardLightCaps);
    EXPECT_TRUE(IsSuccess(CallMethod(&call)));
  }
  {
    dbus::MethodCall call(kPowerManagerInterface, kSetKeyboardLightMethod);
    dbus::MessageWriter writer(&call);
    writer.AppendBool(true);
    writer.AppendInt32(0);
    EXPECT_TRUE(IsError(CallMethod(&call)));
  }
  task_environment_.RunUntilIdle();
}

TEST_F(PowerManagerAdaptorTest, PowerEventsBecomeSignals) {
  Boot();
  task_environment_.RunUntilIdle();
  sent_signals_.clear();

  ASSERT_TRUE(IsSuccess(AcquireWakeLock("lock", {}, {})));
  ASSERT_TRUE(
      IsSuccess(GoToSleep(NowMs(), kUserSleepReason)));
  // Signals are sent from the D-Bus sequence, not from the caller.
  EXPECT_TRUE(sent_signals_.empty());

  task_environment_.RunUntilIdle();
  EXPECT_THAT(sent_signals_, testing::IsSupersetOf(
                                 {std::string(kWakeLockAcquiredSignal),
                                  std::string(kGoToSleepStartedSignal),
                                  std::string(kGoToSleepFinishedSignal)}));
}

TEST_F(PowerManagerAdaptorTest, NoSignalsAfterDestruction) {
  Boot();
  task_environment_.RunUntilIdle();
  sent_signals_.clear();

  ASSERT_TRUE(IsSuccess(AcquireWakeLock("lock", {}, {})));
  adaptor_.reset();
  task_environment_.RunUntilIdle();
  EXPECT_TRUE(sent_signals_.empty());
}

}  // namespace
}  // namespace power_manager
