#include "input_handler.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "teleop_fakes.h"

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class InputHandlerFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    link_.connect();
    channel_.open();
  }

  void expectAxesUntouched() {
    for (int i = 0; i < kAxisCount; ++i) {
      EXPECT_EQ(axes_.get(static_cast<Axis>(i)), 0.0);
    }
  }

  FakeVehicleLink link_;
  CommandChannel channel_{link_};
  AxisState axes_;
  InputHandler handler_{axes_, channel_};
};

TEST_F(InputHandlerFixture, AxisEventsOnlyUpdateState) {
  handler_(AxisChanged{Axis::LeftX, -1200.0});
  handler_(AxisChanged{Axis::RightY, 32767.0});

  EXPECT_EQ(axes_.get(Axis::LeftX), -1200.0);
  EXPECT_EQ(axes_.get(Axis::RightY), 32767.0);
  EXPECT_THAT(link_.commands(), IsEmpty());
}

TEST_F(InputHandlerFixture, SquareStops) {
  handler_(ButtonPressed{Button::Square});
  EXPECT_THAT(link_.commands(), ElementsAre(MotionCommand::oneShot(MotionKind::Stop)));
  expectAxesUntouched();
}

TEST_F(InputHandlerFixture, CrossLands) {
  handler_(ButtonPressed{Button::Cross});
  EXPECT_THAT(link_.commands(), ElementsAre(MotionCommand::oneShot(MotionKind::Land)));
  expectAxesUntouched();
}

TEST_F(InputHandlerFixture, TriangleTakesOffWithProtectionEnabled) {
  handler_(ButtonPressed{Button::Triangle});
  EXPECT_THAT(link_.commands(), ElementsAre(MotionCommand::oneShot(MotionKind::EnableProtection),
                                            MotionCommand::oneShot(MotionKind::TakeOff)));
  expectAxesUntouched();
}

TEST_F(InputHandlerFixture, EachPressIsOneAction) {
  handler_(ButtonPressed{Button::Cross});
  handler_(ButtonPressed{Button::Cross});
  handler_(ButtonPressed{Button::Square});
  EXPECT_THAT(link_.commands(), ElementsAre(MotionCommand::oneShot(MotionKind::Land),
                                            MotionCommand::oneShot(MotionKind::Land),
                                            MotionCommand::oneShot(MotionKind::Stop)));
}

TEST_F(InputHandlerFixture, UnassignedButtonsDoNothing) {
  handler_(ButtonPressed{Button::Circle});
  handler_(ButtonPressed{Button::Start});
  EXPECT_THAT(link_.commands(), IsEmpty());
  expectAxesUntouched();
}

TEST_F(InputHandlerFixture, ButtonsAreDroppedOnceChannelCloses) {
  channel_.close();
  handler_(ButtonPressed{Button::Cross});
  EXPECT_THAT(link_.commands(), IsEmpty());
  EXPECT_EQ(channel_.sent(), 0u);
}

// ===================== Command channel =====================

TEST(CommandChannelTest, DropsCommandsUntilOpened) {
  FakeVehicleLink link;
  link.connect();
  CommandChannel ch(link);

  EXPECT_FALSE(ch.send(MotionCommand::oneShot(MotionKind::Land)));
  ch.open();
  EXPECT_TRUE(ch.send(MotionCommand::oneShot(MotionKind::Land)));
  EXPECT_EQ(ch.sent(), 1u);
  EXPECT_EQ(link.count(), 1u);
}

TEST(CommandChannelTest, LinkFailureClosesChannelAndReportsOnce) {
  FakeVehicleLink link;
  link.connect();
  CommandChannel ch(link);
  int faults = 0;
  std::string reason;
  ch.setFaultHandler([&](const std::string& r) {
    ++faults;
    reason = r;
  });
  ch.open();

  link.fail_send.store(true);
  EXPECT_FALSE(ch.send(MotionCommand::move(MotionKind::Forward, 10)));
  EXPECT_FALSE(ch.isOpen());

  link.fail_send.store(false);
  EXPECT_FALSE(ch.send(MotionCommand::move(MotionKind::Forward, 10)));
  EXPECT_EQ(faults, 1);
  EXPECT_EQ(reason, "fake link dropped");
  EXPECT_EQ(link.count(), 0u);
}

TEST_F(InputHandlerFixture, AxisEventsNeverWaitOnAHungLink) {
  link_.hold.store(true);
  std::thread presser([this] { handler_(ButtonPressed{Button::Square}); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  // The press is stuck inside send(); stick updates still go through.
  handler_(AxisChanged{Axis::LeftY, -32767.0});
  EXPECT_EQ(axes_.get(Axis::LeftY), -32767.0);
  EXPECT_EQ(channel_.sent(), 0u);

  link_.hold.store(false);
  presser.join();
  EXPECT_THAT(link_.commands(), ElementsAre(MotionCommand::oneShot(MotionKind::Stop)));
}
