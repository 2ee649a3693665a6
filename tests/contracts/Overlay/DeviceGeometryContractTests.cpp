// Repository: Rewind
// Component: Device Geometry Contract Tests
// Purpose: Verify screen size inference order
// Copyright (c) 2025 Rewind

#include <gtest/gtest.h>

#include "rewind/overlay/DeviceGeometry.hpp"

#include "SessionBuilders.h"

namespace rewindreplay::overlay::testing {
namespace {

using rewindreplay::session::SessionRecord;
using rewindreplay::tests::fixtures::kSessionStartMs;
using rewindreplay::tests::fixtures::MakeEvent;
using rewindreplay::tests::fixtures::MakeTap;
using rewindreplay::tests::fixtures::MakeTouch;
using rewindreplay::tests::fixtures::Point;

TEST(DeviceGeometryTest, DeviceInfoWins) {
  SessionRecord s;
  s.platform = "android";
  s.device_info.screen_width = 1170;
  s.device_info.screen_height = 2532;
  s.events = {MakeTap(kSessionStartMs, 400, 900)};

  ScreenSize size = InferScreenSize(s);

  EXPECT_EQ(size.width, 1170);
  EXPECT_EQ(size.height, 2532);
}

TEST(DeviceGeometryTest, TouchExtentIsScaledAndRoundedUp) {
  SessionRecord s;
  s.events = {
      MakeTap(kSessionStartMs, 123, 80),
      MakeTouch(kSessionStartMs + 10, {Point(20, 456)}),
      MakeEvent("navigation", kSessionStartMs + 20),
  };

  ScreenSize size = InferScreenSize(s);

  EXPECT_EQ(size.width, 136);   // ceil(123 * 1.1)
  EXPECT_EQ(size.height, 502);  // ceil(456 * 1.1)
}

TEST(DeviceGeometryTest, PartialDeviceInfoFallsThrough) {
  SessionRecord s;
  s.platform = "ios";
  s.device_info.screen_width = 390;

  ScreenSize size = InferScreenSize(s);

  EXPECT_EQ(size.width, kDefaultIosScreen.width);
  EXPECT_EQ(size.height, kDefaultIosScreen.height);
}

TEST(DeviceGeometryTest, SmallTouchExtentUsesPlatformDefault) {
  SessionRecord s;
  s.platform = "Android";
  s.events = {MakeTap(kSessionStartMs, 90, 500)};

  ScreenSize size = InferScreenSize(s);

  EXPECT_EQ(size.width, kDefaultAndroidScreen.width);
  EXPECT_EQ(size.height, kDefaultAndroidScreen.height);
}

TEST(DeviceGeometryTest, UnknownPlatformDefaultsToIos) {
  SessionRecord s;
  ScreenSize size = InferScreenSize(s);
  EXPECT_EQ(size.width, 375);
  EXPECT_EQ(size.height, 812);
}

TEST(DeviceGeometryTest, ImplausibleCoordinatesAreIgnoredForExtent) {
  SessionRecord s;
  s.events = {
      MakeTouch(kSessionStartMs, {Point(1e12, 400)}),
      MakeTouch(kSessionStartMs + 10, {Point(123, 456)}),
  };

  ScreenSize size = InferScreenSize(s);

  EXPECT_EQ(size.width, 136);
  EXPECT_EQ(size.height, 502);
}

TEST(DeviceGeometryTest, OnlyImplausibleCoordinatesFallBackToDefault) {
  SessionRecord s;
  s.platform = "android";
  s.events = {MakeTouch(kSessionStartMs, {Point(1e12, 1e12)})};

  ScreenSize size = InferScreenSize(s);

  EXPECT_EQ(size.width, kDefaultAndroidScreen.width);
  EXPECT_EQ(size.height, kDefaultAndroidScreen.height);
  EXPECT_GT(size.width, 0);
}

}  // namespace
}  // namespace rewindreplay::overlay::testing
