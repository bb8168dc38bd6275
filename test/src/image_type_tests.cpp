// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/image_type.hpp"

// gtest
#include <gtest/gtest.h>

using namespace crashdata;

namespace {

constexpr const char* process_k = "/var/containers/Bundle/Application/ABC/Demo.app/Demo";

} // namespace

TEST(ImageTypeTest, StandardizePath) {
    EXPECT_EQ(standardize_path("/a/./b//c/../d"), "/a/b/d");
    EXPECT_EQ(standardize_path("/private/var/mobile/x"), "/var/mobile/x");
    EXPECT_EQ(standardize_path("/private/tmp"), "/tmp");
    EXPECT_EQ(standardize_path("/private/Users/x"), "/private/Users/x");
    EXPECT_EQ(standardize_path("/private/variable"), "/private/variable");
    EXPECT_EQ(standardize_path("relative/../x"), "x");
    EXPECT_EQ(standardize_path(""), "");
}

TEST(ImageTypeTest, AppBinary) {
    EXPECT_EQ(classify_image(process_k, process_k), image_type::app_binary);
    EXPECT_EQ(classify_image("/var/containers/Bundle/Application/ABC/DEMO.app/Demo", process_k),
              image_type::app_binary);
}

TEST(ImageTypeTest, PrivatePrefixedBinary) {
    // Some OS versions report the image under `/private` while the process path lacks it.
    EXPECT_EQ(classify_image("/private/var/containers/Bundle/Application/ABC/Demo.app/Demo",
                             process_k),
              image_type::app_binary);

    // ...and the other way around.
    EXPECT_EQ(classify_image(process_k,
                             "/private/var/containers/Bundle/Application/ABC/Demo.app/Demo"),
              image_type::app_framework);
}

TEST(ImageTypeTest, AppFramework) {
    EXPECT_EQ(classify_image(
                  "/var/containers/Bundle/Application/ABC/Demo.app/Frameworks/Kit.framework/Kit",
                  process_k),
              image_type::app_framework);
    EXPECT_EQ(classify_image("/var/containers/Bundle/Application/ABC/Demo.app/PlugIns/Ext.appex/Ext",
                             process_k),
              image_type::app_framework);
}

TEST(ImageTypeTest, SwiftRuntimeIsOther) {
    EXPECT_EQ(classify_image(
                  "/var/containers/Bundle/Application/ABC/Demo.app/Frameworks/libswiftCore.dylib",
                  process_k),
              image_type::other);
}

TEST(ImageTypeTest, SystemImagesAreOther) {
    EXPECT_EQ(classify_image("/usr/lib/libobjc.A.dylib", process_k), image_type::other);
    EXPECT_EQ(classify_image("/System/Library/Frameworks/UIKit.framework/UIKit", process_k),
              image_type::other);
    EXPECT_EQ(classify_image("", process_k), image_type::other);
}

TEST(ImageTypeTest, NoProcessPath) {
    // Without a process path nothing is the app binary.
    EXPECT_EQ(classify_image(process_k, ""), image_type::app_framework);
    EXPECT_EQ(classify_image("/usr/lib/libobjc.A.dylib", ""), image_type::other);
}

TEST(ImageTypeTest, ToString) {
    EXPECT_STREQ(to_string(image_type::app_binary), "app");
    EXPECT_STREQ(to_string(image_type::app_framework), "framework");
    EXPECT_STREQ(to_string(image_type::other), "other");
}
