// =============================================================================
// Unit tests for AppCatalog (src/agent/app_catalog.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "agent/app_catalog.hpp"

using namespace droidpilot::agent;

TEST(AppCatalogTest, BuiltInNames) {
    AppCatalog apps;
    EXPECT_GT(apps.size(), 0u);
    EXPECT_EQ(apps.resolve("Settings"), std::optional<std::string>("com.android.settings"));
    EXPECT_EQ(apps.resolve("  wechat "), std::optional<std::string>("com.tencent.mm"));
    EXPECT_EQ(apps.resolve("微信"), std::optional<std::string>("com.tencent.mm"));
}

TEST(AppCatalogTest, UnknownName) {
    AppCatalog apps;
    EXPECT_FALSE(apps.resolve("No Such App").has_value());
    EXPECT_FALSE(apps.resolve("").has_value());
}

TEST(AppCatalogTest, PackageIdPassesThrough) {
    AppCatalog apps;
    EXPECT_EQ(apps.resolve("com.example.notes"), std::optional<std::string>("com.example.notes"));
    EXPECT_FALSE(apps.resolve("com.").has_value());
}

TEST(AppCatalogTest, AddOverridesBuiltIn) {
    AppCatalog apps;
    const size_t before = apps.size();
    apps.addAll({{"Settings", "org.custom.settings"}, {"Notes", "com.example.notes"}});

    EXPECT_EQ(apps.size(), before + 1);
    EXPECT_EQ(apps.resolve("settings"), std::optional<std::string>("org.custom.settings"));
    EXPECT_EQ(apps.resolve("NOTES"), std::optional<std::string>("com.example.notes"));
}

TEST(AppCatalogTest, AddIgnoresEmpty) {
    AppCatalog apps;
    const size_t before = apps.size();
    apps.add("", "com.example.x");
    apps.add("x", "");
    EXPECT_EQ(apps.size(), before);
}

TEST(AppCatalogTest, LooksLikePackage) {
    EXPECT_TRUE(AppCatalog::looksLikePackage("com.android.chrome"));
    EXPECT_FALSE(AppCatalog::looksLikePackage("Chrome"));
    EXPECT_FALSE(AppCatalog::looksLikePackage("my app.x"));
    EXPECT_FALSE(AppCatalog::looksLikePackage(".hidden"));
    EXPECT_FALSE(AppCatalog::looksLikePackage(""));
}
