/**
 * @file test_frontend_config.cpp
 * @brief Command line parsing and derived frontend settings.
 */

#include <gtest/gtest.h>
#include <chip8/frontend_config.h>

#include <string_view>
#include <vector>

using namespace chip8;

namespace {

Result<FrontendConfig> parse(std::vector<std::string_view> args) {
    return parse_args(std::span<const std::string_view>(args));
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Value Parsers
// ─────────────────────────────────────────────────────────────────────────────

TEST(ScreenSizeTest, ParseNames) {
    EXPECT_EQ(parse_screen_size("small"), ScreenSize::Small);
    EXPECT_EQ(parse_screen_size("medium"), ScreenSize::Medium);
    EXPECT_EQ(parse_screen_size("large"), ScreenSize::Large);
    EXPECT_FALSE(parse_screen_size("huge").has_value());
    EXPECT_FALSE(parse_screen_size("Small").has_value());
}

TEST(ScreenSizeTest, Scale) {
    EXPECT_EQ(pixel_scale(ScreenSize::Small), 10u);
    EXPECT_EQ(pixel_scale(ScreenSize::Medium), 12u);
    EXPECT_EQ(pixel_scale(ScreenSize::Large), 16u);
    EXPECT_STREQ(to_string(ScreenSize::Medium), "medium");
}

TEST(RgbTest, ParseValid) {
    auto rgb = parse_rgb("12,0,255");
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(*rgb, (Rgb{12, 0, 255}));
}

TEST(RgbTest, ParseInvalid) {
    EXPECT_FALSE(parse_rgb("").has_value());
    EXPECT_FALSE(parse_rgb("1,2").has_value());
    EXPECT_FALSE(parse_rgb("1,2,3,4").has_value());
    EXPECT_FALSE(parse_rgb("1,2,256").has_value());
    EXPECT_FALSE(parse_rgb("1,,3").has_value());
    EXPECT_FALSE(parse_rgb("a,b,c").has_value());
    EXPECT_FALSE(parse_rgb("1, 2,3").has_value());
    EXPECT_FALSE(parse_rgb("-1,2,3").has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Argument Parsing
// ─────────────────────────────────────────────────────────────────────────────

TEST(ParseArgsTest, RomOnlyUsesDefaults) {
    auto config = parse({"pong.ch8"});
    ASSERT_TRUE(config.has_value()) << config.error().message();
    EXPECT_EQ(config->rom_path, "pong.ch8");
    EXPECT_EQ(config->screen_size, ScreenSize::Small);
    EXPECT_EQ(config->frequency_hz, DEFAULT_FREQUENCY_HZ);
    EXPECT_FALSE(config->debug);
    EXPECT_FALSE(config->chip48);
    EXPECT_EQ(config->foreground, DEFAULT_FOREGROUND);
    EXPECT_EQ(config->background, DEFAULT_BACKGROUND);
}

TEST(ParseArgsTest, AllOptions) {
    auto config = parse({"-s", "large", "-f", "1000", "-d", "-c",
        "--foreground-color", "255,255,255", "--background-color", "10,20,30", "game.ch8"});
    ASSERT_TRUE(config.has_value()) << config.error().message();
    EXPECT_EQ(config->screen_size, ScreenSize::Large);
    EXPECT_EQ(config->frequency_hz, 1000u);
    EXPECT_TRUE(config->debug);
    EXPECT_TRUE(config->chip48);
    EXPECT_EQ(config->foreground, (Rgb{255, 255, 255}));
    EXPECT_EQ(config->background, (Rgb{10, 20, 30}));
    EXPECT_EQ(config->rom_path, "game.ch8");
}

TEST(ParseArgsTest, LongOptionsWithEquals) {
    auto config = parse({"--screen-size=medium", "--interpreter-frequency=200",
        "--chip-48-mode", "--debug", "rom"});
    ASSERT_TRUE(config.has_value()) << config.error().message();
    EXPECT_EQ(config->screen_size, ScreenSize::Medium);
    EXPECT_EQ(config->frequency_hz, 200u);
    EXPECT_TRUE(config->chip48);
    EXPECT_TRUE(config->debug);
}

TEST(ParseArgsTest, RomMayPrecedeOptions) {
    auto config = parse({"rom.ch8", "-s", "medium"});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rom_path, "rom.ch8");
    EXPECT_EQ(config->screen_size, ScreenSize::Medium);
}

TEST(ParseArgsTest, MissingRom) {
    auto config = parse({"-d"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(config.error().message(), "missing ROM path");
}

TEST(ParseArgsTest, HelpAndVersionNeedNoRom) {
    auto help = parse({"--help"});
    ASSERT_TRUE(help.has_value());
    EXPECT_TRUE(help->show_help);

    auto version = parse({"-V"});
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version->show_version);
}

TEST(ParseArgsTest, SecondRomRejected) {
    auto config = parse({"a.ch8", "b.ch8"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidArgument);
}

TEST(ParseArgsTest, UnknownOption) {
    auto config = parse({"--turbo", "rom"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(config.error().message(), "unknown option '--turbo'");
}

TEST(ParseArgsTest, OptionMissingValue) {
    auto config = parse({"rom", "-f"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(config.error().message(), "option '-f' requires a value");
}

TEST(ParseArgsTest, FrequencyOutOfRange) {
    for (std::string_view hz : {"199", "1001", "0"}) {
        auto config = parse({"-f", hz, "rom"});
        ASSERT_FALSE(config.has_value()) << hz;
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigValueInvalid);
        EXPECT_NE(config.error().message().find("--interpreter-frequency"), std::string::npos);
    }
}

TEST(ParseArgsTest, FrequencyNotANumber) {
    auto config = parse({"-f", "fast", "rom"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::ConfigValueInvalid);
}

TEST(ParseArgsTest, BadScreenSize) {
    auto config = parse({"-s", "tiny", "rom"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::ConfigValueInvalid);
    EXPECT_NE(config.error().message().find("'tiny'"), std::string::npos);
}

TEST(ParseArgsTest, BadColor) {
    auto config = parse({"--background-color=300,0,0", "rom"});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::ConfigValueInvalid);
    EXPECT_NE(config.error().message().find("--background-color"), std::string::npos);
}

TEST(ParseArgsTest, ArgvSkipsProgramName) {
    const char* argv[] = {"chip8", "-c", "rom.ch8"};
    auto config = parse_args(3, argv);
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->chip48);
    EXPECT_EQ(config->rom_path, "rom.ch8");
}

// ─────────────────────────────────────────────────────────────────────────────
// Derived Settings
// ─────────────────────────────────────────────────────────────────────────────

TEST(FrontendConfigTest, InstructionsPerTick) {
    FrontendConfig config;
    EXPECT_EQ(config.instructions_per_tick(), 4u);
    config.frequency_hz = MIN_FREQUENCY_HZ;
    EXPECT_EQ(config.instructions_per_tick(), 1u);
    config.frequency_hz = MAX_FREQUENCY_HZ;
    EXPECT_EQ(config.instructions_per_tick(), 8u);
}

TEST(FrontendConfigTest, MachineConfigFollowsOptions) {
    FrontendConfig config;
    config.chip48 = true;
    config.frequency_hz = 1000;
    const MachineConfig machine = config.machine_config();
    EXPECT_EQ(machine.mode, Mode::Chip48);
    EXPECT_EQ(machine.cycles_per_tick, 8u);
    EXPECT_TRUE(machine.validate().has_value());
}

TEST(FrontendConfigTest, UsageListsKeysAndOptions) {
    const std::string text = usage("chip8");
    EXPECT_NE(text.find("Usage: chip8 [OPTIONS] <ROM>"), std::string::npos);
    EXPECT_NE(text.find("--interpreter-frequency"), std::string::npos);
    EXPECT_NE(text.find("|Z|X|C|V|"), std::string::npos);
    EXPECT_NE(text.find("PageDown"), std::string::npos);
}
