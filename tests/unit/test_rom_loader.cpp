/**
 * @file test_rom_loader.cpp
 * @brief ROM file reading.
 */

#include <gtest/gtest.h>
#include <chip8/memory.h>
#include <chip8/rom_loader.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace chip8;

class RomLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("chip8_rom_loader_") + info->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::vector<uint8_t>& bytes) {
        const auto path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return path;
    }

    std::filesystem::path dir;
};

TEST_F(RomLoaderTest, ReadsWholeFile) {
    const std::vector<uint8_t> bytes = {0x00, 0xE0, 0xA2, 0x2A, 0xFF};
    auto image = load_rom_file(write_file("small.ch8", bytes));
    ASSERT_TRUE(image.has_value()) << image.error().message();
    EXPECT_EQ(*image, bytes);
}

TEST_F(RomLoaderTest, EmptyFileIsEmptyImage) {
    auto image = load_rom_file(write_file("empty.ch8", {}));
    ASSERT_TRUE(image.has_value());
    EXPECT_TRUE(image->empty());
}

TEST_F(RomLoaderTest, MaximumSizeAccepted) {
    const std::vector<uint8_t> bytes(MAX_ROM_SIZE, 0x12);
    auto image = load_rom_file(write_file("max.ch8", bytes));
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->size(), MAX_ROM_SIZE);
}

TEST_F(RomLoaderTest, OversizedRejected) {
    const std::vector<uint8_t> bytes(MAX_ROM_SIZE + 1, 0x12);
    auto image = load_rom_file(write_file("big.ch8", bytes));
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code(), ErrorCode::RomTooLarge);
}

TEST_F(RomLoaderTest, MissingFile) {
    auto image = load_rom_file(dir / "absent.ch8");
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code(), ErrorCode::FileNotFound);
    EXPECT_NE(image.error().message().find("absent.ch8"), std::string::npos);
}

TEST_F(RomLoaderTest, DirectoryIsNotARom) {
    auto image = load_rom_file(dir);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code(), ErrorCode::FileNotFound);
}
