//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "pbr/utils/json_utils.hpp"
#include <fstream>
#include <filesystem>

using namespace pbr;
using namespace pbr::json_utils;
namespace fs = std::filesystem;

class JsonUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "pbr_json_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    [[nodiscard]] fs::path create_json_file(const std::string& filename, const std::string& content) const
    {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path;
    }

    fs::path temp_dir;
};

TEST_F(JsonUtilsTest, Parse_SimpleObject) {
    const auto result = parse(R"({"operation": "config_load", "duration_ns": 1000})");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()["operation"], "config_load");
}

TEST_F(JsonUtilsTest, Parse_Invalid) {
    const auto result = parse("{invalid json}");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(JsonUtilsTest, ReadFile_Valid) {
    const auto path = create_json_file("valid.json", R"([1, 2, 3])");

    const auto result = read_file(path);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 3u);
}

TEST_F(JsonUtilsTest, ReadFile_NonExistent) {
    const auto result = read_file(temp_dir / "nonexistent.json");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(JsonUtilsTest, ReadFile_Malformed) {
    const auto path = create_json_file("malformed.json", "{\"a\": ");

    const auto result = read_file(path);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    EXPECT_NE(result.error().context().value_or("").find("malformed.json"), std::string::npos);
}

TEST_F(JsonUtilsTest, WriteFile_CreatesParentDirectories) {
    const auto path = temp_dir / "nested" / "out" / "results.json";

    ASSERT_TRUE(write_file(path, json{{"total", 2}}).is_ok());

    const auto reread = read_file(path);
    ASSERT_TRUE(reread.is_ok());
    EXPECT_EQ(reread.value()["total"], 2);
}

TEST_F(JsonUtilsTest, WriteFile_InvalidUtf8) {
    const auto result = write_file(temp_dir / "bad.json", json{{"operation", std::string("\xff")}});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::InternalError);
}

TEST_F(JsonUtilsTest, GetOr_Present) {
    const json obj{{"priority", "P0"}};
    EXPECT_EQ(get_or<std::string>(obj, "priority", "P2"), "P0");
}

TEST_F(JsonUtilsTest, GetOr_Missing) {
    const json obj = json::object();
    EXPECT_EQ(get_or<std::string>(obj, "priority", "P2"), "P2");
}

TEST_F(JsonUtilsTest, GetOr_WrongType) {
    const json obj{{"priority", 0}};
    EXPECT_EQ(get_or<std::string>(obj, "priority", "P2"), "P2");
}

TEST_F(JsonUtilsTest, GetOr_NotAnObject) {
    EXPECT_EQ(get_or<int>(json::array(), "bytes", 7), 7);
}

TEST_F(JsonUtilsTest, Get_Present) {
    const json obj{{"allocations", 42}};

    const auto result = get<std::int64_t>(obj, "allocations");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
}

TEST_F(JsonUtilsTest, Get_Missing) {
    const auto result = get<std::string>(json::object(), "operation");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(result.error().context().value_or(""), "operation");
}

TEST_F(JsonUtilsTest, Get_WrongType) {
    const json obj{{"operation", 12}};

    const auto result = get<std::string>(obj, "operation");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}
