#include <gtest/gtest.h>
#include "kgstore/common/json.h"
#include <string>
#include <vector>

namespace kgstore {
namespace common {
namespace {

TEST(JsonTest, StringListKeepsOrderAndDuplicates) {
    std::vector<std::string> values = {"b", "a", "b", "quote \" and \\ slash", "ünïcode"};
    std::string encoded = EncodeStringList(values);

    auto decoded = DecodeStringList(encoded);
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), values);
}

TEST(JsonTest, EmptyList) {
    EXPECT_EQ(EncodeStringList({}), "[]");

    auto from_array = DecodeStringList("[]");
    ASSERT_TRUE(from_array.ok());
    EXPECT_TRUE(from_array.value().empty());

    auto from_empty = DecodeStringList("");
    ASSERT_TRUE(from_empty.ok());
    EXPECT_TRUE(from_empty.value().empty());
}

TEST(JsonTest, NonStringListItemsAreSerialized) {
    auto decoded = DecodeStringList("[\"a\", 1, true]");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), (std::vector<std::string>{"a", "1", "true"}));
}

TEST(JsonTest, CorruptListIsStorageFailure) {
    auto not_json = DecodeStringList("[\"unterminated");
    ASSERT_FALSE(not_json.ok());
    EXPECT_EQ(not_json.code(), core::Error::Code::STORAGE_FAILURE);

    auto not_array = DecodeStringList("{\"a\": 1}");
    ASSERT_FALSE(not_array.ok());
    EXPECT_EQ(not_array.code(), core::Error::Code::STORAGE_FAILURE);
}

TEST(JsonTest, Metadata) {
    core::Metadata metadata{{"source", "chat"}, {"lang", "en"}};
    auto decoded = DecodeMetadata(EncodeMetadata(metadata));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), metadata);

    EXPECT_EQ(EncodeMetadata({}), "{}");
}

TEST(JsonTest, MetadataNonStringMembers) {
    auto decoded = DecodeMetadata("{\"count\": 3, \"tags\": [\"x\"]}");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().at("count"), "3");
    EXPECT_EQ(decoded.value().at("tags"), "[\"x\"]");
}

TEST(JsonTest, CorruptMetadataIsStorageFailure) {
    auto decoded = DecodeMetadata("[1, 2]");
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), core::Error::Code::STORAGE_FAILURE);
}

}  // namespace
}  // namespace common
}  // namespace kgstore
