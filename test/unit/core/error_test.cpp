#include <gtest/gtest.h>
#include "kgstore/core/error.h"
#include <string>

namespace kgstore {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("something");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyConstruction) {
    Error original("Entity not found: alice", Error::Code::ENTITY_NOT_FOUND);
    Error copy(original);

    EXPECT_EQ(copy.code(), original.code());
    EXPECT_EQ(copy.what(), std::string(original.what()));
}

TEST(ErrorTest, Assignment) {
    Error error1("Invalid", Error::Code::INVALID_ARGUMENT);
    Error error2("Exists", Error::Code::ENTITY_ALREADY_EXISTS);

    error1 = error2;
    EXPECT_EQ(error1.code(), Error::Code::ENTITY_ALREADY_EXISTS);
    EXPECT_EQ(error1.what(), std::string("Exists"));
}

TEST(ErrorTest, SubclassesCarryTheirCode) {
    EXPECT_EQ(InvalidArgumentError("x").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(EntityNotFoundError("x").code(), Error::Code::ENTITY_NOT_FOUND);
    EXPECT_EQ(EntityAlreadyExistsError("x").code(), Error::Code::ENTITY_ALREADY_EXISTS);
    EXPECT_EQ(PoolExhaustedError("x").code(), Error::Code::POOL_EXHAUSTED);
    EXPECT_EQ(StorageFailureError("x").code(), Error::Code::STORAGE_FAILURE);
    EXPECT_EQ(InternalError("x").code(), Error::Code::INTERNAL);
}

TEST(ErrorTest, SlicingKeepsCode) {
    Error sliced = EntityNotFoundError(std::string("Entity not found: bob"));
    EXPECT_EQ(sliced.code(), Error::Code::ENTITY_NOT_FOUND);
    EXPECT_EQ(sliced.what(), std::string("Entity not found: bob"));
}

TEST(ErrorTest, ThrowAndCatch) {
    try {
        throw StorageFailureError("disk I/O error");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::STORAGE_FAILURE);
        EXPECT_EQ(e.what(), std::string("disk I/O error"));
    }
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(CodeName(Error::Code::UNKNOWN), "UNKNOWN");
    EXPECT_STREQ(CodeName(Error::Code::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(CodeName(Error::Code::ENTITY_NOT_FOUND), "ENTITY_NOT_FOUND");
    EXPECT_STREQ(CodeName(Error::Code::ENTITY_ALREADY_EXISTS), "ENTITY_ALREADY_EXISTS");
    EXPECT_STREQ(CodeName(Error::Code::POOL_EXHAUSTED), "POOL_EXHAUSTED");
    EXPECT_STREQ(CodeName(Error::Code::STORAGE_FAILURE), "STORAGE_FAILURE");
    EXPECT_STREQ(CodeName(Error::Code::INTERNAL), "INTERNAL");
}

}  // namespace
}  // namespace core
}  // namespace kgstore
