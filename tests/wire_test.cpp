#include "tagpack/wire.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace tagpack::wire;

TEST(WireTest, FixintRanges)
{
	EXPECT_EQ(describe(0x00).family, Family::POSITIVE_FIXINT);
	EXPECT_EQ(describe(0x7f).family, Family::POSITIVE_FIXINT);
	EXPECT_EQ(describe(0xe0).family, Family::NEGATIVE_FIXINT);
	EXPECT_EQ(describe(0xf8).family, Family::NEGATIVE_FIXINT);
	EXPECT_EQ(describe(0xff).family, Family::NEGATIVE_FIXINT);
}

TEST(WireTest, FixContainersCarryTheirLength)
{
	EXPECT_EQ(describe(0x80).family, Family::MAP);
	EXPECT_EQ(describe(0x80).inline_length, 0);
	EXPECT_EQ(describe(0x8f).inline_length, 15);
	EXPECT_EQ(describe(0x9a).family, Family::ARRAY);
	EXPECT_EQ(describe(0x9a).inline_length, 10);
	EXPECT_EQ(describe(0xa7).family, Family::STRING);
	EXPECT_EQ(describe(0xa7).inline_length, 7);
	EXPECT_EQ(describe(0xbf).inline_length, 31);
	EXPECT_EQ(describe(0xbf).field_size, 0);
}

TEST(WireTest, SingleByteTags)
{
	EXPECT_EQ(describe(tag::NIL).family, Family::NIL);
	EXPECT_EQ(describe(tag::NEVER_USED).family, Family::INVALID);
	EXPECT_EQ(describe(tag::BOOL_FALSE).family, Family::BOOL);
	EXPECT_EQ(describe(tag::BOOL_TRUE).family, Family::BOOL);
}

TEST(WireTest, FieldSizes)
{
	EXPECT_EQ(describe(tag::UINT8).family, Family::UINT);
	EXPECT_EQ(describe(tag::UINT8).field_size, 1);
	EXPECT_EQ(describe(tag::UINT64).field_size, 8);
	EXPECT_EQ(describe(tag::INT16).family, Family::INT);
	EXPECT_EQ(describe(tag::INT16).field_size, 2);
	EXPECT_EQ(describe(tag::FLOAT32).family, Family::FLOAT32);
	EXPECT_EQ(describe(tag::FLOAT32).field_size, 4);
	EXPECT_EQ(describe(tag::FLOAT64).field_size, 8);
	EXPECT_EQ(describe(tag::STR16).family, Family::STRING);
	EXPECT_EQ(describe(tag::STR16).field_size, 2);
	EXPECT_EQ(describe(tag::BIN32).family, Family::BINARY);
	EXPECT_EQ(describe(tag::BIN32).field_size, 4);
	EXPECT_EQ(describe(tag::ARRAY16).family, Family::ARRAY);
	EXPECT_EQ(describe(tag::MAP32).family, Family::MAP);
	EXPECT_EQ(describe(tag::MAP32).field_size, 4);
	EXPECT_EQ(describe(tag::EXT8).family, Family::EXTENSION);
	EXPECT_EQ(describe(tag::EXT8).field_size, 1);
}

TEST(WireTest, FixextPayloadSizes)
{
	EXPECT_EQ(describe(tag::FIXEXT1).inline_length, 1);
	EXPECT_EQ(describe(tag::FIXEXT2).inline_length, 2);
	EXPECT_EQ(describe(tag::FIXEXT4).inline_length, 4);
	EXPECT_EQ(describe(tag::FIXEXT8).inline_length, 8);
	EXPECT_EQ(describe(tag::FIXEXT16).inline_length, 16);
	EXPECT_EQ(describe(tag::FIXEXT16).field_size, 0);
}

TEST(WireTest, FixextTagForLength)
{
	EXPECT_EQ(fixext_tag(1), tag::FIXEXT1);
	EXPECT_EQ(fixext_tag(8), tag::FIXEXT8);
	EXPECT_EQ(fixext_tag(16), tag::FIXEXT16);
	EXPECT_EQ(fixext_tag(0), 0);
	EXPECT_EQ(fixext_tag(3), 0);
	EXPECT_EQ(fixext_tag(32), 0);
}

TEST(WireTest, FamilyNames)
{
	EXPECT_EQ(std::string(family_name(Family::STRING)), "str");
	EXPECT_EQ(std::string(family_name(Family::NEGATIVE_FIXINT)), "negative fixint");
	EXPECT_EQ(std::string(family_name(Family::INVALID)), "invalid");
}
