#pragma once

#include <cstddef>
#include <cstdint>

namespace tagpack::wire
{
	// Value category a tag byte introduces.
	enum class Family : uint8_t
	{
		INVALID,
		NIL,
		BOOL,
		POSITIVE_FIXINT,
		NEGATIVE_FIXINT,
		UINT,
		INT,
		FLOAT32,
		FLOAT64,
		STRING,
		BINARY,
		ARRAY,
		MAP,
		EXTENSION
	};
	
	namespace tag
	{
		constexpr uint8_t POSITIVE_FIXINT = 0x00;
		constexpr uint8_t FIXMAP          = 0x80;
		constexpr uint8_t FIXARRAY        = 0x90;
		constexpr uint8_t FIXSTR          = 0xa0;
		constexpr uint8_t NIL             = 0xc0;
		constexpr uint8_t NEVER_USED      = 0xc1;
		constexpr uint8_t BOOL_FALSE      = 0xc2;
		constexpr uint8_t BOOL_TRUE       = 0xc3;
		constexpr uint8_t BIN8            = 0xc4;
		constexpr uint8_t BIN16           = 0xc5;
		constexpr uint8_t BIN32           = 0xc6;
		constexpr uint8_t EXT8            = 0xc7;
		constexpr uint8_t EXT16           = 0xc8;
		constexpr uint8_t EXT32           = 0xc9;
		constexpr uint8_t FLOAT32         = 0xca;
		constexpr uint8_t FLOAT64         = 0xcb;
		constexpr uint8_t UINT8           = 0xcc;
		constexpr uint8_t UINT16          = 0xcd;
		constexpr uint8_t UINT32          = 0xce;
		constexpr uint8_t UINT64          = 0xcf;
		constexpr uint8_t INT8            = 0xd0;
		constexpr uint8_t INT16           = 0xd1;
		constexpr uint8_t INT32           = 0xd2;
		constexpr uint8_t INT64           = 0xd3;
		constexpr uint8_t FIXEXT1         = 0xd4;
		constexpr uint8_t FIXEXT2         = 0xd5;
		constexpr uint8_t FIXEXT4         = 0xd6;
		constexpr uint8_t FIXEXT8         = 0xd7;
		constexpr uint8_t FIXEXT16        = 0xd8;
		constexpr uint8_t STR8            = 0xd9;
		constexpr uint8_t STR16           = 0xda;
		constexpr uint8_t STR32           = 0xdb;
		constexpr uint8_t ARRAY16         = 0xdc;
		constexpr uint8_t ARRAY32         = 0xdd;
		constexpr uint8_t MAP16           = 0xde;
		constexpr uint8_t MAP32           = 0xdf;
		constexpr uint8_t NEGATIVE_FIXINT = 0xe0;
	}
	
	// Largest lengths held directly in the fix* tags.
	constexpr size_t FIXSTR_MAX   = 0x1f;
	constexpr size_t FIXARRAY_MAX = 0x0f;
	constexpr size_t FIXMAP_MAX   = 0x0f;
	constexpr int64_t NEGATIVE_FIXINT_MIN = -32;
	constexpr uint64_t POSITIVE_FIXINT_MAX = 0x7f;
	
	// Extension type codes understood without configuration.
	constexpr int8_t TIMESTAMP_EXT_TYPE          = 1;
	constexpr int8_t STANDARD_TIMESTAMP_EXT_TYPE = -1;
	
	/* TagInfo
	 *
	 * What follows a tag byte on the wire. For numbers `field_size` is the
	 * width of the big-endian value, for str/bin/array/map/ext it is the width
	 * of the big-endian length. Fix* tags carry their length in the tag itself
	 * (`inline_length`) and have a zero `field_size`.
	 */
	struct TagInfo
	{
		Family  family;
		uint8_t field_size;
		uint8_t inline_length;
	};
	
	const TagInfo& describe(uint8_t tag);
	
	const char *family_name(Family family);
	
	// Tag that heads an extension payload of `length` bytes when written in
	// the shortest form. Returns 0 when only a length-prefixed form fits.
	uint8_t fixext_tag(size_t length);
	
} // namespace tagpack::wire
