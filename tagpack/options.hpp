#pragma once

#include <cstddef>
#include <cstdint>

namespace tagpack
{
	// Granularity of the tick count carried by the timestamp extension.
	enum class Resolution : uint8_t
	{
		MICRO,
		NANO
	};
	
	// Mapping built for Map-tag data decoded into an open target.
	enum class MapType : uint8_t
	{
		OBJECT, // text keys
		MAP     // any keys
	};
	
	// How a timestamp extension is materialised in an open target.
	enum class TimestampForm : uint8_t
	{
		TIME_POINT,
		TICKS
	};
	
	struct EncodeOptions
	{
		Resolution timestamp_resolution=Resolution::MICRO;
	};
	
	/* DecodeOptions
	 *
	 * Read-only once handed to a Decoder, so one instance may back any number
	 * of decoders on any number of threads.
	 */
	struct DecodeOptions
	{
		MapType map_type=MapType::OBJECT;
		// fixints (-32..127) decode into an open target as INT8 instead of INT64
		bool small_int_as_int8=true;
		// bin data decoded into an open target becomes STRING
		bool raw_as_text=false;
		Resolution timestamp_resolution=Resolution::MICRO;
		TimestampForm timestamp_form=TimestampForm::TIME_POINT;
		// hint only, decoding is identical either way
		bool string_interning=false;
		bool case_insensitive_fields=false;
		// extensions other than timestamps decode into an open target as EXTENSION
		// values instead of failing
		bool accept_unknown_extensions=false;
		size_t max_depth=512;
	};
	
} // namespace tagpack
