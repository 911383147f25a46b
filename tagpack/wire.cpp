#include "tagpack/wire.hpp"

#include <array>
#include <utility>

namespace tagpack::wire
{
	namespace
	{
		TagInfo with_inline_length(TagInfo info,uint8_t tag,uint8_t mask)
		{
			info.inline_length=tag&mask;
			return info;
		}
		
		std::array<TagInfo,256> build_table()
		{
			// Each entry covers the tags from the previous bound (exclusive) up to
			// and including its own bound.
			using range=std::pair<uint8_t,TagInfo>;
			std::array<range,36> const ranges
			{{
				range{0x7fu,{Family::POSITIVE_FIXINT,0,0}},
				range{0x8fu,{Family::MAP,0,0}},
				range{0x9fu,{Family::ARRAY,0,0}},
				range{0xbfu,{Family::STRING,0,0}},
				range{0xc0u,{Family::NIL,0,0}},
				range{0xc1u,{Family::INVALID,0,0}},
				range{0xc3u,{Family::BOOL,0,0}},
				range{0xc4u,{Family::BINARY,1,0}},
				range{0xc5u,{Family::BINARY,2,0}},
				range{0xc6u,{Family::BINARY,4,0}},
				range{0xc7u,{Family::EXTENSION,1,0}},
				range{0xc8u,{Family::EXTENSION,2,0}},
				range{0xc9u,{Family::EXTENSION,4,0}},
				range{0xcau,{Family::FLOAT32,4,0}},
				range{0xcbu,{Family::FLOAT64,8,0}},
				range{0xccu,{Family::UINT,1,0}},
				range{0xcdu,{Family::UINT,2,0}},
				range{0xceu,{Family::UINT,4,0}},
				range{0xcfu,{Family::UINT,8,0}},
				range{0xd0u,{Family::INT,1,0}},
				range{0xd1u,{Family::INT,2,0}},
				range{0xd2u,{Family::INT,4,0}},
				range{0xd3u,{Family::INT,8,0}},
				range{0xd4u,{Family::EXTENSION,0,1}},
				range{0xd5u,{Family::EXTENSION,0,2}},
				range{0xd6u,{Family::EXTENSION,0,4}},
				range{0xd7u,{Family::EXTENSION,0,8}},
				range{0xd8u,{Family::EXTENSION,0,16}},
				range{0xd9u,{Family::STRING,1,0}},
				range{0xdau,{Family::STRING,2,0}},
				range{0xdbu,{Family::STRING,4,0}},
				range{0xdcu,{Family::ARRAY,2,0}},
				range{0xddu,{Family::ARRAY,4,0}},
				range{0xdeu,{Family::MAP,2,0}},
				range{0xdfu,{Family::MAP,4,0}},
				range{0xffu,{Family::NEGATIVE_FIXINT,0,0}}
			}};
			
			std::array<TagInfo,256> table{};
			int i=0;
			for(const auto &r:ranges)
				for(;i<=r.first;i++)
					table[i]=r.second;
			
			for(int t=tag::FIXMAP;t<=0x8f;t++)
				table[t]=with_inline_length(table[t],static_cast<uint8_t>(t),0x0f);
			for(int t=tag::FIXARRAY;t<=0x9f;t++)
				table[t]=with_inline_length(table[t],static_cast<uint8_t>(t),0x0f);
			for(int t=tag::FIXSTR;t<=0xbf;t++)
				table[t]=with_inline_length(table[t],static_cast<uint8_t>(t),0x1f);
			return table;
		}
	}
	
	const TagInfo& describe(uint8_t tag)
	{
		static const std::array<TagInfo,256> table{build_table()};
		return table[tag];
	}
	
	const char *family_name(Family family)
	{
		switch(family)
		{
			case Family::INVALID         : return "invalid";
			case Family::NIL             : return "nil";
			case Family::BOOL            : return "bool";
			case Family::POSITIVE_FIXINT : return "positive fixint";
			case Family::NEGATIVE_FIXINT : return "negative fixint";
			case Family::UINT            : return "uint";
			case Family::INT             : return "int";
			case Family::FLOAT32         : return "float32";
			case Family::FLOAT64         : return "float64";
			case Family::STRING          : return "str";
			case Family::BINARY          : return "bin";
			case Family::ARRAY           : return "array";
			case Family::MAP             : return "map";
			case Family::EXTENSION       : return "ext";
		}
		return "unknown";
	}
	
	uint8_t fixext_tag(size_t length)
	{
		switch(length)
		{
			case 1  : return tag::FIXEXT1;
			case 2  : return tag::FIXEXT2;
			case 4  : return tag::FIXEXT4;
			case 8  : return tag::FIXEXT8;
			case 16 : return tag::FIXEXT16;
			default : return 0;
		}
	}
	
} // namespace tagpack::wire
