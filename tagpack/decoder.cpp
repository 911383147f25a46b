#include "tagpack/decoder.hpp"

#include <bit>
#include <chrono>
#include <limits>
#include <string>

namespace tagpack
{
	namespace
	{
		// Payloads are read in pieces so a corrupt length prefix runs into the
		// end of the stream instead of one huge allocation.
		constexpr size_t READ_CHUNK=64*1024;

		int64_t sign_extend(uint64_t raw,size_t size)
		{
			switch(size)
			{
				case 1  : return static_cast<int8_t>(raw);
				case 2  : return static_cast<int16_t>(raw);
				case 4  : return static_cast<int32_t>(raw);
				default : return static_cast<int64_t>(raw);
			}
		}

		constexpr int64_t NANOS_PER_MICRO=1000;
		constexpr int64_t NANOS_PER_SECOND=1000000000;

		// count*scale nanoseconds after the epoch, if the clock can hold it.
		timestamp scaled_since_epoch(int64_t count,int64_t scale,const char *unit)
		{
			if(count>std::numeric_limits<int64_t>::max()/scale || count<std::numeric_limits<int64_t>::min()/scale)
				throw DecodeError(DecodeError::Kind::NUMERIC_OVERFLOW,
					std::to_string(count)+" "+unit+" is outside the timestamp range");
			return timestamp(std::chrono::nanoseconds(count*scale));
		}

		timestamp from_seconds(int64_t sec,uint64_t nsec)
		{
			if(nsec>=static_cast<uint64_t>(NANOS_PER_SECOND))
				throw DecodeError(DecodeError::Kind::MALFORMED_TAG,
					"timestamp nanoseconds field of "+std::to_string(nsec));
			const timestamp whole=scaled_since_epoch(sec,NANOS_PER_SECOND,"seconds");
			if(whole.time_since_epoch().count()>std::numeric_limits<int64_t>::max()-static_cast<int64_t>(nsec))
				throw DecodeError(DecodeError::Kind::NUMERIC_OVERFLOW,
					std::to_string(sec)+" seconds is outside the timestamp range");
			return whole+std::chrono::nanoseconds(nsec);
		}

		bool equal_ignoring_case(std::string_view a,std::string_view b)
		{
			if(a.size()!=b.size())
				return false;
			for(size_t i=0;i<a.size();i++)
			{
				if(std::tolower(static_cast<unsigned char>(a[i]))!=std::tolower(static_cast<unsigned char>(b[i])))
					return false;
			}
			return true;
		}
	}

	Decoder::Decoder(std::istream &is,DecodeOptions options):
		m_is(is),m_options(options)
	{
	}

	Value Decoder::decode()
	{
		Value result;
		guarded([&]
		{
			const Head head=read_head(0);
			result=read_open(head,0);
		});
		return result;
	}

	void Decoder::skip()
	{
		guarded([&]
		{
			const Head head=read_head(0);
			skip_value(head,0);
		});
	}

	bool Decoder::at_end()
	{
		if(m_is.bad())
			throw DecodeError(DecodeError::Kind::SOURCE_READ_FAILURE,"input stream is unreadable");
		return m_is.peek()==std::istream::traits_type::eof();
	}

	void Decoder::mismatch(const Head &head,const char *expected)
	{
		throw DecodeError(DecodeError::Kind::TYPE_MISMATCH,
			std::string("expected ")+expected+", got "+wire::family_name(head.family));
	}

	void Decoder::read_exact(char *out,size_t size)
	{
		m_is.read(out,static_cast<std::streamsize>(size));
		if(static_cast<size_t>(m_is.gcount())==size)
			return;
		if(m_is.bad())
			throw DecodeError(DecodeError::Kind::SOURCE_READ_FAILURE,"input stream is unreadable");
		throw DecodeError(DecodeError::Kind::TRUNCATED_STREAM,
			"needed "+std::to_string(size)+" bytes, got "+std::to_string(m_is.gcount()));
	}

	uint64_t Decoder::read_field(size_t size)
	{
		unsigned char bytes[8];
		read_exact(reinterpret_cast<char*>(bytes),size);
		uint64_t value=0;
		for(size_t i=0;i<size;i++)
			value=(value<<8)|bytes[i];
		return value;
	}

	Decoder::Head Decoder::read_head(size_t depth)
	{
		if(depth>m_options.max_depth)
			throw DecodeError(DecodeError::Kind::MALFORMED_TAG,
				"nesting too deep (limit "+std::to_string(m_options.max_depth)+")");

		const int c=m_is.get();
		if(c==std::istream::traits_type::eof())
		{
			if(m_is.bad())
				throw DecodeError(DecodeError::Kind::SOURCE_READ_FAILURE,"input stream is unreadable");
			throw DecodeError(DecodeError::Kind::TRUNCATED_STREAM,"end of stream where a value was expected");
		}

		Head head;
		head.tag=static_cast<uint8_t>(c);
		const wire::TagInfo &info=wire::describe(head.tag);
		head.family=info.family;

		switch(info.family)
		{
			case wire::Family::INVALID :
			{
				throw DecodeError(DecodeError::Kind::MALFORMED_TAG,"reserved tag byte 0xc1");
			}
			case wire::Family::NIL : break;
			case wire::Family::BOOL :
			{
				head.bool_value=head.tag==wire::tag::BOOL_TRUE;
			} break;
			case wire::Family::POSITIVE_FIXINT :
			{
				head.uint_value=head.tag;
			} break;
			case wire::Family::NEGATIVE_FIXINT :
			{
				head.int_value=static_cast<int8_t>(head.tag);
			} break;
			case wire::Family::UINT :
			{
				head.uint_value=read_field(info.field_size);
			} break;
			case wire::Family::INT :
			{
				head.int_value=sign_extend(read_field(info.field_size),info.field_size);
			} break;
			case wire::Family::FLOAT32 :
			{
				head.float32_value=std::bit_cast<float>(static_cast<uint32_t>(read_field(4)));
			} break;
			case wire::Family::FLOAT64 :
			{
				head.float64_value=std::bit_cast<double>(read_field(8));
			} break;
			case wire::Family::STRING : // fall through
			case wire::Family::BINARY : // fall through
			case wire::Family::ARRAY  : // fall through
			case wire::Family::MAP    :
			{
				head.length=info.field_size==0 ? info.inline_length : static_cast<uint32_t>(read_field(info.field_size));
			} break;
			case wire::Family::EXTENSION :
			{
				head.length=info.field_size==0 ? info.inline_length : static_cast<uint32_t>(read_field(info.field_size));
				head.ext_type=static_cast<int8_t>(read_field(1));
			} break;
		}
		return head;
	}

	std::string Decoder::read_raw(uint32_t length)
	{
		std::string out;
		size_t remaining=length;
		while(remaining>0)
		{
			const size_t n=std::min(remaining,READ_CHUNK);
			const size_t offset=out.size();
			out.resize(offset+n);
			read_exact(out.data()+offset,n);
			remaining-=n;
		}
		return out;
	}

	binary Decoder::read_binary(uint32_t length)
	{
		binary out;
		size_t remaining=length;
		while(remaining>0)
		{
			const size_t n=std::min(remaining,READ_CHUNK);
			const size_t offset=out.size();
			out.resize(offset+n);
			read_exact(reinterpret_cast<char*>(out.data()+offset),n);
			remaining-=n;
		}
		return out;
	}

	void Decoder::discard(uint32_t length)
	{
		m_is.ignore(static_cast<std::streamsize>(length));
		if(static_cast<uint64_t>(m_is.gcount())==length)
			return;
		if(m_is.bad())
			throw DecodeError(DecodeError::Kind::SOURCE_READ_FAILURE,"input stream is unreadable");
		throw DecodeError(DecodeError::Kind::TRUNCATED_STREAM,"end of stream inside a skipped value");
	}

	void Decoder::skip_value(const Head &head,size_t depth)
	{
		switch(head.family)
		{
			case wire::Family::STRING    : // fall through
			case wire::Family::BINARY    : // fall through
			case wire::Family::EXTENSION :
			{
				discard(head.length);
			} break;
			case wire::Family::ARRAY :
			{
				for(uint32_t i=0;i<head.length;i++)
					skip_value(read_head(depth+1),depth+1);
			} break;
			case wire::Family::MAP :
			{
				for(uint64_t i=0;i<2ULL*head.length;i++)
					skip_value(read_head(depth+1),depth+1);
			} break;
			default : break; // scalars are consumed with their head
		}
	}

	timestamp Decoder::from_ticks(int64_t ticks) const
	{
		switch(m_options.timestamp_resolution)
		{
			case Resolution::NANO  : return timestamp(std::chrono::nanoseconds(ticks));
			case Resolution::MICRO :
			default                : return scaled_since_epoch(ticks,NANOS_PER_MICRO,"microseconds");
		}
	}

	int64_t Decoder::to_ticks(const timestamp &value) const
	{
		switch(m_options.timestamp_resolution)
		{
			case Resolution::NANO  : return value.time_since_epoch().count();
			case Resolution::MICRO :
			default                : return std::chrono::duration_cast<std::chrono::microseconds>(value.time_since_epoch()).count();
		}
	}

	timestamp Decoder::read_timestamp(const Head &head)
	{
		switch(head.family)
		{
			case wire::Family::POSITIVE_FIXINT : // fall through
			case wire::Family::UINT            : // fall through
			case wire::Family::NEGATIVE_FIXINT : // fall through
			case wire::Family::INT             : return from_ticks(read_integer<int64_t>(head));
			case wire::Family::EXTENSION       : break;
			default                            : mismatch(head,"timestamp");
		}

		if(head.ext_type==wire::TIMESTAMP_EXT_TYPE)
		{
			if(head.length!=8)
				throw DecodeError(DecodeError::Kind::MALFORMED_TAG,
					"timestamp payload of "+std::to_string(head.length)+" bytes");
			return from_ticks(static_cast<int64_t>(read_field(8)));
		}
		if(head.ext_type==wire::STANDARD_TIMESTAMP_EXT_TYPE)
		{
			switch(head.length)
			{
				case 4 :
				{
					return from_seconds(static_cast<int64_t>(read_field(4)),0);
				}
				case 8 :
				{
					const uint64_t data=read_field(8);
					return from_seconds(static_cast<int64_t>(data&0x3ffffffffULL),data>>34);
				}
				case 12 :
				{
					const uint64_t nsec=read_field(4);
					const int64_t sec=static_cast<int64_t>(read_field(8));
					return from_seconds(sec,nsec);
				}
				default :
					throw DecodeError(DecodeError::Kind::MALFORMED_TAG,
						"standard timestamp payload of "+std::to_string(head.length)+" bytes");
			}
		}
		throw DecodeError(DecodeError::Kind::UNKNOWN_EXTENSION,
			"extension type "+std::to_string(head.ext_type)+" is not a timestamp");
	}

	bool Decoder::field_matches(std::string_view field,std::string_view key) const
	{
		if(m_options.case_insensitive_fields)
			return equal_ignoring_case(field,key);
		return field==key;
	}

	Value Decoder::read_open(const Head &head,size_t depth)
	{
		switch(head.family)
		{
			case wire::Family::NIL  : return Value();
			case wire::Family::BOOL : return Value(head.bool_value);
			case wire::Family::POSITIVE_FIXINT :
			{
				if(m_options.small_int_as_int8)
					return Value(static_cast<Value::int8>(head.uint_value));
				return Value(static_cast<Value::int64>(head.uint_value));
			}
			case wire::Family::NEGATIVE_FIXINT :
			{
				if(m_options.small_int_as_int8)
					return Value(static_cast<Value::int8>(head.int_value));
				return Value(static_cast<Value::int64>(head.int_value));
			}
			case wire::Family::UINT    : return Value(static_cast<Value::uint64>(head.uint_value));
			case wire::Family::INT     : return Value(static_cast<Value::int64>(head.int_value));
			case wire::Family::FLOAT32 : return Value(head.float32_value);
			case wire::Family::FLOAT64 : return Value(head.float64_value);
			case wire::Family::STRING  : return Value(read_raw(head.length));
			case wire::Family::BINARY  :
			{
				if(m_options.raw_as_text)
					return Value(read_raw(head.length));
				return Value(read_binary(head.length));
			}
			case wire::Family::ARRAY :
			{
				Value::array elements;
				for(uint32_t i=0;i<head.length;i++)
					elements.push_back(read_open(read_head(depth+1),depth+1));
				return Value(std::move(elements));
			}
			case wire::Family::MAP :
			{
				if(m_options.map_type==MapType::MAP)
				{
					Value::map entries;
					for(uint32_t i=0;i<head.length;i++)
					{
						Value key=read_open(read_head(depth+1),depth+1);
						Value value=read_open(read_head(depth+1),depth+1);
						entries.insert_or_assign(std::move(key),std::move(value));
					}
					return Value(std::move(entries));
				}
				// Text keyed until the first key that is not text, which turns
				// this one map into a MAP.
				Value::object fields;
				Value::map entries;
				bool text_keys=true;
				for(uint32_t i=0;i<head.length;i++)
				{
					const Head key=read_head(depth+1);
					const bool text=key.family==wire::Family::STRING || key.family==wire::Family::BINARY;
					if(text_keys && !text)
					{
						TAGPACK_LOG_TRACE(std::string("map with a ")+wire::family_name(key.family)+" key decoded as a generic map");
						for(auto &field:fields)
							entries.insert_or_assign(Value(field.first),std::move(field.second));
						fields.clear();
						text_keys=false;
					}
					if(text_keys)
					{
						std::string name=read_raw(key.length);
						Value value=read_open(read_head(depth+1),depth+1);
						fields.insert_or_assign(std::move(name),std::move(value));
					}
					else
					{
						Value name=text ? Value(read_raw(key.length)) : read_open(key,depth+1);
						Value value=read_open(read_head(depth+1),depth+1);
						entries.insert_or_assign(std::move(name),std::move(value));
					}
				}
				if(text_keys)
					return Value(std::move(fields));
				return Value(std::move(entries));
			}
			case wire::Family::EXTENSION :
			{
				if(head.ext_type==wire::TIMESTAMP_EXT_TYPE || head.ext_type==wire::STANDARD_TIMESTAMP_EXT_TYPE)
				{
					const timestamp value=read_timestamp(head);
					if(m_options.timestamp_form==TimestampForm::TICKS)
						return Value(static_cast<Value::int64>(to_ticks(value)));
					return Value(value);
				}
				if(!m_options.accept_unknown_extensions)
					throw DecodeError(DecodeError::Kind::UNKNOWN_EXTENSION,
						"extension type "+std::to_string(head.ext_type));
				return Value(Extension{head.ext_type,read_binary(head.length)});
			}
			case wire::Family::INVALID : break;
		}
		throw DecodeError(DecodeError::Kind::MALFORMED_TAG,"unreadable tag");
	}

} // namespace tagpack
