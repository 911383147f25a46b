#include "tagpack/encoder.hpp"
#include "tagpack/wire.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <limits>

namespace tagpack
{
	namespace
	{
		template< typename T > requires std::is_trivially_copyable_v<T>
		void dump_data(const T& value, std::ostream& os)
		{
			auto bytes=std::bit_cast<std::array<char,sizeof(T)>>(value);
			if constexpr(std::endian::native==std::endian::little)
				std::reverse(bytes.begin(),bytes.end());
			os.write(bytes.data(),bytes.size());
		}

		inline void put(uint8_t byte, std::ostream& os)
		{
			os.put(static_cast<char>(byte));
		}

		inline void dump(uint8_t value, std::ostream& os)
		{
			if(wire::POSITIVE_FIXINT_MAX < value)
			{
				put(wire::tag::UINT8, os);
			}
			put(value, os);
		}

		inline void dump(uint16_t value, std::ostream& os)
		{
			if( value < (1<<8) )
			{
				dump(static_cast<uint8_t>(value), os );
			}
			else
			{
				put(wire::tag::UINT16, os);
				dump_data(value, os);
			}
		}

		inline void dump(uint32_t value, std::ostream& os)
		{
			if( value < (1 << 16) )
			{
				dump(static_cast<uint16_t>(value), os );
			}
			else
			{
				put(wire::tag::UINT32, os);
				dump_data(value, os);
			}
		}

		inline void dump(uint64_t value, std::ostream& os)
		{
			if( value < (1ULL << 32) )
			{
				dump(static_cast<uint32_t>(value), os );
			}
			else
			{
				put(wire::tag::UINT64, os);
				dump_data(value, os);
			}
		}

		inline void dump(int8_t value, std::ostream& os)
		{
			if( value < wire::NEGATIVE_FIXINT_MIN )
			{
				put(wire::tag::INT8, os);
			}
			put(static_cast<uint8_t>(value), os);
		}

		inline void dump(int16_t value, std::ostream& os)
		{
			if( value < -(1 << 7) )
			{
				put(wire::tag::INT16, os);
				dump_data(value, os);
			}
			else
			{
				dump(static_cast<int8_t>(value), os );
			}
		}

		inline void dump(int32_t value, std::ostream& os)
		{
			if( value < -(1 << 15) )
			{
				put(wire::tag::INT32, os);
				dump_data(value, os);
			}
			else
			{
				dump(static_cast<int16_t>(value), os );
			}
		}

		// Non-negative values take the unsigned forms.
		inline void dump(int64_t value, std::ostream& os)
		{
			if( value >= 0 )
			{
				dump(static_cast<uint64_t>(value), os );
			}
			else if( value < -(1LL << 31) )
			{
				put(wire::tag::INT64, os);
				dump_data(value, os);
			}
			else
			{
				dump(static_cast<int32_t>(value), os );
			}
		}

		// Writes the shortest of the three length-prefixed forms, or the fix
		// form when `fix_max` allows it.
		void dump_length(size_t len, uint8_t fix_tag, size_t fix_max,
			uint8_t tag8, uint8_t tag16, uint8_t tag32, std::ostream& os)
		{
			if(fix_tag != 0 && len <= fix_max)
			{
				put(static_cast<uint8_t>(fix_tag | len), os);
			}
			else if(tag8 != 0 && len <= 0xff)
			{
				put(tag8, os);
				put(static_cast<uint8_t>(len), os);
			}
			else if(len <= 0xffff)
			{
				put(tag16, os);
				dump_data(static_cast<uint16_t>(len), os);
			}
			else if(len <= 0xffffffff)
			{
				put(tag32, os);
				dump_data(static_cast<uint32_t>(len), os);
			}
			else
			{
				throw EncodeError(EncodeError::Kind::UNSUPPORTED_TYPE,
					"length "+std::to_string(len)+" exceeds the 32-bit limit of the format");
			}
		}

		int64_t to_ticks(const timestamp& value, Resolution resolution)
		{
			// duration_cast truncates toward zero
			switch(resolution)
			{
				case Resolution::NANO  :
					return value.time_since_epoch().count();
				case Resolution::MICRO :
				default :
					return std::chrono::duration_cast<std::chrono::microseconds>(value.time_since_epoch()).count();
			}
		}
	}

	Encoder::Encoder(std::ostream &os,EncodeOptions options):
		m_os(os),m_options(options)
	{
	}

	Encoder::PathGuard::PathGuard(Encoder &encoder,const void *address,std::type_index type):
		m_encoder(encoder)
	{
		auto &path=m_encoder.m_path;
		const std::pair<const void*,std::type_index> key(address,type);
		if(std::find(path.begin(),path.end(),key)!=path.end())
			throw EncodeError(EncodeError::Kind::CYCLIC_REFERENCE,"value refers back to one of its own containers");
		path.push_back(key);
	}

	Encoder::PathGuard::~PathGuard()
	{
		m_encoder.m_path.pop_back();
	}

	void Encoder::check_sink()
	{
		if(!m_os)
			throw EncodeError(EncodeError::Kind::SINK_WRITE_FAILURE,"output stream is in a failed state");
	}

	void Encoder::flush()
	{
		m_os.flush();
		check_sink();
	}

	void Encoder::write_nil()
	{
		put(wire::tag::NIL, m_os);
	}

	void Encoder::write_bool(bool value)
	{
		put(value ? wire::tag::BOOL_TRUE : wire::tag::BOOL_FALSE, m_os);
	}

	void Encoder::write_int(int64_t value)
	{
		dump(value, m_os);
	}

	void Encoder::write_uint(uint64_t value)
	{
		dump(value, m_os);
	}

	void Encoder::write_float(float value)
	{
		put(wire::tag::FLOAT32, m_os);
		dump_data(value, m_os);
	}

	void Encoder::write_double(double value)
	{
		put(wire::tag::FLOAT64, m_os);
		dump_data(value, m_os);
	}

	void Encoder::write_string(std::string_view value)
	{
		dump_length(value.size(), wire::tag::FIXSTR, wire::FIXSTR_MAX,
			wire::tag::STR8, wire::tag::STR16, wire::tag::STR32, m_os);
		m_os.write(value.data(), static_cast<std::streamsize>(value.size()));
	}

	void Encoder::write_binary(const uint8_t *data,size_t size)
	{
		dump_length(size, 0, 0, wire::tag::BIN8, wire::tag::BIN16, wire::tag::BIN32, m_os);
		m_os.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
	}

	void Encoder::write_array_header(size_t size)
	{
		dump_length(size, wire::tag::FIXARRAY, wire::FIXARRAY_MAX,
			0, wire::tag::ARRAY16, wire::tag::ARRAY32, m_os);
	}

	void Encoder::write_map_header(size_t size)
	{
		dump_length(size, wire::tag::FIXMAP, wire::FIXMAP_MAX,
			0, wire::tag::MAP16, wire::tag::MAP32, m_os);
	}

	void Encoder::write_extension(int8_t type,const uint8_t *data,size_t size)
	{
		const uint8_t fixext=wire::fixext_tag(size);
		if(fixext != 0)
			put(fixext, m_os);
		else
			dump_length(size, 0, 0, wire::tag::EXT8, wire::tag::EXT16, wire::tag::EXT32, m_os);
		put(static_cast<uint8_t>(type), m_os);
		m_os.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
	}

	void Encoder::write_timestamp(const timestamp &value)
	{
		put(wire::tag::FIXEXT8, m_os);
		put(static_cast<uint8_t>(wire::TIMESTAMP_EXT_TYPE), m_os);
		dump_data(to_ticks(value, m_options.timestamp_resolution), m_os);
	}

	void Encoder::write_value(const Value &value)
	{
		switch(value.type())
		{
			case Value::Type::NUL       : write_nil(); break;
			case Value::Type::BOOL      : write_bool(value.as<Value::boolean>()); break;
			case Value::Type::FLOAT32   : write_float(value.as<Value::float32>()); break;
			case Value::Type::FLOAT64   : write_double(value.as<Value::float64>()); break;
			case Value::Type::INT8      : // fall through
			case Value::Type::INT16     : // fall through
			case Value::Type::INT32     : // fall through
			case Value::Type::INT64     : write_int(value.as<Value::int64>()); break;
			case Value::Type::UINT8     : // fall through
			case Value::Type::UINT16    : // fall through
			case Value::Type::UINT32    : // fall through
			case Value::Type::UINT64    : write_uint(value.as<Value::uint64>()); break;
			case Value::Type::STRING    : write_string(value.as<Value::string>()); break;
			case Value::Type::BINARY    :
			{
				const Value::binary &bytes=value.as<Value::binary>();
				write_binary(bytes.data(), bytes.size());
			} break;
			case Value::Type::EXTENSION :
			{
				const Value::extension &ext=value.as<Value::extension>();
				write_extension(ext.type, ext.data.data(), ext.data.size());
			} break;
			case Value::Type::TIMESTAMP : write_timestamp(value.as<Value::timestamp>()); break;
			case Value::Type::ARRAY     :
			{
				PathGuard guard(*this, value.m_ptr.get(), typeid(Value));
				const Value::array &elements=value.as<Value::array>();
				write_array_header(elements.size());
				for(const auto &v:elements)
					write_value(v);
			} break;
			case Value::Type::OBJECT    :
			{
				PathGuard guard(*this, value.m_ptr.get(), typeid(Value));
				const Value::object &fields=value.as<Value::object>();
				write_map_header(fields.size());
				for(const auto &v:fields)
				{
					write_string(v.first);
					write_value(v.second);
				}
			} break;
			case Value::Type::MAP       :
			{
				PathGuard guard(*this, value.m_ptr.get(), typeid(Value));
				const Value::map &entries=value.as<Value::map>();
				write_map_header(entries.size());
				for(const auto &v:entries)
				{
					write_value(v.first);
					write_value(v.second);
				}
			} break;
			default:
				throw EncodeError(EncodeError::Kind::UNSUPPORTED_TYPE,
					std::string("no wire form for ")+type_name(value.type()));
		}
	}

} // namespace tagpack
