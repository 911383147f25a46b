#pragma once

#include "tagpack/errors.hpp"
#include "tagpack/options.hpp"
#include "tagpack/traits.hpp"
#include "tagpack/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <tuple>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace tagpack
{
	/* Encoder
	 *
	 * Writes values to an output stream in the shortest applicable MessagePack
	 * form. One encode() call writes exactly one wire value. A failed call
	 * leaves whatever bytes were already written on the stream; callers
	 * discard them.
	 *
	 * Not safe for concurrent use: each call keeps the chain of pointers it is
	 * currently inside to reject cycles.
	 */
	class Encoder
	{
	public:
		explicit Encoder(std::ostream &os,EncodeOptions options={});

		template<typename T>
		void encode(const T &value)
		{
			m_path.clear();
			check_sink();
			encode_value(value);
			check_sink();
		}

		// Flush the underlying stream, reporting a failed sink.
		void flush();

		const EncodeOptions& options() const { return m_options; }

		// Primitive writers. Each writes one complete wire item (or header).
		void write_nil();
		void write_bool(bool value);
		void write_int(int64_t value);
		void write_uint(uint64_t value);
		void write_float(float value);
		void write_double(double value);
		void write_string(std::string_view value);
		void write_binary(const uint8_t *data,size_t size);
		void write_array_header(size_t size);
		void write_map_header(size_t size);
		void write_extension(int8_t type,const uint8_t *data,size_t size);
		void write_timestamp(const timestamp &value);
		void write_value(const Value &value);

	private:
		// Marks a pointee as being encoded for as long as it is alive. A member
		// can share its record's address, so the type is part of the key.
		class PathGuard
		{
		public:
			PathGuard(Encoder &encoder,const void *address,std::type_index type);
			~PathGuard();
			PathGuard(const PathGuard&)=delete;
			PathGuard& operator=(const PathGuard&)=delete;
		private:
			Encoder &m_encoder;
		};

		template<typename T>
		void encode_value(const T &value);

		template<typename T>
		void encode_pointee(const T *pointee)
		{
			if(!pointee)
			{
				write_nil();
				return;
			}
			PathGuard guard(*this,pointee,typeid(T));
			encode_value(*pointee);
		}

		void check_sink();

		std::ostream &m_os;
		EncodeOptions m_options;
		std::vector<std::pair<const void*,std::type_index>> m_path;
	};

	template<typename T>
	void Encoder::encode_value(const T &value)
	{
		if constexpr(std::is_same_v<T,Value>)
		{
			write_value(value);
		}
		else if constexpr(std::is_same_v<T,std::nullptr_t>)
		{
			write_nil();
		}
		else if constexpr(std::is_same_v<T,bool>)
		{
			write_bool(value);
		}
		else if constexpr(std::is_floating_point_v<T>)
		{
			if constexpr(sizeof(T)==sizeof(float))
				write_float(value);
			else
				write_double(static_cast<double>(value));
		}
		else if constexpr(Integer<T>)
		{
			if constexpr(std::is_signed_v<T>)
				write_int(static_cast<int64_t>(value));
			else
				write_uint(static_cast<uint64_t>(value));
		}
		else if constexpr(std::is_enum_v<T>)
		{
			encode_value(static_cast<std::underlying_type_t<T>>(value));
		}
		else if constexpr(Text<T>)
		{
			if constexpr(std::is_pointer_v<T>)
			{
				if(!value)
				{
					write_nil();
					return;
				}
			}
			write_string(std::string_view(value));
		}
		else if constexpr(std::is_same_v<T,binary>)
		{
			write_binary(value.data(),value.size());
		}
		else if constexpr(std::is_same_v<T,Extension>)
		{
			write_extension(value.type,value.data.data(),value.data.size());
		}
		else if constexpr(Timestamp<T>)
		{
			write_timestamp(std::chrono::time_point_cast<timestamp::duration>(value));
		}
		else if constexpr(Optional<T>)
		{
			if(!value)
				write_nil();
			else
				encode_value(*value);
		}
		else if constexpr(OwningPointer<T>)
		{
			encode_pointee(value.get());
		}
		else if constexpr(RawPointer<T>)
		{
			encode_pointee(value);
		}
		else if constexpr(Record<T>)
		{
			const auto fields=T::fields();
			write_map_header(std::tuple_size_v<std::remove_cvref_t<decltype(fields)>>);
			std::apply([&](const auto&... f)
			{
				((write_string(f.name),encode_value(value.*(f.member))),...);
			},fields);
		}
		else if constexpr(Mapping<T>)
		{
			write_map_header(value.size());
			for(const auto &entry:value)
			{
				encode_value(entry.first);
				encode_value(entry.second);
			}
		}
		else if constexpr(Sequence<T>)
		{
			write_array_header(value.size());
			for(const auto &element:value)
				encode_value(element);
		}
		else if constexpr(ValueConvertible<T>)
		{
			write_value(value.to_value());
		}
		else
		{
			static_assert(detail::dependent_false<T>,"type has no MessagePack representation");
		}
	}

} // namespace tagpack
