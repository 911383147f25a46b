#pragma once

#include "tagpack/errors.hpp"
#include "tagpack/logger.hpp"
#include "tagpack/options.hpp"
#include "tagpack/traits.hpp"
#include "tagpack/value.hpp"
#include "tagpack/wire.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace tagpack
{
	/* Decoder
	 *
	 * Reads one wire value per decode() call, either into a typed destination
	 * or, with no destination, into a Value chosen by the DecodeOptions.
	 *
	 * On failure the destination is left partially written.
	 */
	class Decoder
	{
	public:
		explicit Decoder(std::istream &is,DecodeOptions options={});

		template<typename T>
		void decode(T &dst)
		{
			guarded([&]
			{
				const Head head=read_head(0);
				decode_into(head,dst,0);
			});
		}

		// Decodes through a caller supplied pointer. A null pointer has no
		// storage to receive the value.
		template<typename T>
		void decode(T *dst)
		{
			if(!dst)
				throw DecodeError(DecodeError::Kind::NO_ADDRESSABLE_TARGET,"destination pointer is null");
			decode(*dst);
		}

		// Decodes into an open target.
		Value decode();

		// Reads and discards one value.
		void skip();

		// True when the source is cleanly exhausted before the next value.
		bool at_end();

		const DecodeOptions& options() const { return m_options; }

	private:
		struct Head
		{
			wire::Family family=wire::Family::INVALID;
			uint8_t tag=0;
			bool bool_value=false;
			int64_t int_value=0;     // NEGATIVE_FIXINT, INT
			uint64_t uint_value=0;   // POSITIVE_FIXINT, UINT
			float float32_value=0;
			double float64_value=0;
			uint32_t length=0;       // STRING, BINARY, ARRAY, MAP, EXTENSION
			int8_t ext_type=0;
		};

		template<typename F>
		void guarded(F &&body)
		{
			try
			{
				body();
			}
			catch(const std::bad_alloc&)
			{
				throw DecodeError(DecodeError::Kind::ALLOCATION_FAILURE,"out of memory while building the destination");
			}
		}

		Head read_head(size_t depth);
		void read_exact(char *out,size_t size);
		uint64_t read_field(size_t size);
		std::string read_raw(uint32_t length);
		binary read_binary(uint32_t length);
		void discard(uint32_t length);
		Value read_open(const Head &head,size_t depth);
		void skip_value(const Head &head,size_t depth);
		timestamp read_timestamp(const Head &head);
		timestamp from_ticks(int64_t ticks) const;
		int64_t to_ticks(const timestamp &value) const;
		bool field_matches(std::string_view field,std::string_view key) const;

		[[noreturn]] static void mismatch(const Head &head,const char *expected);

		template<typename T>
		T read_integer(const Head &head)
		{
			if(head.family==wire::Family::POSITIVE_FIXINT || head.family==wire::Family::UINT)
			{
				if(head.uint_value>static_cast<uint64_t>(std::numeric_limits<T>::max()))
					throw DecodeError(DecodeError::Kind::NUMERIC_OVERFLOW,
						std::to_string(head.uint_value)+" does not fit the destination integer");
				return static_cast<T>(head.uint_value);
			}
			if(head.family==wire::Family::NEGATIVE_FIXINT || head.family==wire::Family::INT)
			{
				const int64_t v=head.int_value;
				bool fits;
				if constexpr(std::is_signed_v<T>)
					fits=v>=static_cast<int64_t>(std::numeric_limits<T>::min()) && v<=static_cast<int64_t>(std::numeric_limits<T>::max());
				else
					fits=v>=0 && static_cast<uint64_t>(v)<=static_cast<uint64_t>(std::numeric_limits<T>::max());
				if(!fits)
					throw DecodeError(DecodeError::Kind::NUMERIC_OVERFLOW,
						std::to_string(v)+" does not fit the destination integer");
				return static_cast<T>(v);
			}
			mismatch(head,"integer");
		}

		template<typename T>
		T read_float(const Head &head)
		{
			switch(head.family)
			{
				case wire::Family::FLOAT32         : return static_cast<T>(head.float32_value);
				case wire::Family::FLOAT64         :
				{
					if constexpr(sizeof(T)<sizeof(double))
					{
						const double limit=static_cast<double>(std::numeric_limits<T>::max());
						if(head.float64_value>limit || head.float64_value< -limit)
							throw DecodeError(DecodeError::Kind::NUMERIC_OVERFLOW,"float64 value out of float32 range");
					}
					return static_cast<T>(head.float64_value);
				}
				case wire::Family::POSITIVE_FIXINT : // fall through
				case wire::Family::UINT            : return static_cast<T>(head.uint_value);
				case wire::Family::NEGATIVE_FIXINT : // fall through
				case wire::Family::INT             : return static_cast<T>(head.int_value);
				default                            : mismatch(head,"float");
			}
		}

		template<typename T>
		void reset(T &dst)
		{
			if constexpr(Optional<T> || OwningPointer<T>)
				dst.reset();
			else if constexpr(RawPointer<T>)
				dst=nullptr;
			else
				dst=T{};
		}

		template<typename T>
		void decode_record(const Head &head,T &dst,size_t depth);

		template<typename T>
		void decode_into(const Head &head,T &dst,size_t depth);

		std::istream &m_is;
		const DecodeOptions m_options;
	};

	template<typename T>
	void Decoder::decode_record(const Head &head,T &dst,size_t depth)
	{
		if(head.family!=wire::Family::MAP)
			mismatch(head,"map for a record");

		const auto fields=T::fields();
		for(uint32_t i=0;i<head.length;++i)
		{
			const Head key=read_head(depth+1);
			if(key.family!=wire::Family::STRING && key.family!=wire::Family::BINARY)
			{
				TAGPACK_LOG_TRACE(std::string("skipping record entry with a ")+wire::family_name(key.family)+" key");
				skip_value(key,depth+1);
				skip_value(read_head(depth+1),depth+1);
				continue;
			}
			const std::string name=read_raw(key.length);
			const Head value=read_head(depth+1);
			bool matched=false;
			std::apply([&](const auto&... f)
			{
				((!matched && field_matches(f.name,name) ?
					(matched=true,decode_into(value,dst.*(f.member),depth+1)) : void()),...);
			},fields);
			if(!matched)
			{
				TAGPACK_LOG_TRACE("skipping unknown record field \""+name+"\"");
				skip_value(value,depth+1);
			}
		}
	}

	template<typename T>
	void Decoder::decode_into(const Head &head,T &dst,size_t depth)
	{
		if constexpr(std::is_same_v<T,Value>)
		{
			dst=read_open(head,depth);
			return;
		}
		else
		{
			if(head.family==wire::Family::NIL)
			{
				reset(dst);
				return;
			}

			if constexpr(std::is_same_v<T,bool>)
			{
				if(head.family!=wire::Family::BOOL)
					mismatch(head,"bool");
				dst=head.bool_value;
			}
			else if constexpr(std::is_floating_point_v<T>)
			{
				dst=read_float<T>(head);
			}
			else if constexpr(Integer<T>)
			{
				dst=read_integer<T>(head);
			}
			else if constexpr(std::is_enum_v<T>)
			{
				dst=static_cast<T>(read_integer<std::underlying_type_t<T>>(head));
			}
			else if constexpr(std::is_same_v<T,std::string>)
			{
				if(head.family!=wire::Family::STRING && head.family!=wire::Family::BINARY)
					mismatch(head,"str");
				dst=read_raw(head.length);
			}
			else if constexpr(std::is_same_v<T,binary>)
			{
				if(head.family!=wire::Family::BINARY && head.family!=wire::Family::STRING)
					mismatch(head,"bin");
				dst=read_binary(head.length);
			}
			else if constexpr(std::is_same_v<T,Extension>)
			{
				if(head.family!=wire::Family::EXTENSION)
					mismatch(head,"ext");
				dst.type=head.ext_type;
				dst.data=read_binary(head.length);
			}
			else if constexpr(Timestamp<T>)
			{
				dst=std::chrono::time_point_cast<typename T::duration>(read_timestamp(head));
			}
			else if constexpr(Optional<T>)
			{
				if(!dst)
					dst.emplace();
				decode_into(head,*dst,depth);
			}
			else if constexpr(OwningPointer<T>)
			{
				if(!dst)
				{
					if constexpr(detail::is_unique_pointer<T>::value)
						dst=std::make_unique<typename T::element_type>();
					else
						dst=std::make_shared<typename T::element_type>();
				}
				decode_into(head,*dst,depth);
			}
			else if constexpr(RawPointer<T>)
			{
				if(!dst)
					throw DecodeError(DecodeError::Kind::NO_ADDRESSABLE_TARGET,
						"pointer field is null and has no storage to decode into");
				decode_into(head,*dst,depth);
			}
			else if constexpr(Record<T>)
			{
				decode_record(head,dst,depth);
			}
			else if constexpr(Mapping<T>)
			{
				if(head.family!=wire::Family::MAP)
					mismatch(head,"map");
				dst.clear();
				for(uint32_t i=0;i<head.length;++i)
				{
					typename T::key_type key{};
					decode_into(read_head(depth+1),key,depth+1);
					typename T::mapped_type value{};
					decode_into(read_head(depth+1),value,depth+1);
					dst.insert_or_assign(std::move(key),std::move(value));
				}
			}
			else if constexpr(Sequence<T>)
			{
				if(head.family!=wire::Family::ARRAY)
					mismatch(head,"array");
				dst.clear();
				if constexpr(Reservable<T>)
				{
					// a corrupt length must not reserve unbounded memory
					dst.reserve(std::min<size_t>(head.length,4096));
				}
				for(uint32_t i=0;i<head.length;++i)
				{
					typename T::value_type element{};
					decode_into(read_head(depth+1),element,depth+1);
					dst.push_back(std::move(element));
				}
			}
			else
			{
				static_assert(detail::dependent_false<T>,"type has no MessagePack representation");
			}
		}
	}

} // namespace tagpack
