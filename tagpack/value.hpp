#pragma once

#include "tagpack/options.hpp"
#include "tagpack/types.hpp"

#include <deque>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tagpack
{
	class Value;
}
namespace std
{
	template<>
	struct hash<tagpack::Value>
	{
		size_t operator()(const tagpack::Value&) const noexcept;
	};
}
namespace tagpack
{
	class ValueImpl;
	class Encoder;

	/* Value
	 *
	 * Freeform decoded value. Produced when the decode destination has no fixed
	 * shape; encodes by its runtime category. Copies share the same storage.
	 */
	class Value final
	{
	public:
		// Types
		// NB: all ints are numbers but not all numbers are ints.
		enum class Type : uint8_t
		{
			NUMBER      = 1,
			INT         = 2 | NUMBER,
			NUL         = 1 << 2,
			FLOAT32     = 2 << 2 | NUMBER,
			FLOAT64     = 3 << 2 | NUMBER,
			INT8        = 4 << 2 | INT,
			INT16       = 5 << 2 | INT,
			INT32       = 6 << 2 | INT,
			INT64       = 7 << 2 | INT,
			UINT8       = 8 << 2 | INT,
			UINT16      = 9 << 2 | INT,
			UINT32      = 10 << 2 | INT,
			UINT64      = 11 << 2 | INT,
			BOOL        = 12 << 2,
			STRING      = 13 << 2,
			BINARY      = 14 << 2,
			ARRAY       = 15 << 2,
			OBJECT      = 16 << 2,
			MAP         = 17 << 2,
			EXTENSION   = 18 << 2,
			TIMESTAMP   = 19 << 2
		};

		// Container typedefs. OBJECT is keyed by text, MAP by any value.
		using array=std::deque<Value>;
		using object=std::unordered_map<std::string,Value>;
		using map=std::unordered_map<Value,Value>;
		using string=std::string;
		//floats
		using float32=float;
		using float64=double;
		//boolean
		using boolean=bool;
		using binary=tagpack::binary;
		using extension=Extension;
		using timestamp=tagpack::timestamp;

		//integers
		using int8=int8_t;
		using int16=int16_t;
		using int32=int32_t;
		using int64=int64_t;
		using uint8=uint8_t;
		using uint16=uint16_t;
		using uint32=uint32_t;
		using uint64=uint64_t;

		Value();                            // NUL
		Value(std::nullptr_t);              // NUL
		Value(float32 value);               // FLOAT32
		Value(float64 value);               // FLOAT64
		Value(int8 value);                  // INT8
		Value(int16 value);                 // INT16
		Value(int32 value);                 // INT32
		Value(int64 value);                 // INT64
		Value(uint8 value);                 // UINT8
		Value(uint16 value);                // UINT16
		Value(uint32 value);                // UINT32
		Value(uint64 value);                // UINT64
		Value(bool value);                  // BOOL
		Value(const char *value);           // STRING
		Value(const string &value);         // STRING
		Value(string &&value);              // STRING
		Value(const array &values);         // ARRAY
		Value(array &&values);              // ARRAY
		Value(const object &values);        // OBJECT
		Value(object &&values);             // OBJECT
		Value(const map &values);           // MAP
		Value(map &&values);                // MAP
		Value(const binary &values);        // BINARY
		Value(binary &&values);             // BINARY
		Value(const extension &value);      // EXTENSION
		Value(extension &&value);           // EXTENSION
		Value(const timestamp &value);      // TIMESTAMP

		// Implicit constructor: anything with a to_value() function.
		template <class T> requires requires(const T &thing){Value(thing.to_value());}
		Value(const T &t) : Value(t.to_value()) {}

		// Implicit constructor: map-like objects (std::map, std::unordered_map, etc).
		// Text keys build an OBJECT, anything else a MAP.
		template <class M> requires
		(
			requires(const M &m)
			{
				typename M::key_type;
				typename M::mapped_type;
				std::begin(m);
				std::end(m);
			}&&
			requires(typename M::key_type key){Value(key);}&&
			requires(typename M::mapped_type value){Value(value);}&&
			!std::is_same_v<M,object>&&
			!std::is_same_v<M,map>
		)
		Value(const M &m) : Value(from_mapping(m)) {}

		// Implicit constructor: vector-like objects (std::list, std::vector, std::set, etc)
		template <class V> requires
		(
			requires(const V &arr)
			{
				typename V::value_type;
				std::begin(arr);
				std::end(arr);
			}&&
			requires(typename V::value_type value){Value(value);}&&
			!std::is_same_v<typename binary::value_type,typename V::value_type>&&
			!std::is_same_v<V,array>&&
			!std::is_same_v<V,string>&&
			!std::is_same_v<V,binary>&&
			!std::is_same_v<V,object>&&
			!std::is_same_v<V,map>
		)
		Value(const V &v) : Value(array(std::begin(v),std::end(v))) {}

		// Implicit constructor: byte sequences other than binary itself.
		template <class V> requires
		(
			requires(const V &arr)
			{
				typename V::value_type;
				std::begin(arr);
				std::end(arr);
			}&&
			std::is_same_v<typename binary::value_type,typename V::value_type>&&
			!std::is_same_v<V,binary>&&
			!std::is_same_v<V,string>
		)
		Value(const V &v) : Value(binary(std::begin(v),std::end(v))) {}

		// This prevents Value(some_pointer) from accidentally producing a bool. Use
		// Value(bool(some_pointer)) if that behavior is desired.
		Value(void *) = delete;

		// Accessors
		Type type() const;

		bool is_null()      const { return type() == Type::NUL; }
		bool is_boolean()   const { return type() == Type::BOOL; }
		bool is_number()    const { return static_cast<uint8_t>(type())&static_cast<uint8_t>(Type::NUMBER); }
		bool is_float32()   const { return type() == Type::FLOAT32; }
		bool is_float64()   const { return type() == Type::FLOAT64; }
		bool is_int()       const { return (static_cast<uint8_t>(type())&static_cast<uint8_t>(Type::INT))==static_cast<uint8_t>(Type::INT); }
		bool is_int8()      const { return type() == Type::INT8; }
		bool is_int16()     const { return type() == Type::INT16; }
		bool is_int32()     const { return type() == Type::INT32; }
		bool is_int64()     const { return type() == Type::INT64; }
		bool is_uint8()     const { return type() == Type::UINT8; }
		bool is_uint16()    const { return type() == Type::UINT16; }
		bool is_uint32()    const { return type() == Type::UINT32; }
		bool is_uint64()    const { return type() == Type::UINT64; }
		bool is_string()    const { return type() == Type::STRING; }
		bool is_array()     const { return type() == Type::ARRAY; }
		bool is_binary()    const { return type() == Type::BINARY; }
		bool is_object()    const { return type() == Type::OBJECT; }
		bool is_map()       const { return type() == Type::MAP; }
		bool is_extension() const { return type() == Type::EXTENSION; }
		bool is_timestamp() const { return type() == Type::TIMESTAMP; }

		// Numbers convert between widths (static_cast semantics); every other
		// category must match exactly. Throws TypeError otherwise.
		template<typename T> requires(std::is_fundamental_v<T>)
		explicit operator T() const;
		template<typename T> requires(std::is_fundamental_v<T>)
		T as() const{return operator T();}

		template<typename T> requires(!std::is_fundamental_v<T>)
		explicit operator const T&() const;
		template<typename T> requires(!std::is_fundamental_v<T>)
		const T& as() const{return operator const T&();}

		// Mutable access to the stored value; the type must match exactly.
		template<typename T> requires(!std::is_const_v<T>)
		T& get();

		// Return a reference to arr[i] if this is an array, throws otherwise.
		const Value& operator[](size_t i) const;
		Value& operator[](size_t i);
		// Return a reference to obj[key] if this is an object or map, throws otherwise.
		const Value& operator[](const Value &key) const;
		// Return a reference to obj[key], creating a new member if missing.
		Value& operator[](const Value &key);

		// Serialize.
		void dump(std::string &out) const;
		std::string dump() const;

		friend std::ostream& operator<<(std::ostream& os, const Value& value);
		// Parse with default options. If parse fails, set value to Value() and
		// sets failbit on stream.
		friend std::istream& operator>>(std::istream& is, Value& value);

		// Parse. If parse fails, return Value() and assign an error message to err.
		static Value parse(const std::string &in, std::string &err, const DecodeOptions &options = {});
		// Parse. Throws DecodeError.
		static Value parse(std::istream &is, const DecodeOptions &options = {});

		bool operator== (const Value &rhs) const;

		/* has_shape(types, err)
		 *
		 * Return true if this is an object and, for each item in types, has a field of
		 * the given type. If not, return false and set err to a descriptive message.
		 */
		typedef std::initializer_list<std::pair<std::string, Type>> shape;
		bool has_shape(const shape &types, std::string &err) const;

	private:
		template<class M>
		static Value from_mapping(const M &m)
		{
			if constexpr(std::is_convertible_v<typename M::key_type,std::string>)
				return Value(object(std::begin(m),std::end(m)));
			else
				return Value(map(std::begin(m),std::end(m)));
		}

		std::shared_ptr<ValueImpl> m_ptr;
		friend struct std::hash<Value>;
		friend class Encoder;
	};

	const char *type_name(Value::Type type);

} // namespace tagpack
