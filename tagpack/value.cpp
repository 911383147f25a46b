#include "tagpack/value.hpp"
#include "tagpack/decoder.hpp"
#include "tagpack/encoder.hpp"
#include "tagpack/errors.hpp"

#include <bit>
#include <cmath>
#include <functional>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <typeindex>

namespace tagpack
{
	using int128=__int128;

	/* * * * * * * * * * * * * * * * * * * *
	 * ValueImpl
	 */

	class ValueImpl
	{
	public:
		Value::Type type()                                              const;
		virtual bool operator==(const ValueImpl &other)                 const=0;
		//immutable type specify
		virtual explicit operator Value::float32          ()const;
		virtual explicit operator Value::float64          ()const;
		virtual explicit operator int128                  ()const;
		virtual explicit operator Value::int8             ()const;
		virtual explicit operator Value::int16            ()const;
		virtual explicit operator Value::int32            ()const;
		virtual explicit operator Value::int64            ()const;
		virtual explicit operator Value::uint8            ()const;
		virtual explicit operator Value::uint16           ()const;
		virtual explicit operator Value::uint32           ()const;
		virtual explicit operator Value::uint64           ()const;
		virtual explicit operator Value::boolean          ()const;
		virtual explicit operator Value::string    const &()const;
		virtual explicit operator Value::array     const &()const;
		virtual explicit operator Value::binary    const &()const;
		virtual explicit operator Value::object    const &()const;
		virtual explicit operator Value::map       const &()const;
		virtual explicit operator Value::extension const &()const;
		virtual explicit operator Value::timestamp const &()const;
		//mutable type specify
		virtual explicit operator Value::float32    &();
		virtual explicit operator Value::float64    &();
		virtual explicit operator Value::int8       &();
		virtual explicit operator Value::int16      &();
		virtual explicit operator Value::int32      &();
		virtual explicit operator Value::int64      &();
		virtual explicit operator Value::uint8      &();
		virtual explicit operator Value::uint16     &();
		virtual explicit operator Value::uint32     &();
		virtual explicit operator Value::uint64     &();
		virtual explicit operator Value::boolean    &();
		virtual explicit operator Value::string     &();
		virtual explicit operator Value::array      &();
		virtual explicit operator Value::binary     &();
		virtual explicit operator Value::object     &();
		virtual explicit operator Value::map        &();
		virtual explicit operator Value::extension  &();
		virtual explicit operator Value::timestamp  &();
		//member accessing
		virtual Value              const &operator[](size_t i)          const;
		virtual Value                    &operator[](size_t i);
		virtual Value              const &operator[](const Value &key)  const;
		virtual Value                    &operator[](const Value &key);
		virtual ~ValueImpl()=default;
	};

	namespace
	{
		// Stored payload of a NUL value.
		struct Nil
		{
			bool operator==(const Nil&) const=default;
		};
	}

	/* * * * * * * * * * * * * * * * * * * *
	 * Value wrappers
	 */

	template <typename T>
	class Holder : public ValueImpl
	{
	public:
		// Constructors
		Holder(T value) requires(std::is_fundamental_v<T>):m_value(value){}
		Holder(const T& value) requires(std::is_class_v<T>):m_value(value){}
		Holder(T&& value) requires(std::is_class_v<T>):m_value(std::move(value)){}
		Holder():m_value(){}
		// Comparisons
		virtual bool operator==(const ValueImpl &other) const override
		{
			return (type()==other.type())&&(m_value==static_cast<const Holder<T>&>(other).m_value);
		}
		T m_value;
		virtual explicit operator T&(){return m_value;}
	};

	template<typename T> requires(std::is_fundamental_v<T>)
	class Number final: public Holder<T>
	{
	public:
		Number(T value):Holder<T>(value){}

		bool operator ==(const ValueImpl &other) const override
		{
			if constexpr(std::is_same_v<T,Value::boolean>)
				return Holder<T>::operator ==(other);
			switch( other.type() )
			{
				case Value::Type::FLOAT32 : // fall through
				case Value::Type::FLOAT64 : // fall through
				{
					return operator Value::float64()==other.operator Value::float64();
				} break;
				case Value::Type::UINT8   : // fall through
				case Value::Type::UINT16  : // fall through
				case Value::Type::UINT32  : // fall through
				case Value::Type::UINT64  : // fall through
				case Value::Type::INT8    : // fall through
				case Value::Type::INT16   : // fall through
				case Value::Type::INT32   : // fall through
				case Value::Type::INT64   : // fall through
				{
					if constexpr(std::is_floating_point_v<T>)
						return operator Value::float64()==other.operator Value::float64();
					else
						return operator int128()==other.operator int128();
				} break;
				default:
				{
					return Holder<T>::operator ==(other);
				} break;
			}
		}

		virtual explicit operator Value::float32   ()const override{return static_cast<Value::float32>(Holder<T>::m_value);}
		virtual explicit operator Value::float64   ()const override{return static_cast<Value::float64>(Holder<T>::m_value);}
		virtual explicit operator Value::int8      ()const override{return static_cast<Value::int8>   (Holder<T>::m_value);}
		virtual explicit operator Value::int16     ()const override{return static_cast<Value::int16>  (Holder<T>::m_value);}
		virtual explicit operator Value::int32     ()const override{return static_cast<Value::int32>  (Holder<T>::m_value);}
		virtual explicit operator Value::int64     ()const override{return static_cast<Value::int64>  (Holder<T>::m_value);}
		virtual explicit operator Value::uint8     ()const override{return static_cast<Value::uint8>  (Holder<T>::m_value);}
		virtual explicit operator Value::uint16    ()const override{return static_cast<Value::uint16> (Holder<T>::m_value);}
		virtual explicit operator Value::uint32    ()const override{return static_cast<Value::uint32> (Holder<T>::m_value);}
		virtual explicit operator Value::uint64    ()const override{return static_cast<Value::uint64> (Holder<T>::m_value);}
		virtual explicit operator int128           ()const override{return static_cast<int128>        (Holder<T>::m_value);}
		virtual explicit operator Value::boolean   ()const override{return static_cast<Value::boolean>(Holder<T>::m_value);}
	};

	template class Number<Value::float32>;
	template class Number<Value::float64>;
	template class Number<Value::int8>;
	template class Number<Value::int16>;
	template class Number<Value::int32>;
	template class Number<Value::int64>;
	template class Number<Value::uint8>;
	template class Number<Value::uint16>;
	template class Number<Value::uint32>;
	template class Number<Value::uint64>;
	template class Number<Value::boolean>;

	template<typename T> requires(std::is_class_v<T>)
	class Compound final: public Holder<T>
	{
	public:
		virtual explicit operator const T&() const override{return Holder<T>::m_value;}
		Compound(const T& thing):Holder<T>(thing){}
		Compound(T&& thing):Holder<T>(std::move(thing)){}

		const Value & operator[](size_t i) const override
		{
			if constexpr(std::is_same_v<T,Value::array>)
				return Holder<T>::m_value.at(i);
			else
				throw TypeError(typeid(Value::array),typeid(T));
		}
		Value & operator[](size_t i) override
		{
			if constexpr(std::is_same_v<T,Value::array>)
				return Holder<T>::m_value.at(i);
			else
				throw TypeError(typeid(Value::array),typeid(T));
		}

		Value const &operator[](const Value &key) const override
		{
			if constexpr(std::is_same_v<T,Value::object>)
				return Holder<T>::m_value.at(key.as<Value::string>());
			else if constexpr(std::is_same_v<T,Value::map>)
				return Holder<T>::m_value.at(key);
			else
				throw TypeError(typeid(Value::object),typeid(T));
		}
		Value& operator[](const Value &key) override
		{
			if constexpr(std::is_same_v<T,Value::object>)
				return Holder<T>::m_value[key.as<Value::string>()];
			else if constexpr(std::is_same_v<T,Value::map>)
				return Holder<T>::m_value[key];
			else
				throw TypeError(typeid(Value::object),typeid(T));
		}
	};
	template class Compound<Value::string>;
	template class Compound<Value::array>;
	template class Compound<Value::binary>;
	template class Compound<Value::object>;
	template class Compound<Value::map>;
	template class Compound<Value::extension>;
	template class Compound<Value::timestamp>;

	template class Holder<Nil>;

	Value::Type ValueImpl::type()const
	{
		static const std::unordered_map<std::type_index,Value::Type>table
		{
			{typeid(Number<Value::float32>),Value::Type::FLOAT32},
			{typeid(Number<Value::float64>),Value::Type::FLOAT64},
			{typeid(Number<Value::int8>),Value::Type::INT8},
			{typeid(Number<Value::int16>),Value::Type::INT16},
			{typeid(Number<Value::int32>),Value::Type::INT32},
			{typeid(Number<Value::int64>),Value::Type::INT64},
			{typeid(Number<Value::uint8>),Value::Type::UINT8},
			{typeid(Number<Value::uint16>),Value::Type::UINT16},
			{typeid(Number<Value::uint32>),Value::Type::UINT32},
			{typeid(Number<Value::uint64>),Value::Type::UINT64},
			{typeid(Number<Value::boolean>),Value::Type::BOOL},
			{typeid(Compound<Value::array>),Value::Type::ARRAY},
			{typeid(Compound<Value::extension>),Value::Type::EXTENSION},
			{typeid(Compound<Value::object>),Value::Type::OBJECT},
			{typeid(Compound<Value::map>),Value::Type::MAP},
			{typeid(Compound<Value::binary>),Value::Type::BINARY},
			{typeid(Compound<Value::string>),Value::Type::STRING},
			{typeid(Compound<Value::timestamp>),Value::Type::TIMESTAMP},
			{typeid(Holder<Nil>),Value::Type::NUL}
		};
		return table.at(typeid(*this));
	}

	const char *type_name(Value::Type type)
	{
		switch(type)
		{
			case Value::Type::NUMBER    : return "number";
			case Value::Type::INT       : return "int";
			case Value::Type::NUL       : return "nil";
			case Value::Type::FLOAT32   : return "float32";
			case Value::Type::FLOAT64   : return "float64";
			case Value::Type::INT8      : return "int8";
			case Value::Type::INT16     : return "int16";
			case Value::Type::INT32     : return "int32";
			case Value::Type::INT64     : return "int64";
			case Value::Type::UINT8     : return "uint8";
			case Value::Type::UINT16    : return "uint16";
			case Value::Type::UINT32    : return "uint32";
			case Value::Type::UINT64    : return "uint64";
			case Value::Type::BOOL      : return "bool";
			case Value::Type::STRING    : return "string";
			case Value::Type::BINARY    : return "binary";
			case Value::Type::ARRAY     : return "array";
			case Value::Type::OBJECT    : return "object";
			case Value::Type::MAP       : return "map";
			case Value::Type::EXTENSION : return "extension";
			case Value::Type::TIMESTAMP : return "timestamp";
		}
		return "unknown";
	}

	/* * * * * * * * * * * * * * * * * * * *
	 * Constructors
	 */

	Value::Value()                                 : m_ptr(std::make_shared<Holder<Nil>>()){}
	Value::Value(std::nullptr_t)                   : m_ptr(std::make_shared<Holder<Nil>>()){}
	Value::Value(Value::float32 value)             : m_ptr(std::make_shared<Number<Value::float32>>(value)) {}
	Value::Value(Value::float64 value)             : m_ptr(std::make_shared<Number<Value::float64>>(value)) {}
	Value::Value(Value::int8 value)                : m_ptr(std::make_shared<Number<Value::int8>>(value)) {}
	Value::Value(Value::int16 value)               : m_ptr(std::make_shared<Number<Value::int16>>(value)) {}
	Value::Value(Value::int32 value)               : m_ptr(std::make_shared<Number<Value::int32>>(value)) {}
	Value::Value(Value::int64 value)               : m_ptr(std::make_shared<Number<Value::int64>>(value)) {}
	Value::Value(Value::uint8 value)               : m_ptr(std::make_shared<Number<Value::uint8>>(value)) {}
	Value::Value(Value::uint16 value)              : m_ptr(std::make_shared<Number<Value::uint16>>(value)) {}
	Value::Value(Value::uint32 value)              : m_ptr(std::make_shared<Number<Value::uint32>>(value)) {}
	Value::Value(Value::uint64 value)              : m_ptr(std::make_shared<Number<Value::uint64>>(value)) {}
	Value::Value(Value::boolean value)             : m_ptr(std::make_shared<Number<Value::boolean>>(value)) {}
	Value::Value(const char *value)                : m_ptr(std::make_shared<Compound<Value::string>>(value ? Value::string(value) : Value::string())) {}
	Value::Value(const Value::string &value)       : m_ptr(std::make_shared<Compound<Value::string>>(value)) {}
	Value::Value(Value::string &&value)            : m_ptr(std::make_shared<Compound<Value::string>>(std::move(value))) {}
	Value::Value(const Value::array &values)       : m_ptr(std::make_shared<Compound<Value::array>>(values)) {}
	Value::Value(Value::array &&values)            : m_ptr(std::make_shared<Compound<Value::array>>(std::move(values))) {}
	Value::Value(const Value::object &values)      : m_ptr(std::make_shared<Compound<Value::object>>(values)) {}
	Value::Value(Value::object &&values)           : m_ptr(std::make_shared<Compound<Value::object>>(std::move(values))) {}
	Value::Value(const Value::map &values)         : m_ptr(std::make_shared<Compound<Value::map>>(values)) {}
	Value::Value(Value::map &&values)              : m_ptr(std::make_shared<Compound<Value::map>>(std::move(values))) {}
	Value::Value(const Value::binary &values)      : m_ptr(std::make_shared<Compound<Value::binary>>(values)) {}
	Value::Value(Value::binary &&values)           : m_ptr(std::make_shared<Compound<Value::binary>>(std::move(values))) {}
	Value::Value(const Value::extension &value)    : m_ptr(std::make_shared<Compound<Value::extension>>(value)) {}
	Value::Value(Value::extension &&value)         : m_ptr(std::make_shared<Compound<Value::extension>>(std::move(value))) {}
	Value::Value(const Value::timestamp &value)    : m_ptr(std::make_shared<Compound<Value::timestamp>>(value)) {}

	/* * * * * * * * * * * * * * * * * * * *
	 * Accessors
	 */

	Value::Type Value::type() const{ return m_ptr->type(); }
	//immutable type specify
	template<typename T> requires(std::is_fundamental_v<T>)
	Value::operator T() const{return m_ptr->operator T();}
	template<typename T> requires(!std::is_fundamental_v<T>)
	Value::operator const T&() const{return m_ptr->operator const T&();}
	//mutable ones
	template<typename T> requires(!std::is_const_v<T>)
	T& Value::get(){return m_ptr->operator T&();}

	template Value::operator Value::int8() const;
	template Value::operator Value::int16() const;
	template Value::operator Value::int32() const;
	template Value::operator Value::int64() const;
	template Value::operator Value::uint8() const;
	template Value::operator Value::uint16() const;
	template Value::operator Value::uint32() const;
	template Value::operator Value::uint64() const;
	template Value::operator Value::float32() const;
	template Value::operator Value::float64() const;
	template Value::operator Value::boolean() const;
	template Value::operator const Value::string&() const;
	template Value::operator const Value::array&() const;
	template Value::operator const Value::object&() const;
	template Value::operator const Value::map&() const;
	template Value::operator const Value::binary&() const;
	template Value::operator const Value::extension&() const;
	template Value::operator const Value::timestamp&() const;

	template Value::int8& Value::get<Value::int8>();
	template Value::int16& Value::get<Value::int16>();
	template Value::int32& Value::get<Value::int32>();
	template Value::int64& Value::get<Value::int64>();
	template Value::uint8& Value::get<Value::uint8>();
	template Value::uint16& Value::get<Value::uint16>();
	template Value::uint32& Value::get<Value::uint32>();
	template Value::uint64& Value::get<Value::uint64>();
	template Value::float32& Value::get<Value::float32>();
	template Value::float64& Value::get<Value::float64>();
	template Value::boolean& Value::get<Value::boolean>();
	template Value::string& Value::get<Value::string>();
	template Value::array& Value::get<Value::array>();
	template Value::object& Value::get<Value::object>();
	template Value::map& Value::get<Value::map>();
	template Value::binary& Value::get<Value::binary>();
	template Value::extension& Value::get<Value::extension>();
	template Value::timestamp& Value::get<Value::timestamp>();

	const Value &Value::operator[] (size_t i)                     const { return m_ptr->operator[](i); }
	Value &Value::operator[] (size_t i)                                 { return m_ptr->operator[](i); }
	const Value &Value::operator[] (const Value &key)             const { return m_ptr->operator[](key); }
	Value &Value::operator[] (const Value &key)                         { return m_ptr->operator[](key); }

	//immutable
	ValueImpl::operator Value::float32             ()   const { throw TypeError(typeid(Number<Value::float32>),typeid(*this)); }
	ValueImpl::operator Value::float64             ()   const { throw TypeError(typeid(Number<Value::float64>),typeid(*this)); }
	ValueImpl::operator int128                     ()   const { throw TypeError(typeid(int128),typeid(*this)); }
	ValueImpl::operator Value::int8                ()   const { throw TypeError(typeid(Number<Value::int8>),typeid(*this)); }
	ValueImpl::operator Value::int16               ()   const { throw TypeError(typeid(Number<Value::int16>),typeid(*this)); }
	ValueImpl::operator Value::int32               ()   const { throw TypeError(typeid(Number<Value::int32>),typeid(*this)); }
	ValueImpl::operator Value::int64               ()   const { throw TypeError(typeid(Number<Value::int64>),typeid(*this)); }
	ValueImpl::operator Value::uint8               ()   const { throw TypeError(typeid(Number<Value::uint8>),typeid(*this)); }
	ValueImpl::operator Value::uint16              ()   const { throw TypeError(typeid(Number<Value::uint16>),typeid(*this)); }
	ValueImpl::operator Value::uint32              ()   const { throw TypeError(typeid(Number<Value::uint32>),typeid(*this)); }
	ValueImpl::operator Value::uint64              ()   const { throw TypeError(typeid(Number<Value::uint64>),typeid(*this)); }
	ValueImpl::operator Value::boolean             ()   const { throw TypeError(typeid(Number<Value::boolean>),typeid(*this)); }
	ValueImpl::operator Value::string       const &()   const { throw TypeError(typeid(Compound<Value::string>),typeid(*this)); }
	ValueImpl::operator Value::array        const &()   const { throw TypeError(typeid(Compound<Value::array>),typeid(*this)); }
	ValueImpl::operator Value::object       const &()   const { throw TypeError(typeid(Compound<Value::object>),typeid(*this)); }
	ValueImpl::operator Value::map          const &()   const { throw TypeError(typeid(Compound<Value::map>),typeid(*this)); }
	ValueImpl::operator Value::binary       const &()   const { throw TypeError(typeid(Compound<Value::binary>),typeid(*this)); }
	ValueImpl::operator Value::extension    const &()   const { throw TypeError(typeid(Compound<Value::extension>),typeid(*this)); }
	ValueImpl::operator Value::timestamp    const &()   const { throw TypeError(typeid(Compound<Value::timestamp>),typeid(*this)); }
	//mutable
	ValueImpl::operator Value::float32  &()         { throw TypeError(typeid(Number<Value::float32>),typeid(*this)); }
	ValueImpl::operator Value::float64  &()         { throw TypeError(typeid(Number<Value::float64>),typeid(*this)); }
	ValueImpl::operator Value::int8     &()         { throw TypeError(typeid(Number<Value::int8>),typeid(*this)); }
	ValueImpl::operator Value::int16    &()         { throw TypeError(typeid(Number<Value::int16>),typeid(*this)); }
	ValueImpl::operator Value::int32    &()         { throw TypeError(typeid(Number<Value::int32>),typeid(*this)); }
	ValueImpl::operator Value::int64    &()         { throw TypeError(typeid(Number<Value::int64>),typeid(*this)); }
	ValueImpl::operator Value::uint8    &()         { throw TypeError(typeid(Number<Value::uint8>),typeid(*this)); }
	ValueImpl::operator Value::uint16   &()         { throw TypeError(typeid(Number<Value::uint16>),typeid(*this)); }
	ValueImpl::operator Value::uint32   &()         { throw TypeError(typeid(Number<Value::uint32>),typeid(*this)); }
	ValueImpl::operator Value::uint64   &()         { throw TypeError(typeid(Number<Value::uint64>),typeid(*this)); }
	ValueImpl::operator Value::boolean  &()         { throw TypeError(typeid(Number<Value::boolean>),typeid(*this)); }
	ValueImpl::operator Value::string   &()         { throw TypeError(typeid(Compound<Value::string>),typeid(*this)); }
	ValueImpl::operator Value::array    &()         { throw TypeError(typeid(Compound<Value::array>),typeid(*this)); }
	ValueImpl::operator Value::object   &()         { throw TypeError(typeid(Compound<Value::object>),typeid(*this)); }
	ValueImpl::operator Value::map      &()         { throw TypeError(typeid(Compound<Value::map>),typeid(*this)); }
	ValueImpl::operator Value::binary   &()         { throw TypeError(typeid(Compound<Value::binary>),typeid(*this)); }
	ValueImpl::operator Value::extension&()         { throw TypeError(typeid(Compound<Value::extension>),typeid(*this)); }
	ValueImpl::operator Value::timestamp&()         { throw TypeError(typeid(Compound<Value::timestamp>),typeid(*this)); }
	//access
	const Value &ValueImpl::operator[](size_t)         const { throw TypeError(typeid(Compound<Value::array>),typeid(*this)); }
	Value       &ValueImpl::operator[](size_t)               { throw TypeError(typeid(Compound<Value::array>),typeid(*this)); }
	const Value &ValueImpl::operator[](const Value&)   const { throw TypeError(typeid(Compound<Value::object>),typeid(*this)); }
	Value       &ValueImpl::operator[](const Value&)         { throw TypeError(typeid(Compound<Value::object>),typeid(*this)); }

	/* * * * * * * * * * * * * * * * * * * *
	 * Comparison
	 */

	bool Value::operator==(const Value &other) const{return *m_ptr==*other.m_ptr;}

	/* * * * * * * * * * * * * * * * * * * *
	 * Serialization
	 */

	std::ostream& operator<<(std::ostream& os, const Value& value)
	{
		Encoder(os).encode(value);
		return os;
	}

	void Value::dump(std::string &out) const
	{
		out=dump();
	}

	std::string Value::dump() const
	{
		std::ostringstream ss;
		ss<<*this;
		return ss.str();
	}

	std::istream& operator>>(std::istream& is, Value& value)
	{
		try
		{
			value=Value::parse(is);
		}
		catch(const DecodeError&)
		{
			value=Value();
			is.setstate(std::ios::failbit);
		}
		return is;
	}

	Value Value::parse(std::istream& is, const DecodeOptions &options)
	{
		return Decoder(is,options).decode();
	}

	Value Value::parse(const std::string &in, std::string &err, const DecodeOptions &options)
	{
		std::istringstream ss(in);
		try
		{
			return Value::parse(ss,options);
		}
		catch(const DecodeError &e)
		{
			err=e.what();
			return Value();
		}
	}

	/* * * * * * * * * * * * * * * * * * * *
	 * Shape-checking
	 */

	bool Value::has_shape(const shape & types,std::string &err) const
	{
		if (!is_object())
		{
			err="expected object";
			return false;
		}

		const object &fields=as<object>();
		for (auto & item : types)
		{
			auto it=fields.find(item.first);
			if (it==fields.end() || it->second.type() != item.second)
			{
				err="bad type for " + item.first;
				return false;
			}
		}

		return true;
	}

} // namespace tagpack

namespace
{
	size_t combine(size_t seed,size_t value)
	{
		return seed^(value+0x9e3779b97f4a7c15ULL+(seed<<6)+(seed>>2));
	}
}

size_t std::hash<tagpack::Value>::operator()(const tagpack::Value &thing) const noexcept
{
	using tagpack::Value;
	switch (thing.type())
	{
	case Value::Type::FLOAT32:
	case Value::Type::FLOAT64:
	{
		// integral floats hash like the equal integer
		const double d=thing.m_ptr->operator Value::float64();
		if (std::trunc(d)==d && std::fabs(d)<9.2e18)
			return static_cast<size_t>(static_cast<Value::int64>(d));
		return std::bit_cast<size_t>(d);
	}
	case Value::Type::INT8:
	case Value::Type::INT16:
	case Value::Type::INT32:
	case Value::Type::INT64:
		return static_cast<size_t>(thing.m_ptr->operator Value::int64());
	case Value::Type::UINT8:
	case Value::Type::UINT16:
	case Value::Type::UINT32:
	case Value::Type::UINT64:
	case Value::Type::BOOL:
		return static_cast<size_t>(thing.m_ptr->operator Value::uint64());
	case Value::Type::STRING:
		return std::hash<std::string>()(thing.m_ptr->operator const Value::string&());
	case Value::Type::NUL:
		return 0;
	case Value::Type::BINARY:
	{
		const Value::binary &data=thing.m_ptr->operator const Value::binary&();
		return std::hash<std::string_view>()(std::string_view(reinterpret_cast<const char*>(data.data()),data.size()));
	}
	case Value::Type::EXTENSION:
	{
		const Value::extension &ext=thing.m_ptr->operator const Value::extension&();
		const size_t data=std::hash<std::string_view>()(std::string_view(reinterpret_cast<const char*>(ext.data.data()),ext.data.size()));
		return combine(static_cast<size_t>(ext.type),data);
	}
	case Value::Type::TIMESTAMP:
		return std::hash<int64_t>()(thing.m_ptr->operator const Value::timestamp&().time_since_epoch().count());
	case Value::Type::ARRAY:
	{
		size_t seed=thing.m_ptr->operator const Value::array&().size();
		for (const auto &element : thing.m_ptr->operator const Value::array&())
			seed=combine(seed,operator()(element));
		return seed;
	}
	case Value::Type::OBJECT:
	{
		// entry order is unspecified, so entries are summed
		size_t seed=0;
		for (const auto &entry : thing.m_ptr->operator const Value::object&())
			seed+=combine(std::hash<std::string>()(entry.first),operator()(entry.second));
		return seed;
	}
	case Value::Type::MAP:
	{
		size_t seed=0;
		for (const auto &entry : thing.m_ptr->operator const Value::map&())
			seed+=combine(operator()(entry.first),operator()(entry.second));
		return seed;
	}
	default:
		return static_cast<size_t>(thing.type());
	}
}
