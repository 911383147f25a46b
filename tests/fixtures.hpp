#pragma once

#include "tagpack/tagpack.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

namespace tagpack
{
	// gtest would otherwise print a Value through its binary operator<<.
	inline void PrintTo(const Value &value,std::ostream *os)
	{
		*os<<type_name(value.type());
		switch(value.type())
		{
			case Value::Type::BOOL    : *os<<"("<<(value.as<bool>() ? "true" : "false")<<")"; break;
			case Value::Type::INT8    : // fall through
			case Value::Type::INT16   : // fall through
			case Value::Type::INT32   : // fall through
			case Value::Type::INT64   : *os<<"("<<value.as<int64_t>()<<")"; break;
			case Value::Type::UINT8   : // fall through
			case Value::Type::UINT16  : // fall through
			case Value::Type::UINT32  : // fall through
			case Value::Type::UINT64  : *os<<"("<<value.as<uint64_t>()<<")"; break;
			case Value::Type::FLOAT32 : // fall through
			case Value::Type::FLOAT64 : *os<<"("<<value.as<double>()<<")"; break;
			case Value::Type::STRING  : *os<<"(\""<<value.as<std::string>()<<"\")"; break;
			case Value::Type::ARRAY   : *os<<"["<<value.as<Value::array>().size()<<"]"; break;
			case Value::Type::OBJECT  : *os<<"{"<<value.as<Value::object>().size()<<"}"; break;
			case Value::Type::MAP     : *os<<"{"<<value.as<Value::map>().size()<<"}"; break;
			default : break;
		}
	}
}

namespace tagpack::test
{
	inline std::string bytes(std::initializer_list<int> values)
	{
		std::string out;
		for(int v:values)
			out.push_back(static_cast<char>(v));
		return out;
	}

	// 2012-02-02T02:02:02.000002Z
	inline timestamp reference_time()
	{
		return timestamp(std::chrono::microseconds(1328148122000002LL));
	}

	inline binary bytestring()
	{
		const std::string text="bytestring";
		return binary(text.begin(),text.end());
	}

	// One value of each scalar category, typed as an application would hold it.
	inline auto primitives()
	{
		return std::make_tuple(
			int8_t(-8),
			int16_t(-1616),
			int32_t(-32323232),
			int64_t(-6464646464646464LL),
			uint8_t(8),
			uint16_t(1616),
			uint32_t(32323232),
			uint64_t(6464646464646464ULL),
			uint8_t(8),
			-3232.0f,
			-6464646464.0,
			3232.0f,
			6464646464.0,
			false,
			true,
			Value(),
			reference_time(),
			std::string("someday"),
			std::string(""),
			bytestring());
	}

	inline Value::array primitive_values()
	{
		Value::array out;
		std::apply([&](const auto&... v){ (out.push_back(Value(v)),...); },primitives());
		return out;
	}

	/* table
	 *
	 * Every primitive, then the primitives as one list, then maps: text keys
	 * with bool values, text keys with mixed values, nested lists and maps,
	 * and keys that are not text.
	 */
	inline Value::array table()
	{
		Value::array out=primitive_values();
		out.push_back(Value(primitive_values()));
		out.push_back(Value(Value::object{{"true",Value(true)},{"false",Value(false)}}));
		out.push_back(Value(Value::object{
			{"true",Value("True")},
			{"false",Value(false)},
			{"int64(0)",Value(int8_t(0))}}));
		out.push_back(Value(Value::object{
			{"list",Value(Value::array{
				Value(int16_t(1616)),
				Value(int32_t(32323232)),
				Value(true),
				Value(-3232.0f),
				Value(Value::object{{"TRUE",Value(true)},{"FALSE",Value(false)}}),
				Value(Value::array{Value(true),Value(false)})})},
			{"int32",Value(int32_t(32323232))},
			{"bool",Value(true)},
			{"LONG STRING",Value("123456789012345678901234567890123456789012345678901234567890")},
			{"SHORT STRING",Value("1234567890")}}));
		Value::map generic;
		generic[Value(true)]=Value("true");
		generic[Value(int8_t(8))]=Value(false);
		generic[Value("false")]=Value(int8_t(0));
		out.push_back(Value(std::move(generic)));
		return out;
	}

	// What open decoding of each table() entry yields under `options`, for
	// data written with the default EncodeOptions.
	inline Value::array open_verify(const DecodeOptions &options)
	{
		const auto fixint=[&](int64_t v)
		{
			return options.small_int_as_int8 ? Value(static_cast<int8_t>(v)) : Value(v);
		};

		const auto text_keyed=[&](Value::object fields)
		{
			if(options.map_type==MapType::OBJECT)
				return Value(std::move(fields));
			Value::map entries;
			for(auto &entry:fields)
				entries[Value(entry.first)]=entry.second;
			return Value(std::move(entries));
		};

		Value::array scalars{
			fixint(-8),
			Value(int64_t(-1616)),
			Value(int64_t(-32323232)),
			Value(int64_t(-6464646464646464LL)),
			fixint(8),
			Value(uint64_t(1616)),
			Value(uint64_t(32323232)),
			Value(uint64_t(6464646464646464ULL)),
			fixint(8),
			Value(-3232.0f),
			Value(-6464646464.0),
			Value(3232.0f),
			Value(6464646464.0),
			Value(false),
			Value(true),
			Value(),
			options.timestamp_form==TimestampForm::TICKS ? Value(int64_t(1328148122000002LL)) : Value(reference_time()),
			Value("someday"),
			Value(""),
			options.raw_as_text ? Value("bytestring") : Value(bytestring())};

		Value::array out=scalars;
		out.push_back(Value(scalars));
		out.push_back(text_keyed({{"true",Value(true)},{"false",Value(false)}}));
		out.push_back(text_keyed({
			{"true",Value("True")},
			{"false",Value(false)},
			{"int64(0)",fixint(0)}}));
		out.push_back(text_keyed({
			{"list",Value(Value::array{
				Value(uint64_t(1616)),
				Value(uint64_t(32323232)),
				Value(true),
				Value(-3232.0f),
				text_keyed({{"TRUE",Value(true)},{"FALSE",Value(false)}}),
				Value(Value::array{Value(true),Value(false)})})},
			{"int32",Value(uint64_t(32323232))},
			{"bool",Value(true)},
			{"LONG STRING",Value("123456789012345678901234567890123456789012345678901234567890")},
			{"SHORT STRING",Value("1234567890")}}));
		Value::map generic;
		generic[Value(true)]=Value("true");
		generic[fixint(8)]=Value(false);
		generic[Value("false")]=fixint(0);
		out.push_back(Value(std::move(generic)));
		return out;
	}

	// Equality that also requires every number to keep its width.
	inline bool strictly_equal(const Value &a,const Value &b)
	{
		if(a.type()!=b.type())
			return false;
		switch(a.type())
		{
			case Value::Type::ARRAY :
			{
				const Value::array &x=a.as<Value::array>();
				const Value::array &y=b.as<Value::array>();
				return std::equal(x.begin(),x.end(),y.begin(),y.end(),
					[](const Value &l,const Value &r){ return strictly_equal(l,r); });
			}
			case Value::Type::OBJECT :
			{
				const Value::object &x=a.as<Value::object>();
				const Value::object &y=b.as<Value::object>();
				if(x.size()!=y.size())
					return false;
				for(const auto &entry:x)
				{
					auto it=y.find(entry.first);
					if(it==y.end() || !strictly_equal(entry.second,it->second))
						return false;
				}
				return true;
			}
			case Value::Type::MAP :
			{
				const Value::map &x=a.as<Value::map>();
				const Value::map &y=b.as<Value::map>();
				if(x.size()!=y.size())
					return false;
				for(const auto &entry:x)
				{
					auto it=y.find(entry.first);
					if(it==y.end() || !strictly_equal(entry.first,it->first) || !strictly_equal(entry.second,it->second))
						return false;
				}
				return true;
			}
			default :
				return a==b;
		}
	}

	struct Point
	{
		int32_t x=0;
		int32_t y=0;

		static constexpr auto fields()
		{
			return std::make_tuple(field("x",&Point::x),field("y",&Point::y));
		}

		bool operator==(const Point &rhs) const=default;
	};

	/* TestRecord
	 *
	 * Exercises every category the codec maps. The n* members are left unset
	 * by make_test_record() and must stay unset through a round trip.
	 */
	struct TestRecord
	{
		std::string s;
		int64_t i64=0;
		int16_t i16=0;
		uint64_t ui64=0;
		uint8_t ui8=0;
		bool b=false;
		uint8_t by=0;

		std::vector<std::string> sslice;
		std::vector<int64_t> i64slice;
		std::vector<int16_t> i16slice;
		std::vector<uint64_t> ui64slice;
		std::vector<bool> bslice;
		binary byslice;

		Value::array islice;
		Value::object ms;
		std::map<std::string,int64_t> msi64;

		Value nintf;
		timestamp t;
		std::optional<std::map<std::string,bool>> nmap;
		std::optional<binary> nslice;
		std::unique_ptr<int64_t> nint64;
		std::unique_ptr<TestRecord> nested;

		static constexpr auto fields()
		{
			return std::make_tuple(
				field("S",&TestRecord::s),
				field("I64",&TestRecord::i64),
				field("I16",&TestRecord::i16),
				field("Ui64",&TestRecord::ui64),
				field("Ui8",&TestRecord::ui8),
				field("B",&TestRecord::b),
				field("By",&TestRecord::by),
				field("Sslice",&TestRecord::sslice),
				field("I64slice",&TestRecord::i64slice),
				field("I16slice",&TestRecord::i16slice),
				field("Ui64slice",&TestRecord::ui64slice),
				field("Bslice",&TestRecord::bslice),
				field("Byslice",&TestRecord::byslice),
				field("Islice",&TestRecord::islice),
				field("Ms",&TestRecord::ms),
				field("Msi64",&TestRecord::msi64),
				field("Nintf",&TestRecord::nintf),
				field("T",&TestRecord::t),
				field("Nmap",&TestRecord::nmap),
				field("Nslice",&TestRecord::nslice),
				field("Nint64",&TestRecord::nint64),
				field("Nested",&TestRecord::nested));
		}
	};

	inline bool operator==(const TestRecord &a,const TestRecord &b)
	{
		const auto same_pointee=[](const auto &p,const auto &q)
		{
			if(!p || !q)
				return !p && !q;
			return *p==*q;
		};
		return a.s==b.s && a.i64==b.i64 && a.i16==b.i16 && a.ui64==b.ui64 && a.ui8==b.ui8 &&
			a.b==b.b && a.by==b.by && a.sslice==b.sslice && a.i64slice==b.i64slice &&
			a.i16slice==b.i16slice && a.ui64slice==b.ui64slice && a.bslice==b.bslice &&
			a.byslice==b.byslice && a.islice==b.islice && a.ms==b.ms && a.msi64==b.msi64 &&
			a.nintf==b.nintf && a.t==b.t && a.nmap==b.nmap && a.nslice==b.nslice &&
			same_pointee(a.nint64,b.nint64) && same_pointee(a.nested,b.nested);
	}

	// Builds the record with `depth` levels of nesting below it. Nested levels
	// also appear, as open values, in `islice` and `ms`.
	inline TestRecord make_test_record(int depth)
	{
		TestRecord r;
		r.s="some string";
		r.i64=64;
		r.i16=16;
		r.ui64=64;
		r.ui8=160;
		r.b=true;
		r.by=5;
		r.sslice={"one","two","three"};
		r.i64slice={1,2,3};
		r.i16slice={4,5,6};
		r.ui64slice={7,8,9};
		r.bslice={true,false,true,false};
		r.byslice={13,14,15};
		r.islice={Value("true"),Value(true),Value("no"),Value(false),Value(int8_t(88)),Value(0.4)};
		r.ms={{"true",Value("true")},{"int64(9)",Value(false)}};
		r.msi64={{"one",1},{"two",2}};
		r.t=reference_time();
		if(depth>0)
		{
			r.nested=std::make_unique<TestRecord>(make_test_record(depth-1));
			const Value open=unmarshal(marshal(*r.nested));
			r.ms["TestRecord."+std::to_string(depth-1)]=open;
			r.islice.push_back(open);
		}
		return r;
	}

} // namespace tagpack::test
