#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <typeindex>

namespace tagpack
{
	// Checked access to a Value of another category.
	class TypeError : public std::runtime_error
	{
	public:
		TypeError(std::type_index expected,std::type_index got):
			std::runtime_error(std::string()+"expected "+expected.name()+", but got "+got.name()){}
	};
	
	class EncodeError : public std::runtime_error
	{
	public:
		enum class Kind : uint8_t
		{
			UNSUPPORTED_TYPE,
			CYCLIC_REFERENCE,
			SINK_WRITE_FAILURE
		};
		
		EncodeError(Kind kind,const std::string &what):
			std::runtime_error(std::string("encode: ")+name(kind)+": "+what),m_kind(kind){}
		
		Kind kind() const noexcept { return m_kind; }
		
		static const char *name(Kind kind) noexcept
		{
			switch(kind)
			{
				case Kind::UNSUPPORTED_TYPE   : return "unsupported type";
				case Kind::CYCLIC_REFERENCE   : return "cyclic reference";
				case Kind::SINK_WRITE_FAILURE : return "sink write failure";
			}
			return "unknown";
		}
		
	private:
		Kind m_kind;
	};
	
	class DecodeError : public std::runtime_error
	{
	public:
		enum class Kind : uint8_t
		{
			MALFORMED_TAG,
			TRUNCATED_STREAM,
			TYPE_MISMATCH,
			NUMERIC_OVERFLOW,
			NO_ADDRESSABLE_TARGET,
			SOURCE_READ_FAILURE,
			UNKNOWN_EXTENSION,
			ALLOCATION_FAILURE
		};
		
		DecodeError(Kind kind,const std::string &what):
			std::runtime_error(std::string("decode: ")+name(kind)+": "+what),m_kind(kind){}
		
		Kind kind() const noexcept { return m_kind; }
		
		static const char *name(Kind kind) noexcept
		{
			switch(kind)
			{
				case Kind::MALFORMED_TAG         : return "malformed tag";
				case Kind::TRUNCATED_STREAM      : return "truncated stream";
				case Kind::TYPE_MISMATCH         : return "type mismatch";
				case Kind::NUMERIC_OVERFLOW      : return "overflow";
				case Kind::NO_ADDRESSABLE_TARGET : return "no addressable target";
				case Kind::SOURCE_READ_FAILURE   : return "source read failure";
				case Kind::UNKNOWN_EXTENSION     : return "unknown extension";
				case Kind::ALLOCATION_FAILURE    : return "allocation failure";
			}
			return "unknown";
		}
		
	private:
		Kind m_kind;
	};
	
	// Raised by the rpc codec when the connection was closed or left unusable
	// by an earlier failure.
	class RpcError : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};
	
} // namespace tagpack
