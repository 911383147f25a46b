#pragma once

#include "tagpack/decoder.hpp"
#include "tagpack/encoder.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace tagpack
{
	// Encodes one value to a byte string. Throws EncodeError.
	template<typename T>
	std::string marshal(const T &value,EncodeOptions options={})
	{
		std::ostringstream os(std::ios::binary);
		Encoder(os,options).encode(value);
		return std::move(os).str();
	}

	// Decodes the first value in `data` into `*dst`. Bytes after that value
	// are ignored. Throws DecodeError.
	template<typename T>
	void unmarshal(std::string_view data,T *dst,DecodeOptions options={})
	{
		if(!dst)
			throw DecodeError(DecodeError::Kind::NO_ADDRESSABLE_TARGET,"destination pointer is null");
		std::istringstream is(std::string(data),std::ios::binary);
		Decoder(is,options).decode(*dst);
	}

	// Decodes the first value in `data` into an open target.
	inline Value unmarshal(std::string_view data,DecodeOptions options={})
	{
		std::istringstream is(std::string(data),std::ios::binary);
		return Decoder(is,options).decode();
	}

} // namespace tagpack
