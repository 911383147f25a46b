#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tagpack
{
	using binary=std::vector<uint8_t>;
	
	// Nanosecond time point on the system clock. Encoding truncates it to the
	// configured timestamp resolution.
	using timestamp=std::chrono::time_point<std::chrono::system_clock,std::chrono::nanoseconds>;
	
	// Raw extension value: application defined type code plus payload.
	struct Extension
	{
		int8_t type=0;
		binary data;
		
		bool operator==(const Extension &rhs) const=default;
	};
	
} // namespace tagpack
