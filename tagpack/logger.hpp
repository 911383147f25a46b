#pragma once

#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace tagpack
{
	enum class LogLevel { Trace, Debug, Info, Warn, Error };
	
	/* Logger
	 *
	 * Process wide sink for diagnostics. Messages below the configured level
	 * are dropped before the sink is called; the sink runs under a lock.
	 */
	class Logger
	{
	public:
		using Sink=std::function<void(LogLevel,const std::string&)>;
		
		static Logger& inst()
		{
			static Logger logger;
			return logger;
		}
		
		void set_level(LogLevel level)
		{
			std::scoped_lock lock(m_mutex);
			m_level=level;
		}
		
		LogLevel level()
		{
			std::scoped_lock lock(m_mutex);
			return m_level;
		}
		
		void set_sink(Sink sink)
		{
			std::scoped_lock lock(m_mutex);
			m_sink=std::move(sink);
		}
		
		Sink sink()
		{
			std::scoped_lock lock(m_mutex);
			return m_sink;
		}
		
		bool enabled(LogLevel level)
		{
			std::scoped_lock lock(m_mutex);
			return level>=m_level;
		}
		
		void log(LogLevel level,const std::string &msg)
		{
			std::scoped_lock lock(m_mutex);
			if(level<m_level || !m_sink)
				return;
			m_sink(level,msg);
		}
		
	private:
		Logger()
		{
			m_sink=[](LogLevel level,const std::string &msg)
			{
				static const char *names[]{"TRACE","DEBUG","INFO","WARN","ERROR"};
				std::cout<<"["<<names[static_cast<int>(level)]<<"] "<<msg<<'\n';
			};
		}
		
		std::mutex m_mutex;
		LogLevel   m_level{LogLevel::Info};
		Sink       m_sink;
	};
	
} // namespace tagpack

// The message expression is only evaluated when the level is enabled.
#define TAGPACK_LOG(level,msg) \
	do { \
		if(::tagpack::Logger::inst().enabled(level)) \
			::tagpack::Logger::inst().log(level,(msg)); \
	} while(0)

#define TAGPACK_LOG_TRACE(msg) TAGPACK_LOG(::tagpack::LogLevel::Trace,msg)
#define TAGPACK_LOG_DEBUG(msg) TAGPACK_LOG(::tagpack::LogLevel::Debug,msg)
#define TAGPACK_LOG_INFO(msg)  TAGPACK_LOG(::tagpack::LogLevel::Info,msg)
#define TAGPACK_LOG_WARN(msg)  TAGPACK_LOG(::tagpack::LogLevel::Warn,msg)
#define TAGPACK_LOG_ERROR(msg) TAGPACK_LOG(::tagpack::LogLevel::Error,msg)
