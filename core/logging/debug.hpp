#ifndef __DEBUG_HPP_
#define __DEBUG_HPP_

#include "logger.hpp"

class DebugLogger {
public:
	static inline Logger *console_log = nullptr;
};

#ifdef DEBUG_ENABLE

#if (DEBUG_LEVEL >= 1)
#define DEBUG_ERROR(fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->error(fmt, ##__VA_ARGS__); \
	} while (0)
#else
#define DEBUG_ERROR(fmt, ...)
#endif

#if (DEBUG_LEVEL >= 2)
#define DEBUG_WARN(fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->warn(fmt, ##__VA_ARGS__); \
	} while (0)
#else
#define DEBUG_WARN(fmt, ...)
#endif

#if (DEBUG_LEVEL >= 3)
#define DEBUG_INFO(fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->info(fmt, ##__VA_ARGS__); \
	} while (0)
#else
#define DEBUG_INFO(fmt, ...)
#endif

// NOTE: TRACE is emitted per frame by the update receiver and slows transfers noticeably
#if (DEBUG_LEVEL >= 4)
#define DEBUG_TRACE(fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->trace(fmt, ##__VA_ARGS__); \
	} while (0)
#else
#define DEBUG_TRACE(fmt, ...)
#endif


#else

#define DEBUG_ERROR(fmt, ...)
#define DEBUG_WARN(fmt, ...)
#define DEBUG_INFO(fmt, ...)
#define DEBUG_TRACE(fmt, ...)

#endif

#endif // __DEBUG_HPP_
