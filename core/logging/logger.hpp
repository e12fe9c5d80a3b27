#pragma once

#include <cstring>
#include <stdint.h>
#include <stdio.h>
#include <stdarg.h>

#include "messages.hpp"


enum LogLevel {
	LOG_LEVEL_OFF,
	LOG_LEVEL_ERROR,
	LOG_LEVEL_WARN,
	LOG_LEVEL_INFO,
	LOG_LEVEL_DEBUG
};


class Logger {

private:
	int m_log_level = LOG_LEVEL_DEBUG;
	uint32_t m_next_index;
	const char *m_name;

	void format(LogType type, const char *msg, va_list args);

public:
	Logger(const char *name);
	virtual ~Logger() {}

	void set_log_level(int level);
	void warn(const char *msg, ...);
	void error(const char *msg, ...);
	void info(const char *msg, ...);
	void trace(const char *msg, ...);
	const char *get_name();

	// Stamps the header of a typed entry before it is written
	void stamp(LogHeader &header, LogType type, uint8_t payload_size);

	virtual void write(void *) = 0;
	virtual void read(void *, int index = 0) = 0;
	virtual unsigned int num_entries() = 0;
};

