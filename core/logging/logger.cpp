#include "logger.hpp"


Logger::Logger(const char *name) {
	m_name = name;
	m_next_index = 0;
}

void Logger::set_log_level(int level) {
	m_log_level = level;
}

void Logger::stamp(LogHeader &header, LogType type, uint8_t payload_size) {
	header.index = m_next_index++;
	header.log_type = type;
	header.payload_size = payload_size;
}

void Logger::format(LogType type, const char *msg, va_list args) {
	LogEntry buffer;
	vsnprintf(reinterpret_cast<char*>(buffer.data), sizeof(buffer.data), msg, args);
	stamp(buffer.header, type, std::strlen(reinterpret_cast<char*>(buffer.data)));
	write(&buffer);
}

void Logger::warn(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_WARN) {
		va_list args;
		va_start(args, msg);
		format(LOG_WARN, msg, args);
		va_end(args);
	}
}

void Logger::error(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_ERROR) {
		va_list args;
		va_start(args, msg);
		format(LOG_ERROR, msg, args);
		va_end(args);
	}
}

void Logger::info(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		va_list args;
		va_start(args, msg);
		format(LOG_INFO, msg, args);
		va_end(args);
	}
}

void Logger::trace(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_DEBUG) {
		va_list args;
		va_start(args, msg);
		format(LOG_TRACE, msg, args);
		va_end(args);
	}
}

const char *Logger::get_name() {
	return m_name;
}
