#ifndef __MESSAGES_HPP_
#define __MESSAGES_HPP_

#include <stdint.h>

#define MAX_LOG_PAYLOAD    120

static constexpr const char *log_type_name[8] = {
	"BOOT",
	"UPDATE",
	"ERROR",
	"WARN",
	"INFO",
	"TRACE"
};

enum LogType : uint8_t {
	LOG_BOOT,
	LOG_UPDATE,
	LOG_ERROR,
	LOG_WARN,
	LOG_INFO,
	LOG_TRACE
};

struct __attribute__((packed)) LogHeader {
	uint32_t index;
	LogType  log_type;
	uint8_t  payload_size;
};

struct LogEntry {
	LogHeader header;
	union {
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

enum class BootDecision : uint8_t {
	PROVISIONED,
	BOOT_ACTIVE,
	BOOT_TRIAL,
	ROLLBACK,
	RECOVER,
	UPDATE_MODE,
	HALT
};

struct __attribute__((packed)) BootDecisionLogEntry {
	LogHeader header;
	union {
		struct {
			BootDecision decision;
			uint8_t      slot;
			uint8_t      status;
			uint8_t      trial_count;
			uint32_t     generation;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

enum class UpdateEvent : uint8_t {
	SESSION_START,
	COMMITTED,
	ABORTED
};

struct __attribute__((packed)) UpdateLogEntry {
	LogHeader header;
	union {
		struct {
			UpdateEvent event;
			uint32_t    sequence;
			uint32_t    bytes;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

#endif // __MESSAGES_HPP_
