#ifndef __CONSOLE_LOG_HPP_
#define __CONSOLE_LOG_HPP_

#include "logger.hpp"
#include "messages.hpp"


class ConsoleLog : public Logger {

public:
	ConsoleLog() : Logger("Console") {}

private:
	static const char *decision_name(BootDecision d) {
		switch (d) {
		case BootDecision::PROVISIONED: return "PROVISIONED";
		case BootDecision::BOOT_ACTIVE: return "BOOT_ACTIVE";
		case BootDecision::BOOT_TRIAL:  return "BOOT_TRIAL";
		case BootDecision::ROLLBACK:    return "ROLLBACK";
		case BootDecision::RECOVER:     return "RECOVER";
		case BootDecision::UPDATE_MODE: return "UPDATE_MODE";
		case BootDecision::HALT:        return "HALT";
		default:                        return "UNKNOWN";
		}
	}

	void debug_formatter(const char *level, LogHeader *header, const char *msg) {
		printf("%06u [%s]\t%s\r\n", (unsigned int)header->index, level, msg);
	}
	void boot_formatter(const BootDecisionLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tdecision: %s slot: %u status: %u trial_count: %u generation: %lu\r\n", name,
				decision_name(entry->decision), entry->slot, entry->status, entry->trial_count,
				(unsigned long)entry->generation);
	}
	void update_formatter(const UpdateLogEntry *entry) {
		const char *name = log_type_name[entry->header.log_type];
		printf("[%s]\tupdate_event: %d seq: %lu bytes: %lu\r\n", name, static_cast<int>(entry->event),
				(unsigned long)entry->sequence, (unsigned long)entry->bytes);
	}

public:
	unsigned int num_entries() override {return 0;}
	void read(void *, int) override { }
	void write(void *entry) override {
		LogEntry *p = (LogEntry *)entry;
		switch (p->header.log_type) {
		case LOG_ERROR:
		case LOG_WARN:
		case LOG_INFO:
		case LOG_TRACE:
			debug_formatter(log_type_name[p->header.log_type], &p->header, (const char * )p->data);
			break;
		case LOG_BOOT:
			boot_formatter((const BootDecisionLogEntry *)entry);
			break;
		case LOG_UPDATE:
			update_formatter((const UpdateLogEntry *)entry);
			break;
		default:
			// Not yet supported
			break;
		}
	}
};

#endif // __CONSOLE_LOG_HPP_
