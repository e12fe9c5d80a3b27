#include <cstdio>
#include <cstdlib>
#include <string>

extern "C" {
#include <fcntl.h>
#include <getopt.h>
#include <unistd.h>
}

#include "bsp.hpp"
#include "boot_selector.hpp"
#include "boot_control.hpp"
#include "bootloader_config.hpp"
#include "boot_record.hpp"
#include "flash_commit.hpp"
#include "image_validator.hpp"
#include "file_flash.hpp"
#include "fd_transport.hpp"
#include "console_led.hpp"
#include "console_log.hpp"
#include "error.hpp"
#include "debug.hpp"

// Global contexts
BootloaderConfig *bootloader_config;
BootRecordStore *boot_record_store;
FlashCommitCoordinator *flash_commit;
ImageValidator *image_validator;
Transport *update_transport;
Led *status_led;
Logger *boot_log;
bool update_requested;

// FSM initial state -> BootStart
FSM_INITIAL_STATE(BootSelector, BootStart)

using fsm_handle = BootSelector;

static void usage(const char *name) {
	fprintf(stderr, "usage: %s [--flash <image>] [--port <device>] [--update] [--max-trials <n>] [--implicit-confirm]\n"
					"       %s [--flash <image>] --confirm | --rollback\n", name, name);
}

int main(int argc, char **argv) {
	std::string flash_path = "safeboot_flash.bin";
	std::string port_path;
	int max_trials = -1;
	bool implicit_confirm = false;
	bool confirm = false;
	bool rollback = false;

	static const struct option options[] = {
		{ "flash",            required_argument, nullptr, 'f' },
		{ "port",             required_argument, nullptr, 'p' },
		{ "update",           no_argument,       nullptr, 'u' },
		{ "max-trials",       required_argument, nullptr, 't' },
		{ "implicit-confirm", no_argument,       nullptr, 'i' },
		{ "confirm",          no_argument,       nullptr, 'c' },
		{ "rollback",         no_argument,       nullptr, 'r' },
		{ nullptr, 0, nullptr, 0 }
	};

	int c;
	while ((c = getopt_long(argc, argv, "f:p:ut:icr", options, nullptr)) != -1) {
		switch (c) {
		case 'f': flash_path = optarg; break;
		case 'p': port_path = optarg; break;
		case 'u': update_requested = true; break;
		case 't': max_trials = (int)strtol(optarg, nullptr, 10); break;
		case 'i': implicit_confirm = true; break;
		case 'c': confirm = true; break;
		case 'r': rollback = true; break;
		default:
			usage(argv[0]);
			return 1;
		}
	}

	ConsoleLog con_log;
	DebugLogger::console_log = &con_log;
	boot_log = &con_log;

	BootloaderConfig config(BSP::flash_layout());
	if (max_trials > 0)
		config.boot.max_trial_count = max_trials;
	if (implicit_confirm)
		config.boot.confirm_policy = ConfirmPolicy::IMPLICIT_TIMEOUT;

	try {
		config.validate();
	} catch (ErrorCode e) {
		DEBUG_ERROR("main: invalid configuration: error_code=%u", e);
		return 1;
	}

	FileFlash flash(flash_path, config.layout.sector_size, config.layout.sectors, config.layout.page_size);
	if (!flash.load()) {
		DEBUG_ERROR("main: could not read flash image %s", flash_path.c_str());
		return 1;
	}

	BootRecordStore store(flash, config.layout.record_offset, config.layout.record_sectors, config.update.flash_retries);
	FlashCommitCoordinator commit(flash, store, config.update.flash_retries);
	ImageValidator validator(flash);
	ConsoleLed led(BSP::STATUS_LED_PIN);

	// Acts as the running application: settle the outcome of a trial and exit
	if (confirm || rollback) {
		BootControl control(config, store, commit);
		try {
			control.load();
			bool changed = confirm ? control.confirm() : control.request_rollback();
			return changed ? 0 : 1;
		} catch (ErrorCode e) {
			DEBUG_ERROR("main: boot record update failed: error_code=%u", e);
			return 1;
		}
	}

	int port_fd = -1;
	FdTransport *transport = nullptr;
	if (!port_path.empty()) {
		port_fd = open(port_path.c_str(), O_RDWR | O_NOCTTY);
		if (port_fd < 0) {
			DEBUG_ERROR("main: could not open %s", port_path.c_str());
			return 1;
		}
		transport = new FdTransport(port_fd);
	}

	// Setup global contexts
	bootloader_config = &config;
	boot_record_store = &store;
	flash_commit = &commit;
	image_validator = &validator;
	update_transport = transport;
	status_led = &led;

	// This will initialise the FSM
	fsm_handle::start();

	// Any run-time exceptions are passed to the FSM which halts
	try {
		fsm_handle::dispatch(ResetEvent());
	} catch (ErrorCode e) {
		ErrorEvent event;
		event.error_code = e;
		fsm_handle::dispatch(event);
	}

	delete transport;
	if (port_fd >= 0)
		close(port_fd);

	return 0;
}
