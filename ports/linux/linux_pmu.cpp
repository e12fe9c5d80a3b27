#include <cstdio>
#include <cstdlib>

extern "C" {
#include <unistd.h>
}

#include "pmu.hpp"

// Set by main from the command line
extern bool update_requested;

// Exit codes seen by whatever relaunches the host bootloader
static constexpr const int EXIT_RESET = 0;
static constexpr const int EXIT_RESET_UPDATE = 2;
static constexpr const int EXIT_HALT = 3;
static constexpr const int EXIT_START_IMAGE = 4;

void PMU::start_image(uint32_t entry_point) {
	printf("PMU: start image at 0x%08x\r\n", (unsigned int)entry_point);
	fflush(stdout);
	exit(EXIT_START_IMAGE);
}

void PMU::reset(bool update_mode) {
	printf("PMU: reset%s\r\n", update_mode ? " (update mode)" : "");
	fflush(stdout);
	exit(update_mode ? EXIT_RESET_UPDATE : EXIT_RESET);
}

bool PMU::is_update_requested() {
	return update_requested;
}

void PMU::halt() {
	printf("PMU: halted\r\n");
	fflush(stdout);
	exit(EXIT_HALT);
}

void PMU::delay_ms(unsigned ms) {
	usleep(ms * 1000);
}
