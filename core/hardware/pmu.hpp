#pragma once

#include <cstdint>


class PMU {
public:
	// Hands control to the image; does not return on target
	static void start_image(uint32_t entry_point);
	static void reset(bool update_mode);
	static bool is_update_requested();
	static void halt();
	static void delay_ms(unsigned ms);
};
