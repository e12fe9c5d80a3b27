#pragma once

#include <cstdint>
#include <initializer_list>

#include "led.hpp"

// Diagnostic pattern on a single status LED: one long lead-in flash, then each
// value as groups of (nibble + 1) short flashes, least significant nibble first.
class BlinkCode {
public:
	static inline const unsigned int DEFAULT_UNIT_MS = 150;

	BlinkCode(Led &led, unsigned int unit_ms = DEFAULT_UNIT_MS) : m_led(led), m_unit_ms(unit_ms) {}

	void pattern(std::initializer_list<uint32_t> values);
	void signal(std::initializer_list<uint32_t> values, unsigned int repeats);

	// Number of short flashes pattern() emits for value
	static unsigned int flashes_for(uint32_t value);

private:
	Led &m_led;
	unsigned int m_unit_ms;

	void pause(unsigned int units);
	void pulse(unsigned int units);
	void blink(uint32_t value);
};
