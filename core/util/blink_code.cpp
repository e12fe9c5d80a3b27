#include "blink_code.hpp"
#include "pmu.hpp"


void BlinkCode::pause(unsigned int units) {
	PMU::delay_ms(units * m_unit_ms);
}

void BlinkCode::pulse(unsigned int units) {
	m_led.on();
	pause(units);
	m_led.off();
	pause(units);
}

unsigned int BlinkCode::flashes_for(uint32_t value) {
	unsigned int count = 0;
	do {
		count += (value & 0x0F) + 1;
		value >>= 4;
	} while (value);
	return count;
}

void BlinkCode::blink(uint32_t value) {
	do {
		unsigned int nibble = (value & 0x0F) + 1;
		for (unsigned int i = 0; i < nibble; i++)
			pulse(1);
		pause(2);
		value >>= 4;
	} while (value);
	pause(4);
}

void BlinkCode::pattern(std::initializer_list<uint32_t> values) {
	pulse(4);
	for (uint32_t v : values)
		blink(v);
}

void BlinkCode::signal(std::initializer_list<uint32_t> values, unsigned int repeats) {
	for (unsigned int i = 0; i < repeats; i++)
		pattern(values);
}
