#pragma once

#include "led.hpp"
#include "debug.hpp"


class FakeLed : public Led {
private:
	bool m_pin_state;
	const char *m_name;

public:
	unsigned int m_on_count;

	FakeLed(const char *name, int pin=0) : Led(pin) {
		m_pin_state = false;
		m_name = name;
		m_on_count = 0;
	}
	bool get_state() override { return m_pin_state; }
	void on() override {
		DEBUG_TRACE("LED[%s]=on", m_name);
		m_pin_state = true;
		m_on_count++;
	}
	void off() override {
		DEBUG_TRACE("LED[%s]=off", m_name);
		m_pin_state = false;
	}
};
