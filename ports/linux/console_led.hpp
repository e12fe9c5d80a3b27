#pragma once

#include <cstdio>

#include "led.hpp"

class ConsoleLed : public Led {
private:
	bool m_state;

public:
	ConsoleLed(int pin) : Led(pin), m_state(false) {}

	void on() override {
		m_state = true;
		fputc('*', stderr);
	}
	void off() override {
		m_state = false;
		fputc('.', stderr);
	}
	bool get_state() override { return m_state; }
};
