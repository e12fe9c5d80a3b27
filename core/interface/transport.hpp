#pragma once

#include "update_frame.hpp"

enum class TransportStatus {
	OK,
	TIMEOUT,
	ERROR
};

// Frame-level link to the update host (UART, CAN, ...)
class Transport
{
public:
	virtual ~Transport() {}
	virtual TransportStatus recv(Frame &frame, unsigned int timeout_ms) = 0;
	virtual TransportStatus send(const Frame &frame) = 0;
};
