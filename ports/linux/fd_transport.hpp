#pragma once

#include <cstddef>
#include <vector>

#include "transport.hpp"
#include "frame_codec.hpp"

// Frames carried over a byte stream (serial port, pipe or pty)
class FdTransport : public Transport {
public:
	FdTransport(int fd) : m_fd(fd), m_pending_pos(0) {}

	TransportStatus recv(Frame &frame, unsigned int timeout_ms) override;
	TransportStatus send(const Frame &frame) override;

private:
	int          m_fd;
	FrameDecoder m_decoder;
	std::vector<uint8_t> m_pending;
	size_t       m_pending_pos;

	bool drain(Frame &frame);
};
