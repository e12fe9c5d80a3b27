#include <cerrno>
#include <chrono>

extern "C" {
#include <poll.h>
#include <unistd.h>
}

#include "fd_transport.hpp"
#include "error.hpp"
#include "debug.hpp"


bool FdTransport::drain(Frame &frame) {
	while (m_pending_pos < m_pending.size()) {
		if (m_decoder.feed(m_pending[m_pending_pos++], frame))
			return true;
	}
	m_pending.clear();
	m_pending_pos = 0;
	return false;
}

TransportStatus FdTransport::recv(Frame &frame, unsigned int timeout_ms) {
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

	// Bytes left over from a previous read may already hold a frame
	if (drain(frame))
		return TransportStatus::OK;

	while (true) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		if (remaining.count() <= 0)
			return TransportStatus::TIMEOUT;

		struct pollfd pfd = { m_fd, POLLIN, 0 };
		int ret = poll(&pfd, 1, (int)remaining.count());
		if (ret == 0)
			return TransportStatus::TIMEOUT;
		if (ret < 0) {
			if (errno == EINTR)
				continue;
			DEBUG_ERROR("FdTransport::recv: poll failed: errno=%d", errno);
			return TransportStatus::ERROR;
		}

		uint8_t buffer[256];
		ssize_t n = read(m_fd, buffer, sizeof(buffer));
		if (n <= 0) {
			DEBUG_ERROR("FdTransport::recv: link closed");
			return TransportStatus::ERROR;
		}

		m_pending.insert(m_pending.end(), buffer, buffer + n);
		if (drain(frame))
			return TransportStatus::OK;
	}
}

TransportStatus FdTransport::send(const Frame &frame) {
	std::vector<uint8_t> bytes;

	try {
		bytes = FrameCodec::encode(frame);
	} catch (ErrorCode e) {
		DEBUG_ERROR("FdTransport::send: cannot encode frame: error_code=%u", e);
		return TransportStatus::ERROR;
	}

	size_t offset = 0;
	while (offset < bytes.size()) {
		ssize_t n = write(m_fd, &bytes[offset], bytes.size() - offset);
		if (n < 0) {
			if (errno == EINTR)
				continue;
			DEBUG_ERROR("FdTransport::send: write failed: errno=%d", errno);
			return TransportStatus::ERROR;
		}
		offset += n;
	}

	return TransportStatus::OK;
}
