#pragma once

#include <deque>
#include <functional>
#include <vector>

#include "transport.hpp"

// Scripted host side of the update link
class FakeTransport : public Transport {
public:
	std::deque<Frame>  m_inbound;
	std::vector<Frame> m_sent;
	std::vector<unsigned int> m_timeouts;
	bool m_fail_recv = false;
	bool m_fail_send = false;

	// Called for every frame the receiver sends; may queue more inbound frames
	std::function<void(const Frame &)> m_on_send;

	void queue(const Frame &frame) { m_inbound.push_back(frame); }

	TransportStatus recv(Frame &frame, unsigned int timeout_ms) override {
		m_timeouts.push_back(timeout_ms);
		if (m_fail_recv)
			return TransportStatus::ERROR;
		if (m_inbound.empty())
			return TransportStatus::TIMEOUT;
		frame = m_inbound.front();
		m_inbound.pop_front();
		return TransportStatus::OK;
	}

	TransportStatus send(const Frame &frame) override {
		if (m_fail_send)
			return TransportStatus::ERROR;
		m_sent.push_back(frame);
		if (m_on_send)
			m_on_send(frame);
		return TransportStatus::OK;
	}

	const Frame &last_sent() const { return m_sent.back(); }
};
