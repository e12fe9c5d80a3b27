#pragma once

#include "bootloader_config.hpp"
#include "boot_record.hpp"
#include "flash_commit.hpp"
#include "image_validator.hpp"
#include "lz4_decoder.hpp"
#include "staging_sink.hpp"
#include "update_protocol.hpp"
#include "transport.hpp"
#include "logger.hpp"
#include "messages.hpp"

enum class UpdateOutcome {
	COMMITTED,
	ABORTED
};

// Drives UpdateProtocol over a Transport and performs its side effects
class UpdateReceiver {
public:
	UpdateReceiver(const BootloaderConfig &config, Transport &transport, FlashCommitCoordinator &flash_commit,
				   ImageValidator &validator, Logger *log = nullptr);

	// Runs one session to completion. On COMMITTED the record names the staged
	// image as a pending trial; on ABORTED the record has not been touched.
	UpdateOutcome run(const BootRecord &record);

	const SessionState &state() const { return m_state; }

private:
	const BootloaderConfig &m_config;
	Transport              &m_transport;
	FlashCommitCoordinator &m_flash_commit;
	ImageValidator         &m_validator;
	Logger                 *m_log;

	SessionState   m_state;
	SlotDescriptor m_slot;
	BootRecord     m_record;
	StagingSink    m_sink;
	Lz4Decoder     m_decoder;

	void apply(StepResult &&result);
	void finalize();
	bool staged_content_matches(const UpdateSession &session, const ImageFooter &footer);
	void fail(AbortCause cause, NackReason reason);
	void log_event(UpdateEvent event, uint32_t sequence, uint32_t bytes);
	uint32_t last_acked() const;
};
