#pragma once

#include "tinyfsm.hpp"
#include "error.hpp"
#include "boot_record.hpp"
#include "messages.hpp"

struct ResetEvent : tinyfsm::Event { };
struct ErrorEvent : tinyfsm::Event { ErrorCode error_code; };


class BootSelector : public tinyfsm::Fsm<BootSelector>
{
public:
	// Diagnostic blink codes shown before halting
	static inline const uint32_t HALT_RECORD_CORRUPT[2] = { 1, 0 };
	static inline const uint32_t HALT_NO_BOOTABLE_IMAGE[2] = { 1, 1 };
	static inline const unsigned int HALT_BLINK_REPEATS = 3;

	void react(tinyfsm::Event const &);
	void react(ResetEvent const &event);
	void react(ErrorEvent const &event);
	virtual void entry(void);
	virtual void exit(void);

	static const BootRecord &record() { return m_record; }
	static uint8_t boot_slot() { return m_boot_slot; }
	static uint32_t entry_point() { return m_entry_point; }
	static BootDecision last_decision() { return m_last_decision; }
	static const uint32_t *halt_code() { return m_halt_code; }

protected:
	static inline BootRecord   m_record;
	static inline uint8_t      m_boot_slot = NO_SLOT;
	static inline uint32_t     m_entry_point = 0;
	static inline bool         m_record_writable = true;
	static inline BootDecision m_last_decision = BootDecision::HALT;
	static inline uint32_t     m_halt_code[2] = { 0, 0 };

	static void log_decision(BootDecision decision, uint8_t slot);
	static bool try_commit(BootRecord &record);
	static void revert();
	static void set_halt_code(uint32_t major, uint32_t minor);
	static bool select_if_valid(uint8_t slot_id);
};


class BootStart : public BootSelector
{
public:
	void entry() override;
};

class BootEvaluate : public BootSelector
{
public:
	void entry() override;
};

class BootActive : public BootSelector
{
public:
	void entry() override;
};

class BootPending : public BootSelector
{
public:
	void entry() override;
};

class BootRecover : public BootSelector
{
public:
	void entry() override;
};

class BootExecute : public BootSelector
{
public:
	void entry() override;
};

class BootUpdate : public BootSelector
{
public:
	void entry() override;
};

class BootHalt : public BootSelector
{
public:
	void entry() override;
};
