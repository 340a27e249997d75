#pragma once
#include "entities.hpp"

// Per-entity guard on secondary-password attempts.
// Unlocked{attempts} --5th failure--> Locked{until = now + 5 min}
// Locked --now >= until--> Unlocked{0}
// any success --> Unlocked{0}

bool lockout_is_locked(const LockoutState& s, int64_t now_ms);
int64_t lockout_remaining_ms(const LockoutState& s, int64_t now_ms);
int lockout_attempts_left(const LockoutState& s, int64_t now_ms);

// LOCKOUT_ACTIVE while locked; an expired lock is cleared here.
// Never consumes an attempt.
ZkStatus lockout_check(LockoutState& s, int64_t now_ms);

// Returns true if this failure opened the lock
bool lockout_record_failure(LockoutState& s, int64_t now_ms);
void lockout_record_success(LockoutState& s);
