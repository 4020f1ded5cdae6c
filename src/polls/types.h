#pragma once

#include "../crypto/keypair.h"

#include <cstdint>

namespace polls {

/**
 * Sequential poll identifier (0, 1, 2, ...)
 */
using PollId = uint64_t;

/**
 * Caller identity: the participant's Ed25519 public key
 */
using Identity = crypto::PublicKey;

/**
 * Unix time in seconds
 */
using Timestamp = int64_t;

} // namespace polls
