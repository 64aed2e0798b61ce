#pragma once

#include <hashlock/schema/primitives.hpp>

namespace hashlock::crypto {

bool available();

/// Verify an Ed25519 signature where `signer` is the raw 32-byte public key.
bool verify_signature(const hashlock::schema::bytes_view_t& message,
                      const hashlock::schema::address_t& signer,
                      const hashlock::schema::ed25519_signature_t& signature);

}  // namespace hashlock::crypto
