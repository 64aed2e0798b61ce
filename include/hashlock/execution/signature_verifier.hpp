#pragma once

#include <functional>
#include <hashlock/schema/primitives.hpp>

namespace hashlock::execution {

using signature_verifier_t = std::function<bool(
    const hashlock::schema::bytes_view_t& message,
    const hashlock::schema::address_t& signer,
    const hashlock::schema::ed25519_signature_t& signature)>;

}  // namespace hashlock::execution
