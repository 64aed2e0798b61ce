#pragma once

#include <hashlock/runtime/account_info.hpp>
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

// Inbound half of the oracle interface.
namespace hashlock::oracle {

struct callback_output final {
  hashlock::schema::bytes_t execution_id;
  hashlock::schema::hash32_t input_digest{};
  hashlock::schema::bytes_t committed_outputs;
};

using callback_output_t = callback_output;

/// Authenticate and decode an oracle callback.
///
/// `accounts[0]` must be the expected execution account and must have signed
/// (only the oracle program can sign for it). `data` is the SCALE encoded
/// callback payload following the instruction prefix, and must name
/// `image_id`. On failure returns std::nullopt and sets `error`.
std::optional<callback_output_t> handle_callback(
    std::string_view image_id,
    const hashlock::schema::address_t& execution_handle,
    hashlock::runtime::account_infos_t accounts,
    const hashlock::schema::bytes_view_t& data,
    std::string& error);

}  // namespace hashlock::oracle
