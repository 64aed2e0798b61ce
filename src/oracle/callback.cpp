#include <spdlog/spdlog.h>
#include <hashlock/oracle/callback.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/execution_request.hpp>

using namespace hashlock::schema;

namespace hashlock::oracle {

std::optional<callback_output_t> handle_callback(
    const std::string_view image_id,
    const address_t& execution_handle,
    hashlock::runtime::account_infos_t accounts,
    const bytes_view_t& data,
    std::string& error) {
  if (accounts.empty()) {
    error = "callback carries no execution account";
    return std::nullopt;
  }
  const auto& execution = accounts[0];
  if (execution.key != execution_handle) {
    error = "callback execution account does not match the tracked execution";
    return std::nullopt;
  }
  if (!execution.is_signer) {
    error = "callback execution account did not sign";
    return std::nullopt;
  }

  auto encoder = encoding::scale_encoder_t{};
  auto payload = encoder.try_decode<callback_payload_t>(data);
  if (!payload) {
    error = "callback payload failed to decode";
    return std::nullopt;
  }
  if (payload->version != 1) {
    error = "unsupported callback payload version";
    return std::nullopt;
  }
  if (payload->image_id != image_id) {
    error = "callback image id does not match";
    return std::nullopt;
  }

  spdlog::debug("Accepted callback from {} with {} output bytes",
                to_hex(execution.key), payload->committed_outputs.size());
  return callback_output_t{
      .execution_id = std::move(payload->execution_id),
      .input_digest = payload->input_digest,
      .committed_outputs = std::move(payload->committed_outputs)};
}

}  // namespace hashlock::oracle
