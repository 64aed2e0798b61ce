#pragma once

#include <cstddef>
#include <cstdint>
#include <hashlock/schema/encoding/layout/encoder.hpp>
#include <string_view>

namespace hashlock::escrow {

/// Oracle image that computes the lowercase hex SHA-256 of its first input.
inline constexpr std::string_view kSha256ImageId{
    "75029efa53432a9030e5e76d58fb34dfa786cd0f6182ed0741d635ff5e4f0341"};

/// Second input of every claim, fetched by the prover and never revealed.
inline constexpr std::string_view kPrivateInputUrl{
    "https://echoserver.dev/server?response="
    "N4IgFgpghgJhBOBnEAuA2mkBjA9gOwBcJCBaAgTwAcIQAaEIgDwIHpKAbKASzxAF0+9AEY4Y5V"
    "KArVUDCMzogYUAlBlFEBEAF96G5QFdkKAEwAGU1qA"};

inline constexpr std::size_t kExecutionIdLength = 16;
inline constexpr std::size_t kMaxSeedLength = 32;
inline constexpr std::size_t kMaxPreimageLength = 1024;
inline constexpr std::size_t kDigestTextLength =
    hashlock::schema::kCommittedDigestLength;

inline constexpr std::size_t kEscrowAccountSpace =
    hashlock::schema::encoding::kRecordFootprint<
        hashlock::schema::escrow_record_t>;
inline constexpr std::size_t kTrackerAccountSpace =
    hashlock::schema::encoding::kRecordFootprint<
        hashlock::schema::execution_tracker_t>;

}  // namespace hashlock::escrow
