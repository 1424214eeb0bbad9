/**
 * @file payload_decoder.hpp
 * @brief Decode observer payloads into domain records, one schema per event path
 *
 * Payloads are decoded completely up front; a missing field or a field of
 * the wrong JSON type is a ParseError naming the path and the field.
 * Transaction bytes and Clarity values are not decoded here: the fields
 * derived from them (sender, BNS names) arrive pre-decoded in the payload.
 */

#pragma once

#include <events/event_models.hpp>
#include <utils/errors.hpp>
#include <string>
#include <utility>
#include <variant>

namespace ChainReplay {

using EventPayload = std::variant<NewBlockData, BurnBlockData, AttachmentData, RawEventData>;

/**
 * @brief Decode by path; paths without a schema become RawEventData.
 */
EventPayload decode_event(const std::string& path, const std::string& payload);

NewBlockData decode_new_block(const std::string& payload);
BurnBlockData decode_burn_block(const std::string& payload);
AttachmentData decode_attachments(const std::string& payload);

/**
 * @brief Unwrap the alternative a phase expects.
 * @throws ParseError if the payload decoded to a different alternative
 */
template <typename T>
T expect_payload(EventPayload&& payload, const std::string& path) {
    if (auto* value = std::get_if<T>(&payload)) {
        return std::move(*value);
    }
    throw ParseError("Unexpected payload kind for event path " + path);
}

} // namespace ChainReplay
