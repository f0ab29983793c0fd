#pragma once

#include <eventwire/core/message/parsed_message.hpp>
#include <eventwire/core/errors/decode_error.hpp>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace EventWire {

/**
 * @brief Decode one complete event-stream frame
 *
 * Validation runs in wire order and stops at the first failure:
 * minimum size, declared total length, prelude CRC, message CRC, headers,
 * then the optional JSON payload stage selected by ":content-type".
 *
 * @param data Pointer to the first byte of the frame (its total_length field)
 * @param len Number of bytes supplied for this frame
 * @return ParsedMessage with headers and payload
 * @throws DecodeError on any validation failure; nothing is partially returned
 */
ParsedMessage decodeFrame(const uint8_t* data, size_t len);

/**
 * @brief Decode a frame held in a vector
 * @throws DecodeError on any validation failure
 */
ParsedMessage decodeFrame(const std::vector<uint8_t>& frame);

} // namespace EventWire
