// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file key_id.h
 * @brief Short public-key identifiers used to match envelope signatures to verifiers.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace makoto::signing {

constexpr std::size_t kKeyIdLength = 16;

/**
 * @brief Derives the key identifier of a P-256 public key.
 *
 * The identifier is the first 16 lowercase hex characters of SHA-256 over the 65-byte
 * uncompressed SEC1 encoding. It is a label for lookup, not a binding: anyone who controls
 * key generation can grind a key whose identifier collides with another's.
 *
 * @param uncompressed_point 65-byte 0x04||X||Y encoding. Compressed points must be
 *        decompressed first (Verifier::FromBytes does this).
 */
std::string ComputeKeyId(std::span<const std::uint8_t> uncompressed_point);

} // namespace makoto::signing
