// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <optional>
#include <string_view>

namespace makoto::validation {

constexpr std::string_view kStatementTypeV1 = "https://in-toto.io/Statement/v1";

constexpr std::string_view kOriginPredicateUri = "https://makoto.dev/origin/v1";
constexpr std::string_view kTransformPredicateUri = "https://makoto.dev/transform/v1";
constexpr std::string_view kStreamWindowPredicateUri = "https://makoto.dev/stream-window/v1";

/**
 * @brief Closed set of statement predicate types, keyed by their URI.
 *
 * Any URI outside the known set maps to Unknown.
 */
enum class PredicateType {
  Origin,
  Transform,
  StreamWindow,
  Unknown,
};

PredicateType ParsePredicateType(std::string_view uri) noexcept;

// nullopt for Unknown.
std::optional<std::string_view> ToUri(PredicateType type) noexcept;

const char* ToString(PredicateType type) noexcept;

} // namespace makoto::validation
