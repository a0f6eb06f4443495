#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file types.hpp
 * @brief Enumerations shared by the record types, with their JSON spellings
 *
 * The JSON spellings are the durable format: they appear in saved databases
 * and in checkpoint payloads, so they must not change.
 */

#include <nlohmann/json.hpp>

#include <string>

namespace retrace {

enum class BranchState { Active, Completed, Abandoned };

enum class CrossRefKind { Supports, Contradicts, Extends, Alternative, Depends };

enum class SnapshotKind { Full, Incremental, Branch };

enum class TimelineState { Active, Archived, Merged };

enum class InterventionType { Change, Remove, Replace, Inject };

NLOHMANN_JSON_SERIALIZE_ENUM(BranchState, {
    {BranchState::Active, "active"},
    {BranchState::Completed, "completed"},
    {BranchState::Abandoned, "abandoned"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CrossRefKind, {
    {CrossRefKind::Supports, "supports"},
    {CrossRefKind::Contradicts, "contradicts"},
    {CrossRefKind::Extends, "extends"},
    {CrossRefKind::Alternative, "alternative"},
    {CrossRefKind::Depends, "depends"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(SnapshotKind, {
    {SnapshotKind::Full, "full"},
    {SnapshotKind::Incremental, "incremental"},
    {SnapshotKind::Branch, "branch"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TimelineState, {
    {TimelineState::Active, "active"},
    {TimelineState::Archived, "archived"},
    {TimelineState::Merged, "merged"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(InterventionType, {
    {InterventionType::Change, "change"},
    {InterventionType::Remove, "remove"},
    {InterventionType::Replace, "replace"},
    {InterventionType::Inject, "inject"},
})

/// JSON spelling of an enum value, for log lines and error messages
template <typename E>
inline std::string to_string(E value) {
  return nlohmann::json(value).template get<std::string>();
}

}  // namespace retrace
