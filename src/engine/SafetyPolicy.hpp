/**
 * @file SafetyPolicy.hpp
 * @brief Pre-destructive checks on a wipe request
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <set>
#include <string>
#include <vector>

namespace engine::safety_policy {

/**
 * @brief Validate the request as a whole (before any device is touched)
 *
 * Rejects an empty device list, duplicate device ids and a confirmation
 * token that does not match the expected phrase.
 */
[[nodiscard]] auto validate_request(const WipeRequest& request,
                                    const std::string& confirmation_phrase)
    -> std::expected<void, util::Error>;

/**
 * @brief Canonical form of a device path used to detect aliases
 *
 * Symlinks are resolved as far as the path exists (so /dev/disk/by-id/...
 * compares equal to the node it points at). Paths that cannot be resolved
 * are compared in lexically normalized form.
 */
[[nodiscard]] auto canonical_device_path(const std::string& path) -> std::string;

/**
 * @brief Resolve and validate one requested device against the inventory
 * @param inventory Authoritative device list
 * @param device_id Requested id
 * @param completed_ids Devices this orchestrator already finalized as Completed
 * @return The inventory entry, or SafetyViolation
 *
 * A target whose canonical path matches any entry flagged as a system disk
 * is refused even when its own entry is not flagged.
 */
[[nodiscard]] auto validate_target(const std::vector<DeviceInfo>& inventory,
                                   const std::string& device_id,
                                   const std::set<std::string>& completed_ids)
    -> std::expected<DeviceInfo, util::Error>;

}  // namespace engine::safety_policy
