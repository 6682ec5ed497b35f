/**
 * @file SafetyPolicy.cpp
 * @brief Pre-destructive checks on a wipe request
 */

#include "engine/SafetyPolicy.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace engine::safety_policy {

auto canonical_device_path(const std::string& path) -> std::string {
    const std::filesystem::path device_path(path);
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(device_path, ec);
    if (ec) {
        return device_path.lexically_normal().string();
    }
    return canonical.string();
}

auto validate_request(const WipeRequest& request, const std::string& confirmation_phrase)
    -> std::expected<void, util::Error> {
    if (request.device_ids.empty()) {
        return std::unexpected(util::Error::safety("No device selected"));
    }

    std::set<std::string> seen;
    for (const auto& id : request.device_ids) {
        if (!seen.insert(id).second) {
            return std::unexpected(
                util::Error::safety("Device listed more than once in request: " + id));
        }
    }

    if (confirmation_phrase.empty() || request.confirmation_token != confirmation_phrase) {
        return std::unexpected(
            util::Error::safety("Confirmation token missing or does not match"));
    }
    return {};
}

auto validate_target(const std::vector<DeviceInfo>& inventory, const std::string& device_id,
                     const std::set<std::string>& completed_ids)
    -> std::expected<DeviceInfo, util::Error> {
    if (device_id.empty()) {
        return std::unexpected(util::Error::safety("Device id is empty"));
    }

    auto it = std::find_if(inventory.begin(), inventory.end(),
                           [&device_id](const DeviceInfo& d) { return d.id == device_id; });
    if (it == inventory.end()) {
        return std::unexpected(util::Error::safety("Device not in inventory: " + device_id));
    }

    if (it->is_system_disk) {
        return std::unexpected(
            util::Error::safety("Refusing to wipe boot/system device " + device_id));
    }

    const auto target_path = canonical_device_path(it->path);
    auto system_alias = std::find_if(inventory.begin(), inventory.end(),
                                     [&target_path](const DeviceInfo& d) {
                                         return d.is_system_disk && !d.path.empty() &&
                                                canonical_device_path(d.path) == target_path;
                                     });
    if (system_alias != inventory.end()) {
        return std::unexpected(util::Error::safety("Refusing to wipe " + device_id + ": " +
                                                   it->path + " is boot/system device " +
                                                   system_alias->id));
    }

    if (it->capacity_bytes == 0) {
        return std::unexpected(util::Error::safety("Device " + device_id + " has zero capacity"));
    }

    if (it->path.empty()) {
        return std::unexpected(util::Error::safety("Device " + device_id + " has no path"));
    }

    if (completed_ids.contains(device_id)) {
        return std::unexpected(
            util::Error::safety("Device " + device_id + " was already sanitized in this run"));
    }

    return *it;
}

}  // namespace engine::safety_policy
