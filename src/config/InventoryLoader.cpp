/**
 * @file InventoryLoader.cpp
 */

#include "config/InventoryLoader.hpp"

#include "engine/SafetyPolicy.hpp"
#include "util/Logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <initializer_list>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace config {

namespace {

using nlohmann::json;

class InvalidEntry : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

auto parse_device(const json& entry, size_t index) -> DeviceInfo {
    const auto where = "entry " + std::to_string(index);
    if (!entry.is_object()) {
        throw InvalidEntry(where + " is not an object");
    }
    for (const char* key : {"id", "path", "capacity_bytes", "is_system_disk"}) {
        if (!entry.contains(key)) {
            throw InvalidEntry(where + " lacks required key '" + key + "'");
        }
    }

    DeviceInfo device;
    device.id = entry.at("id").get<std::string>();
    device.path = entry.at("path").get<std::string>();
    if (!entry.at("capacity_bytes").is_number_unsigned()) {
        throw InvalidEntry(where + ": capacity_bytes must be a non-negative integer");
    }
    device.capacity_bytes = entry.at("capacity_bytes").get<uint64_t>();
    device.is_system_disk = entry.at("is_system_disk").get<bool>();

    device.sector_size = entry.value("sector_size", device.sector_size);
    device.model = entry.value("model", std::string());
    device.serial = entry.value("serial", std::string());
    device.is_removable = entry.value("is_removable", false);

    if (device.id.empty()) {
        throw InvalidEntry(where + ": id must not be empty");
    }
    if (device.sector_size < 512 || (device.sector_size & (device.sector_size - 1)) != 0) {
        throw InvalidEntry(where + " (" + device.id + "): sector_size must be a power of two >= 512");
    }
    return device;
}

}  // namespace

auto parse_inventory(std::string_view text) -> std::expected<std::vector<DeviceInfo>, util::Error> {
    std::vector<DeviceInfo> devices;
    try {
        auto j = json::parse(text.begin(), text.end());
        if (!j.is_array()) {
            return std::unexpected(util::Error::configuration("Inventory must be a JSON array"));
        }

        std::set<std::string> ids;
        std::map<std::string, std::string> owners;  // canonical path -> id
        for (size_t i = 0; i < j.size(); ++i) {
            auto device = parse_device(j.at(i), i);
            if (!ids.insert(device.id).second) {
                throw InvalidEntry("duplicate device id '" + device.id + "'");
            }
            if (!device.path.empty()) {
                auto [owner, inserted] = owners.emplace(
                    engine::safety_policy::canonical_device_path(device.path), device.id);
                if (!inserted) {
                    throw InvalidEntry("entries '" + owner->second + "' and '" + device.id +
                                       "' are the same device " + owner->first);
                }
            }
            devices.push_back(std::move(device));
        }
    } catch (const InvalidEntry& e) {
        return std::unexpected(util::Error::configuration(std::string("Invalid inventory: ") +
                                                          e.what()));
    } catch (const json::exception& e) {
        return std::unexpected(util::Error::configuration(std::string("Invalid inventory: ") +
                                                          e.what()));
    }
    return devices;
}

auto load_inventory(const std::filesystem::path& path)
    -> std::expected<std::vector<DeviceInfo>, util::Error> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            util::Error::configuration("Cannot open inventory file " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto devices = parse_inventory(buffer.str());
    if (devices) {
        LOG_INFO("InventoryLoader",
                 "Loaded " + std::to_string(devices->size()) + " devices from " + path.string());
    } else {
        LOG_ERROR("InventoryLoader", path.string() + ": " + devices.error().message);
    }
    return devices;
}

}  // namespace config
