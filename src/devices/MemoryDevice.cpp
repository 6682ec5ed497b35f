/**
 * @file MemoryDevice.cpp
 * @brief In-memory device and its access path
 */

#include "devices/MemoryDevice.hpp"

#include <algorithm>
#include <cstring>
#include <thread>
#include <utility>

namespace devices {

namespace {

auto is_uniform(std::span<const uint8_t> data) -> bool {
    if (data.empty()) {
        return true;
    }
    const uint8_t first = data.front();
    return std::all_of(data.begin(), data.end(), [first](uint8_t b) { return b == first; });
}

}  // namespace

// ============================================================================
// MemoryDevice
// ============================================================================

MemoryDevice::MemoryDevice(uint64_t capacity, uint8_t initial)
    : capacity_(capacity), blocks_((capacity + BLOCK_SIZE - 1) / BLOCK_SIZE) {
    for (auto& block : blocks_) {
        block.fill = initial;
    }
}

auto MemoryDevice::block_length(size_t index) const -> size_t {
    const uint64_t start = static_cast<uint64_t>(index) * BLOCK_SIZE;
    return static_cast<size_t>(std::min<uint64_t>(BLOCK_SIZE, capacity_ - start));
}

void MemoryDevice::materialize(Block& block, size_t length) {
    if (block.data) {
        return;
    }
    block.data = std::make_unique<uint8_t[]>(length);
    std::memset(block.data.get(), block.fill, length);
}

auto MemoryDevice::load(uint64_t offset) const -> uint8_t {
    const auto& block = blocks_[static_cast<size_t>(offset / BLOCK_SIZE)];
    return block.data ? block.data[offset % BLOCK_SIZE] : block.fill;
}

void MemoryDevice::write(uint64_t offset, std::span<const uint8_t> data) {
    std::lock_guard lock(mutex_);
    ++write_calls_;
    bytes_written_ += data.size();

    size_t consumed = 0;
    while (consumed < data.size()) {
        const uint64_t position = offset + consumed;
        const auto index = static_cast<size_t>(position / BLOCK_SIZE);
        const auto within = static_cast<size_t>(position % BLOCK_SIZE);
        const size_t length = block_length(index);
        const size_t count = std::min(length - within, data.size() - consumed);
        auto segment = data.subspan(consumed, count);
        auto& block = blocks_[index];

        if (within == 0 && count == length && is_uniform(segment)) {
            block.data.reset();
            block.fill = segment.front();
        } else if (!block.data && is_uniform(segment) && segment.front() == block.fill) {
            // Already holds these bytes
        } else {
            materialize(block, length);
            std::memcpy(block.data.get() + within, segment.data(), count);
        }
        consumed += count;
    }
}

void MemoryDevice::read(uint64_t offset, std::span<uint8_t> out) const {
    std::lock_guard lock(mutex_);

    size_t produced = 0;
    while (produced < out.size()) {
        const uint64_t position = offset + produced;
        const auto index = static_cast<size_t>(position / BLOCK_SIZE);
        const auto within = static_cast<size_t>(position % BLOCK_SIZE);
        const size_t count = std::min(block_length(index) - within, out.size() - produced);
        const auto& block = blocks_[index];

        if (block.data) {
            std::memcpy(out.data() + produced, block.data.get() + within, count);
        } else {
            std::memset(out.data() + produced, block.fill, count);
        }
        produced += count;
    }

    auto it = stuck_bytes_.lower_bound(offset);
    for (; it != stuck_bytes_.end() && it->first < offset + out.size(); ++it) {
        out[static_cast<size_t>(it->first - offset)] = it->second;
    }
}

void MemoryDevice::fill(uint8_t value) {
    std::lock_guard lock(mutex_);
    for (auto& block : blocks_) {
        block.data.reset();
        block.fill = value;
    }
}

auto MemoryDevice::byte_at(uint64_t offset) const -> uint8_t {
    std::lock_guard lock(mutex_);
    if (auto it = stuck_bytes_.find(offset); it != stuck_bytes_.end()) {
        return it->second;
    }
    return load(offset);
}

auto MemoryDevice::all_equal(uint8_t value, uint64_t offset, std::optional<uint64_t> length) const
    -> bool {
    std::lock_guard lock(mutex_);
    if (offset >= capacity_) {
        return true;
    }
    const uint64_t end = std::min(capacity_, offset + length.value_or(capacity_ - offset));

    uint64_t position = offset;
    while (position < end) {
        const auto index = static_cast<size_t>(position / BLOCK_SIZE);
        const auto within = static_cast<size_t>(position % BLOCK_SIZE);
        const auto count =
            static_cast<size_t>(std::min<uint64_t>(block_length(index) - within, end - position));
        const auto& block = blocks_[index];

        if (block.data) {
            const auto* begin = block.data.get() + within;
            if (!std::all_of(begin, begin + count, [value](uint8_t b) { return b == value; })) {
                return false;
            }
        } else if (block.fill != value) {
            return false;
        }
        position += count;
    }

    auto it = stuck_bytes_.lower_bound(offset);
    for (; it != stuck_bytes_.end() && it->first < end; ++it) {
        if (it->second != value) {
            return false;
        }
    }
    return true;
}

auto MemoryDevice::try_lock() -> bool {
    std::lock_guard lock(mutex_);
    if (locked_) {
        return false;
    }
    locked_ = true;
    return true;
}

void MemoryDevice::unlock() {
    std::lock_guard lock(mutex_);
    locked_ = false;
}

auto MemoryDevice::is_locked() const -> bool {
    std::lock_guard lock(mutex_);
    return locked_;
}

auto MemoryDevice::write_calls() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return write_calls_;
}

auto MemoryDevice::bytes_written() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return bytes_written_;
}

void MemoryDevice::reset_statistics() {
    std::lock_guard lock(mutex_);
    write_calls_ = 0;
    bytes_written_ = 0;
}

void MemoryDevice::flip_byte(uint64_t offset) {
    std::lock_guard lock(mutex_);
    auto& block = blocks_[static_cast<size_t>(offset / BLOCK_SIZE)];
    materialize(block, block_length(static_cast<size_t>(offset / BLOCK_SIZE)));
    block.data[offset % BLOCK_SIZE] = static_cast<uint8_t>(~block.data[offset % BLOCK_SIZE]);
}

void MemoryDevice::set_stuck_byte(uint64_t offset, uint8_t value) {
    std::lock_guard lock(mutex_);
    stuck_bytes_[offset] = value;
}

void MemoryDevice::inject_write_failures(uint32_t count, bool transient,
                                         std::optional<uint64_t> at_offset) {
    std::lock_guard lock(mutex_);
    pending_write_failures_ = count;
    write_failure_transient_ = transient;
    write_failure_offset_ = at_offset;
}

void MemoryDevice::inject_read_failures(uint32_t count) {
    std::lock_guard lock(mutex_);
    pending_read_failures_ = count;
}

void MemoryDevice::set_write_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    write_delay_ = delay;
}

auto MemoryDevice::write_delay() const -> std::chrono::milliseconds {
    std::lock_guard lock(mutex_);
    return write_delay_;
}

void MemoryDevice::set_access_denied(bool denied) {
    std::lock_guard lock(mutex_);
    access_denied_ = denied;
}

auto MemoryDevice::access_denied() const -> bool {
    std::lock_guard lock(mutex_);
    return access_denied_;
}

auto MemoryDevice::take_write_failure(uint64_t offset, uint64_t length)
    -> std::optional<util::Error> {
    std::lock_guard lock(mutex_);
    if (pending_write_failures_ == 0) {
        return std::nullopt;
    }
    if (write_failure_offset_ &&
        (*write_failure_offset_ < offset || *write_failure_offset_ >= offset + length)) {
        return std::nullopt;
    }
    --pending_write_failures_;
    auto error = util::Error::device_io("Injected write failure at offset " +
                                            std::to_string(offset),
                                        EIO, write_failure_transient_);
    error.offset = offset;
    return error;
}

auto MemoryDevice::take_read_failure(uint64_t offset) -> std::optional<util::Error> {
    std::lock_guard lock(mutex_);
    if (pending_read_failures_ == 0) {
        return std::nullopt;
    }
    --pending_read_failures_;
    auto error = util::Error::device_io(
        "Injected read failure at offset " + std::to_string(offset), EIO, true);
    error.offset = offset;
    return error;
}

// ============================================================================
// MemoryDeviceAccessor
// ============================================================================

MemoryDeviceAccessor::MemoryDeviceAccessor(std::shared_ptr<MemoryDevice> device)
    : device_(std::move(device)) {}

MemoryDeviceAccessor::~MemoryDeviceAccessor() {
    close();
}

auto MemoryDeviceAccessor::detect_capability() -> std::expected<AccessCapabilities, util::Error> {
    if (device_->access_denied()) {
        return std::unexpected(util::Error::access_denied("Raw access denied to memory device"));
    }
    AccessCapabilities caps;
    caps.mode = AccessMode::DIRECT;
    caps.capacity_bytes = device_->capacity();
    caps.description = "memory device";
    return caps;
}

auto MemoryDeviceAccessor::open() -> std::expected<void, util::Error> {
    if (open_) {
        return {};
    }
    if (device_->access_denied()) {
        return std::unexpected(util::Error::access_denied("Raw access denied to memory device"));
    }
    if (!device_->try_lock()) {
        return std::unexpected(
            util::Error::access_denied("Memory device is locked by another session", EBUSY));
    }
    open_ = true;
    return {};
}

auto MemoryDeviceAccessor::write_chunk(uint64_t offset, std::span<const uint8_t> data)
    -> std::expected<void, util::Error> {
    if (!open_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }
    if (auto range = check_range(offset, data.size(), device_->capacity()); !range) {
        return range;
    }
    if (auto delay = device_->write_delay(); delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    if (auto failure = device_->take_write_failure(offset, data.size())) {
        return std::unexpected(std::move(*failure));
    }
    device_->write(offset, data);
    return {};
}

auto MemoryDeviceAccessor::read_chunk(uint64_t offset, std::span<uint8_t> out)
    -> std::expected<void, util::Error> {
    if (!open_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }
    if (auto range = check_range(offset, out.size(), device_->capacity()); !range) {
        return range;
    }
    if (auto failure = device_->take_read_failure(offset)) {
        return std::unexpected(std::move(*failure));
    }
    device_->read(offset, out);
    return {};
}

auto MemoryDeviceAccessor::zero_fill_device(const std::atomic<bool>& cancel_flag)
    -> std::expected<void, util::Error> {
    if (!open_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }
    if (cancel_flag.load()) {
        return std::unexpected(util::Error::cancelled());
    }
    device_->fill(0x00);
    return {};
}

auto MemoryDeviceAccessor::flush() -> std::expected<void, util::Error> {
    return {};
}

void MemoryDeviceAccessor::close() {
    if (open_) {
        device_->unlock();
        open_ = false;
    }
}

// ============================================================================
// MemoryAccessorFactory
// ============================================================================

void MemoryAccessorFactory::add_device(const std::string& device_id,
                                       std::shared_ptr<MemoryDevice> device) {
    std::lock_guard lock(mutex_);
    devices_[device_id] = std::move(device);
}

auto MemoryAccessorFactory::device(const std::string& device_id) const
    -> std::shared_ptr<MemoryDevice> {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(device_id);
    return it == devices_.end() ? nullptr : it->second;
}

auto MemoryAccessorFactory::create_raw(const DeviceInfo& device)
    -> std::unique_ptr<IDeviceAccessor> {
    auto backing = this->device(device.id);
    if (!backing) {
        return nullptr;
    }
    return std::make_unique<MemoryDeviceAccessor>(std::move(backing));
}

auto MemoryAccessorFactory::create_fallback(const DeviceInfo& /*device*/)
    -> std::unique_ptr<IDeviceAccessor> {
    return nullptr;
}

}  // namespace devices
