/**
 * @file MemoryDevice.hpp
 * @brief Sparse in-memory block device with fault injection
 *
 * Backs simulated sessions (--simulate) and the engine tests. Storage is
 * kept per 1 MiB block: a block written with a single repeated byte keeps
 * only that byte, so zero-filling a gigabyte costs a few kilobytes.
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace devices {

/**
 * @class MemoryDevice
 * @brief Thread-safe backing store shared between a test and its accessors
 */
class MemoryDevice {
public:
    static constexpr size_t BLOCK_SIZE = 1'024 * 1'024;

    explicit MemoryDevice(uint64_t capacity, uint8_t initial = 0x00);

    [[nodiscard]] auto capacity() const -> uint64_t { return capacity_; }

    /**
     * @brief Store data at offset (caller guarantees the range is valid)
     */
    void write(uint64_t offset, std::span<const uint8_t> data);

    /**
     * @brief Load [offset, offset + out.size()) into out, applying stuck bytes
     */
    void read(uint64_t offset, std::span<uint8_t> out) const;

    /**
     * @brief Set every byte to value
     */
    void fill(uint8_t value);

    [[nodiscard]] auto byte_at(uint64_t offset) const -> uint8_t;

    /**
     * @brief Whether every byte in [offset, offset + length) equals value
     */
    [[nodiscard]] auto all_equal(uint8_t value, uint64_t offset = 0,
                                 std::optional<uint64_t> length = std::nullopt) const -> bool;

    // Exclusive-lock emulation
    [[nodiscard]] auto try_lock() -> bool;
    void unlock();
    [[nodiscard]] auto is_locked() const -> bool;

    // Statistics
    [[nodiscard]] auto write_calls() const -> uint64_t;
    [[nodiscard]] auto bytes_written() const -> uint64_t;
    void reset_statistics();

    // Fault injection

    /**
     * @brief Invert one stored byte (one-time corruption)
     */
    void flip_byte(uint64_t offset);

    /**
     * @brief Make reads at offset always return value regardless of writes
     */
    void set_stuck_byte(uint64_t offset, uint8_t value);

    /**
     * @brief Fail the next count writes that touch offset (or any write when unset)
     * @param transient Whether the injected DeviceIOError may be retried
     */
    void inject_write_failures(uint32_t count, bool transient = true,
                               std::optional<uint64_t> at_offset = std::nullopt);

    /**
     * @brief Fail the next count reads with a transient DeviceIOError
     */
    void inject_read_failures(uint32_t count);

    /**
     * @brief Delay applied to every write call
     */
    void set_write_delay(std::chrono::milliseconds delay);

    /**
     * @brief Make every accessor on this device report AccessDenied
     */
    void set_access_denied(bool denied);
    [[nodiscard]] auto access_denied() const -> bool;

    /**
     * @brief Consume a pending injected write failure for the range, if any
     */
    [[nodiscard]] auto take_write_failure(uint64_t offset, uint64_t length)
        -> std::optional<util::Error>;

    [[nodiscard]] auto take_read_failure(uint64_t offset) -> std::optional<util::Error>;

    [[nodiscard]] auto write_delay() const -> std::chrono::milliseconds;

private:
    struct Block {
        uint8_t fill = 0x00;
        std::unique_ptr<uint8_t[]> data;   ///< Null while the block is uniform
    };

    [[nodiscard]] auto block_length(size_t index) const -> size_t;
    void materialize(Block& block, size_t length);
    [[nodiscard]] auto load(uint64_t offset) const -> uint8_t;

    uint64_t capacity_;
    std::vector<Block> blocks_;
    std::map<uint64_t, uint8_t> stuck_bytes_;

    bool locked_ = false;
    bool access_denied_ = false;
    uint64_t write_calls_ = 0;
    uint64_t bytes_written_ = 0;

    uint32_t pending_write_failures_ = 0;
    bool write_failure_transient_ = true;
    std::optional<uint64_t> write_failure_offset_;
    uint32_t pending_read_failures_ = 0;
    std::chrono::milliseconds write_delay_{0};

    mutable std::mutex mutex_;
};

/**
 * @class MemoryDeviceAccessor
 * @brief Direct access path over a MemoryDevice
 */
class MemoryDeviceAccessor : public IDeviceAccessor {
public:
    explicit MemoryDeviceAccessor(std::shared_ptr<MemoryDevice> device);
    ~MemoryDeviceAccessor() override;

    MemoryDeviceAccessor(const MemoryDeviceAccessor&) = delete;
    MemoryDeviceAccessor& operator=(const MemoryDeviceAccessor&) = delete;

    [[nodiscard]] auto detect_capability()
        -> std::expected<AccessCapabilities, util::Error> override;
    [[nodiscard]] auto open() -> std::expected<void, util::Error> override;
    [[nodiscard]] auto write_chunk(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto read_chunk(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto zero_fill_device(const std::atomic<bool>& cancel_flag)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto flush() -> std::expected<void, util::Error> override;
    void close() override;

    [[nodiscard]] auto capacity() const -> uint64_t override { return device_->capacity(); }
    [[nodiscard]] auto mode() const -> AccessMode override { return AccessMode::DIRECT; }
    [[nodiscard]] auto is_open() const -> bool override { return open_; }

private:
    std::shared_ptr<MemoryDevice> device_;
    bool open_ = false;
};

/**
 * @class MemoryAccessorFactory
 * @brief Accessor factory over a set of in-memory devices keyed by device id
 *
 * Has no fallback path.
 */
class MemoryAccessorFactory : public IAccessorFactory {
public:
    void add_device(const std::string& device_id, std::shared_ptr<MemoryDevice> device);

    [[nodiscard]] auto device(const std::string& device_id) const
        -> std::shared_ptr<MemoryDevice>;

    [[nodiscard]] auto create_raw(const DeviceInfo& device)
        -> std::unique_ptr<IDeviceAccessor> override;
    [[nodiscard]] auto create_fallback(const DeviceInfo& device)
        -> std::unique_ptr<IDeviceAccessor> override;

private:
    std::map<std::string, std::shared_ptr<MemoryDevice>> devices_;
    mutable std::mutex mutex_;
};

}  // namespace devices
