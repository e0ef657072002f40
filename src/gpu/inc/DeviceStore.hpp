#ifndef GPUINFO_GPU_DEVICE_STORE_HPP
#define GPUINFO_GPU_DEVICE_STORE_HPP
/**
 * @file DeviceStore.hpp
 * @brief Owner of the current detected device collection.
 * @note Thread-safe: All members lock an internal mutex.
 */

#include "src/gpu/inc/DeviceRecord.hpp"
#include "src/gpu/inc/GpuStatus.hpp"

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t
#include <mutex>    // std::mutex
#include <optional> // std::optional
#include <vector>   // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- DeviceCollection ----------------------------- */

/**
 * @brief Ordered device list plus the primary index.
 */
struct DeviceCollection {
  std::vector<DeviceRecord> devices; ///< Detection order
  std::size_t primaryIndex{0};       ///< Valid only when devices is non-empty

  [[nodiscard]] bool empty() const noexcept { return devices.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return devices.size(); }
};

/* ----------------------------- StoredRecord ----------------------------- */

/**
 * @brief Copy of one stored record, tagged with where and when it was read.
 */
struct StoredRecord {
  DeviceRecord record;         ///< Copy of the stored record
  std::size_t index{0};        ///< Slot the record was read from
  std::uint64_t generation{0}; ///< Collection generation at read time
};

/* ----------------------------- DeviceStore ----------------------------- */

/**
 * @brief Holds the DeviceCollection owned by one GpuManager.
 *
 * The collection is replaced wholesale on detection. Individual records are
 * only swapped for their refreshed versions by the owning manager.
 *
 * The generation counter advances on every replace() and setPrimary(), so a
 * reader can tell whether the slot it read still means the same thing.
 */
class DeviceStore {
public:
  DeviceStore() = default;

  DeviceStore(const DeviceStore&) = delete;
  DeviceStore& operator=(const DeviceStore&) = delete;

  /// @brief True once a detection result has been stored (even an empty one).
  [[nodiscard]] bool initialized() const;

  /// @brief Replace the collection; primary resets to 0. Advances the generation.
  void replace(std::vector<DeviceRecord> devices);

  /// @brief Copy of the record at index, or nullopt when out of range.
  [[nodiscard]] std::optional<DeviceRecord> get(std::size_t index) const;

  /// @brief Record at index with its generation, or nullopt when out of range.
  [[nodiscard]] std::optional<StoredRecord> stored(std::size_t index) const;

  /// @brief Primary record with its index and generation, or nullopt when empty.
  [[nodiscard]] std::optional<StoredRecord> storedPrimary() const;

  /**
   * @brief Swap in a refreshed record.
   * @return false when index is out of range or the slot now holds a
   *         different device (a detection ran concurrently).
   */
  bool update(std::size_t index, const DeviceRecord& record);

  /**
   * @brief Swap in a refreshed record only if the collection is unchanged.
   * @return false when the generation moved since original was read.
   */
  bool update(const StoredRecord& original, const DeviceRecord& record);

  [[nodiscard]] std::uint64_t generation() const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t primaryIndex() const;

  /// @return OK (generation advanced), or NOT_FOUND when index is out of range.
  GpuStatus setPrimary(std::size_t index);

  /// @brief Copy of the whole collection.
  [[nodiscard]] DeviceCollection collection() const;

private:
  mutable std::mutex mutex_;
  DeviceCollection collection_;
  bool initialized_{false};
  std::uint64_t generation_{0};
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_DEVICE_STORE_HPP
