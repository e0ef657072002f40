/**
 * @file DeviceStore.cpp
 * @brief Device collection ownership.
 */

#include "src/gpu/inc/DeviceStore.hpp"

#include <utility> // std::move

namespace gpuinfo {

namespace gpu {

bool DeviceStore::initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

void DeviceStore::replace(std::vector<DeviceRecord> devices) {
  std::lock_guard<std::mutex> lock(mutex_);
  collection_.devices = std::move(devices);
  collection_.primaryIndex = 0;
  initialized_ = true;
  ++generation_;
}

std::optional<DeviceRecord> DeviceStore::get(std::size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= collection_.devices.size()) {
    return std::nullopt;
  }
  return collection_.devices[index];
}

std::optional<StoredRecord> DeviceStore::stored(std::size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= collection_.devices.size()) {
    return std::nullopt;
  }
  return StoredRecord{collection_.devices[index], index, generation_};
}

std::optional<StoredRecord> DeviceStore::storedPrimary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (collection_.primaryIndex >= collection_.devices.size()) {
    return std::nullopt;
  }
  return StoredRecord{collection_.devices[collection_.primaryIndex], collection_.primaryIndex,
                      generation_};
}

bool DeviceStore::update(const StoredRecord& original, const DeviceRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (original.generation != generation_ || original.index >= collection_.devices.size()) {
    return false;
  }
  collection_.devices[original.index] = record;
  return true;
}

std::uint64_t DeviceStore::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

bool DeviceStore::update(std::size_t index, const DeviceRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= collection_.devices.size() || !(collection_.devices[index] == record)) {
    return false;
  }
  collection_.devices[index] = record;
  return true;
}

std::size_t DeviceStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return collection_.devices.size();
}

std::size_t DeviceStore::primaryIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return collection_.primaryIndex;
}

GpuStatus DeviceStore::setPrimary(std::size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= collection_.devices.size()) {
    return GpuStatus::NOT_FOUND;
  }
  collection_.primaryIndex = index;
  ++generation_;
  return GpuStatus::OK;
}

DeviceCollection DeviceStore::collection() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return collection_;
}

} // namespace gpu

} // namespace gpuinfo
