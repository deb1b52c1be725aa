#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>
#include "../common/result.hpp"
#include "../transport/datagram.hpp"

namespace dutprobe {

/**
 * @brief A device that answered the discovery probe
 *
 * Ordered by (model, serial) only, so listings group by model. Equality compares every
 * field: the same model/serial answering from two ports gives two distinct records.
 */
struct DiscoveryRecord {
  std::string address{};
  uint16_t port{0};
  std::string model{};
  std::string serial{};

  /**
   * @brief Build a record from a discovery response, e.g. "ID;MODEL=M001;SERIAL=SN0123457;"
   * @return Record, or kParseError / kUnexpectedMessage / kMissingField
   */
  [[nodiscard]] static Result<DiscoveryRecord> FromDatagram(Datagram const &datagram);

  friend bool operator==(DiscoveryRecord const &, DiscoveryRecord const &) = default;
  friend bool operator<(DiscoveryRecord const &lhs, DiscoveryRecord const &rhs);
};

/** Hasher over all four fields, for unordered containers. */
struct DiscoveryRecordHasher {
  size_t operator()(DiscoveryRecord const &record) const noexcept {
    size_t seed = std::hash<std::string>{}(record.address);
    seed ^= std::hash<uint16_t>{}(record.port) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= std::hash<std::string>{}(record.model) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= std::hash<std::string>{}(record.serial) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

/**
 * @brief Sort records by (model, serial) for presentation; ties keep arrival order
 */
void SortRecords(std::vector<DiscoveryRecord> &records);

}  // namespace dutprobe
