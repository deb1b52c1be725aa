#include "protocol/discovery_record.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>
#include "common/error_code.hpp"
#include "common/result.hpp"
#include "protocol/message_codec.hpp"
#include "protocol/message_kind.hpp"
#include "protocol/wire_names.hpp"

namespace dutprobe {

namespace {

Error MissingField(std::string_view key) {
  Error error = MakeError(ErrorCode::kMissingField, "Device data missing: '" + std::string(key) + "' not found");
  error.field = std::string(key);
  return error;
}

}  // namespace

bool operator<(DiscoveryRecord const &lhs, DiscoveryRecord const &rhs) {
  return std::tie(lhs.model, lhs.serial) < std::tie(rhs.model, rhs.serial);
}

Result<DiscoveryRecord> DiscoveryRecord::FromDatagram(Datagram const &datagram) {
  auto message = MessageCodec::Decode(datagram.payload);
  if (!message.has_value()) {
    return std::move(message).error();
  }
  if (Classify(*message) != MessageKind::kDiscoveryResponse) {
    return MakeError(ErrorCode::kUnexpectedMessage,
                     "Expected a message of type 'ID', got '" + message->GetName() + "'");
  }

  auto model = message->Find(wire::kModel);
  if (!model.has_value()) {
    return MissingField(wire::kModel);
  }
  auto serial = message->Find(wire::kSerial);
  if (!serial.has_value()) {
    return MissingField(wire::kSerial);
  }
  return DiscoveryRecord{datagram.address, datagram.port, std::string(*model), std::string(*serial)};
}

void SortRecords(std::vector<DiscoveryRecord> &records) {
  std::stable_sort(records.begin(), records.end());
}

}  // namespace dutprobe
