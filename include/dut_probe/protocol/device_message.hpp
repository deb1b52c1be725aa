#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dutprobe {

/**
 * @brief Named message with ordered key/value fields, as exchanged with devices
 *
 * For example the discovery response "ID;MODEL=M001;SERIAL=SN0123457;" is the message
 * named "ID" with fields {MODEL: M001, SERIAL: SN0123457}.
 *
 * Strings hold ISO-8859-1 code units, one char per wire byte. Values are never
 * interpreted as numbers here; see StatusSample for that.
 */
class DeviceMessage {
 public:
  using Field = std::pair<std::string, std::string>;

  explicit DeviceMessage(std::string name)
      : name_(std::move(name)) {}

  DeviceMessage(std::string name, std::vector<Field> const &fields)
      : name_(std::move(name)) {
    for (auto const &[key, value] : fields) {
      Set(key, value);
    }
  }

  [[nodiscard]] std::string const &GetName() const noexcept { return name_; }
  [[nodiscard]] std::vector<Field> const &GetFields() const noexcept { return fields_; }

  [[nodiscard]] bool Contains(std::string_view key) const { return Find(key).has_value(); }

  /**
   * @brief Value stored under key, if present
   */
  [[nodiscard]] std::optional<std::string_view> Find(std::string_view key) const;

  /**
   * @brief True when key is present and its value equals expected
   */
  [[nodiscard]] bool HasValue(std::string_view key, std::string_view expected) const;

  /**
   * @brief Add a field, or replace the value of an existing key in place
   *
   * Keys stay unique and keep the position they were first added at.
   */
  void Set(std::string_view key, std::string_view value);

  friend bool operator==(DeviceMessage const &, DeviceMessage const &) = default;

 private:
  std::string name_;
  std::vector<Field> fields_{};
};

}  // namespace dutprobe
