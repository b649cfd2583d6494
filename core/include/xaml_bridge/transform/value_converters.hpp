// xaml_bridge/transform/value_converters.hpp - Tagged literal value conversions
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace xaml_bridge
{

/**
 * Outcome of one conversion: the new literal plus an optional note that the
 * caller reports as a warning (information lost in the conversion).
 */
struct ValueConversion
{
  std::string value;
  std::optional<std::string> warning;
};

/**
 * Registry of literal conversions keyed by the tag a property mapping names
 * in `value_conversion_rule`.
 *
 * Built-in tags: `VisibilityToBool` (Visible -> True, Collapsed/Hidden ->
 * False, Hidden with a warning) and `NegateBool`.
 */
class ValueConverterRegistry
{
public:
  using Converter = std::function<ValueConversion(std::string_view)>;

  /// Registry with the built-in converters
  ValueConverterRegistry();

  void register_converter(std::string tag, Converter converter);

  [[nodiscard]] bool contains(std::string_view tag) const;

  /// Convert `value` with the converter registered for `tag` (nullopt for an unknown tag)
  [[nodiscard]] std::optional<ValueConversion> convert(std::string_view tag, std::string_view value) const;

private:
  std::map<std::string, Converter, std::less<>> converters_;
};

}  // namespace xaml_bridge
