// xaml_bridge/transform/value_converters.cpp - Tagged literal value conversions
//
#include "xaml_bridge/transform/value_converters.hpp"

#include <algorithm>
#include <cctype>

namespace xaml_bridge
{

namespace
{

bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

ValueConversion visibility_to_bool(std::string_view value)
{
  if (value == "Visible") return {"True", std::nullopt};
  if (value == "Collapsed") return {"False", std::nullopt};
  if (value == "Hidden") {
    return {
      "False",
      "Visibility.Hidden mapped to IsVisible=False; Hidden and Collapsed are not distinguished"};
  }
  return {std::string(value), "Unrecognized Visibility value '" + std::string(value) + "' kept"};
}

ValueConversion negate_bool(std::string_view value)
{
  if (iequals(value, "true")) return {"False", std::nullopt};
  if (iequals(value, "false")) return {"True", std::nullopt};
  return {std::string(value), "Cannot negate non-boolean value '" + std::string(value) + "'"};
}

}  // namespace

ValueConverterRegistry::ValueConverterRegistry()
{
  register_converter("VisibilityToBool", visibility_to_bool);
  register_converter("NegateBool", negate_bool);
}

void ValueConverterRegistry::register_converter(std::string tag, Converter converter)
{
  converters_[std::move(tag)] = std::move(converter);
}

bool ValueConverterRegistry::contains(std::string_view tag) const
{
  return converters_.find(tag) != converters_.end();
}

std::optional<ValueConversion> ValueConverterRegistry::convert(
  std::string_view tag, std::string_view value) const
{
  auto it = converters_.find(tag);
  if (it == converters_.end()) return std::nullopt;
  return it->second(value);
}

}  // namespace xaml_bridge
