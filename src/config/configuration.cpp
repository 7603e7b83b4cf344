#include <cascade/config/configuration.hpp>
#include <cascade/wire/codec.hpp>

#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>

namespace cascade::config {

namespace {

inline constexpr auto kTimeSpanElement = std::string_view{"TimeSpan"};

int32_t parse_component(const schema::attribute_list_t& attributes,
                        const std::string_view name) {
  const auto* text = schema::find_attribute(attributes, name);
  if (text == nullptr) {
    return 0;
  }
  auto value = int32_t{};
  auto [end, error] =
      std::from_chars(text->data(), text->data() + text->size(), value);
  if (error != std::errc{} || end != text->data() + text->size() ||
      value < 0) {
    spdlog::warn("Ignoring invalid {} value '{}' of {}", name, *text,
                 kPurgePeriodKey);
    return 0;
  }
  return value;
}

}  // namespace

bool is_truthy(const std::optional<std::string_view> value) {
  if (!value || value->empty()) {
    return false;
  }
  switch (std::tolower(static_cast<unsigned char>(value->front()))) {
    case 'y':
    case 't':
    case '1':
      return true;
    default:
      return false;
  }
}

purge_period parse_purge_period(const std::string_view text) {
  auto attributes = wire::try_decode_element(text, kTimeSpanElement);
  if (!attributes) {
    spdlog::warn("{} is not a TimeSpan element; using one week",
                 kPurgePeriodKey);
    return purge_period{};
  }
  return purge_period{.months = parse_component(*attributes, "Month"),
                      .weeks = parse_component(*attributes, "Week"),
                      .days = parse_component(*attributes, "Day")};
}

configuration::configuration(std::vector<schema::parameter_t> parameters) {
  for (auto& parameter : parameters) {
    auto name = parameter.name;
    parameters_.insert_or_assign(std::move(name), std::move(parameter));
  }
}

std::optional<std::string> configuration::value(
    const std::string_view name) const {
  auto found = parameters_.find(name);
  if (found == parameters_.end()) {
    return std::nullopt;
  }
  return found->second.value;
}

bool configuration::enabled(const std::string_view name) const {
  auto text = value(name);
  if (!text) {
    return false;
  }
  return is_truthy(std::string_view{*text});
}

purge_period configuration::retention() const {
  auto text = value(kPurgePeriodKey);
  if (!text) {
    return purge_period{};
  }
  return parse_purge_period(*text);
}

configuration load_configuration(const storage::storage_t& store) {
  auto parameters = store.list_parameters();
  spdlog::debug("Loaded {} runtime parameter(s)", parameters.size());
  return configuration{std::move(parameters)};
}

}  // namespace cascade::config
