#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: call event.
// Notifications emitted by a call, consumed by oracle nodes and dashboards.
namespace surety::schema {

template <uint16_t Version>
struct call_event_attribute;

template <>
struct call_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using call_event_attribute_t = call_event_attribute<1>;

template <uint16_t Version>
struct call_event;

template <>
struct call_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<call_event_attribute_t> attributes;
};

using call_event_t = call_event<1>;

}  // namespace surety::schema
