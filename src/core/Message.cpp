#include "conduit/Message.hpp"

#include "conduit/util/Logger.hpp"

#include <cstdlib>

namespace conduit {

const char* variantName(const Message& m) noexcept {
  switch (m.index()) {
    case 0: return "Generated";
    case 1: return "Transformed";
    case 2: return "Merged";
  }
  return "Unknown";
}

void protocolViolation(const char* stage, const Message& m) {
  util::logger().log(
    util::LogLevel::Error,
    "unexpected message",
    { {"stage", stage}, {"variant", variantName(m)} }
  );
  std::abort();
}

Value expectGenerated(const char* stage, const Message& m) {
  if (const auto* g = std::get_if<Generated>(&m)) return g->value;
  protocolViolation(stage, m);
}

Wide expectTransformed(const char* stage, const Message& m) {
  if (const auto* t = std::get_if<Transformed>(&m)) return t->value;
  protocolViolation(stage, m);
}

Wide expectMerged(const char* stage, const Message& m) {
  if (const auto* r = std::get_if<Merged>(&m)) return r->value;
  protocolViolation(stage, m);
}

} // namespace conduit
