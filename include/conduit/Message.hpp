#pragma once

#include <cstdint>
#include <variant>

namespace conduit {

// Seed-and-increment values produced by the generator.
using Value = std::uint32_t;
// Squares are promoted so v*v never overflows for any Value.
using Wide  = std::uint64_t;

struct Generated   { Value value; };
struct Transformed { Wide  value; };
struct Merged      { Wide  value; };

using Message = std::variant<Generated, Transformed, Merged>;

const char* variantName(const Message& m) noexcept;

// Payload accessors for the variant a stage accepts. Any other variant is a
// wiring bug: protocolViolation() logs the stage and variant, then aborts.
[[noreturn]] void protocolViolation(const char* stage, const Message& m);

Value expectGenerated(const char* stage, const Message& m);
Wide  expectTransformed(const char* stage, const Message& m);
Wide  expectMerged(const char* stage, const Message& m);

} // namespace conduit
