#pragma once

#include <string>
#include <system_error>

namespace structwire {

enum class StructwireErrc {
  ok = 0,
  buffer_too_small = 1,
  invalid_argument = 2,
  io_error = 3,
};

class StructwireErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "structwire"; }
  std::string message(int ev) const override {
    switch (static_cast<StructwireErrc>(ev)) {
      case StructwireErrc::ok: return "ok";
      case StructwireErrc::buffer_too_small: return "buffer too small";
      case StructwireErrc::invalid_argument: return "invalid argument";
      case StructwireErrc::io_error: return "I/O error";
      default: return "unknown error";
    }
  }
};

inline const std::error_category& structwire_error_category() {
  static StructwireErrorCategory cat;
  return cat;
}

inline std::error_code make_error_code(StructwireErrc e) {
  return {static_cast<int>(e), structwire_error_category()};
}

} // namespace structwire

namespace std {
template<> struct is_error_code_enum<structwire::StructwireErrc> : true_type {};
}
