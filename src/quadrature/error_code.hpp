#pragma once

#include <system_error>

namespace quadrature {

enum class errc {
    invalid_transition = 1,
    pin_read,
};

const std::error_category& errorCategory();

inline std::error_code make_error_code(errc e) {
    return {static_cast<int>(e), errorCategory()};
}

}  // namespace quadrature

namespace std {

template <>
struct is_error_code_enum<quadrature::errc> : std::true_type {};

}  // namespace std
