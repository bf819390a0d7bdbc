#pragma once

#include <veribuild/schema/primitives.hpp>
#include <string>

namespace veribuild::crypto {

/// SHA-256 of the given bytes.
veribuild::schema::digest_t sha256(const veribuild::schema::bytes_view_t& bytes);

/// Drop the zero padding a program account carries after the executable.
veribuild::schema::bytes_view_t trim_trailing_zeros(
    const veribuild::schema::bytes_view_t& bytes);

/// Content hash used on both sides of the comparison: lowercase hex
/// SHA-256 over the executable with trailing zero padding removed.
std::string executable_hash(const veribuild::schema::bytes_view_t& bytes);

}  // namespace veribuild::crypto
