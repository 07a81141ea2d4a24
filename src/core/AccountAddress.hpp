//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/AccountAddress.hpp
// Purpose: Declares the fixed-width account address value type.
// Key invariants: Always exactly kLength bytes; the default value is all zero.
// Ownership/Lifetime: Value type.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace movetext::core
{

/// @brief Identifier of the account that publishes a module or owns a value.
class AccountAddress
{
  public:
    /// @brief Number of bytes in an address.
    static constexpr std::size_t kLength = 16;

    using Bytes = std::array<uint8_t, kLength>;

    /// @brief Construct the zero address.
    AccountAddress() = default;

    /// @brief Construct an address from raw big-endian bytes.
    explicit AccountAddress(const Bytes &bytes) : bytes_(bytes) {}

    /// @brief Build an address from a `0x`-prefixed literal.
    /// @param literal Text such as `0x1` or the full 32-digit form.
    /// @return The address with short literals left-padded with zeros, or an
    ///         error when the prefix is missing, no digit follows it, there are
    ///         more than 2 * kLength digits, or a digit is not hex.
    static support::Expected<AccountAddress> fromHexLiteral(std::string_view literal);

    /// @brief Build an address from exactly 2 * kLength hex digits without prefix.
    static support::Expected<AccountAddress> fromHex(std::string_view hex);

    /// @brief Access the raw bytes.
    const Bytes &bytes() const
    {
        return bytes_;
    }

    /// @brief Full-width lowercase hex without prefix.
    std::string toHex() const;

    /// @brief Full-width lowercase hex with a `0x` prefix.
    std::string toHexLiteral() const;

    /// @brief `0x` followed by the hex digits with leading zeros stripped.
    /// @details The zero address renders as `0x0`.
    std::string shortString() const;

    bool operator==(const AccountAddress &) const = default;

  private:
    Bytes bytes_{};
};

} // namespace movetext::core
