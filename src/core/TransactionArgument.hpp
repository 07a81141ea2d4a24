//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/TransactionArgument.hpp
// Purpose: Declares the literal values passed into a contract call.
// Key invariants: `value` never exceeds the range of the declared integer kind.
// Ownership/Lifetime: Value type; owns its byte payload.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/AccountAddress.hpp"
#include "support/uint128.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace movetext::core
{

/// @brief Tagged literal supplied as an argument to a contract call.
struct TransactionArgument
{
    /// @brief Enumerates the argument forms.
    enum class Kind
    {
        U8,
        U64,
        U128,
        Bool,
        Address,
        U8Vector
    };
    /// Discriminant selecting which payload is active.
    Kind kind = Kind::U8;
    /// Integer payload for the U8, U64 and U128 kinds.
    support::UInt128 value{0};
    /// Payload for Kind::Bool.
    bool flag{false};
    /// Payload for Kind::Address.
    AccountAddress addr{};
    /// Payload for Kind::U8Vector.
    std::vector<uint8_t> bytes;

    static TransactionArgument u8(uint8_t v);
    static TransactionArgument u64(uint64_t v);
    static TransactionArgument u128(support::UInt128 v);
    static TransactionArgument boolean(bool v);
    static TransactionArgument address(AccountAddress a);
    static TransactionArgument u8Vector(std::vector<uint8_t> b);

    bool operator==(const TransactionArgument &) const = default;
};

/// @brief Render @p arg as a literal the argument grammar accepts again.
/// @details Integers carry their width suffix (`255u8`), addresses use the
///          short form and byte vectors use the `x"..."` spelling.
std::string toString(const TransactionArgument &arg);

} // namespace movetext::core
