//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares TypeTag and StructTag, the on-chain description of a
// value's type.  A TypeTag is one of six payload-free primitives, a vector that
// owns exactly one element tag, or a struct that owns a StructTag.  A StructTag
// names a type by publishing address, module and struct name and carries an
// ordered, possibly empty, list of type arguments.
//
// TypeTag uses the same discriminated-struct pattern as the other value types
// in this library: a Kind field selects the active payload and factory
// functions are the only way to pair a kind with its payload.  The recursive
// payloads are heap allocated and deep-copied so a TypeTag behaves as a plain
// value.
//
// Text rendering:
//   u8 u64 u128 bool address signer
//   vector<T>
//   0x<short address>::<module>::<name>[<T1, T2, ...>]
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/AccountAddress.hpp"
#include "core/Identifier.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace movetext::core
{

/// @brief Depth at which type tag parsing gives up.
/// @details Depth starts at 0 for the outermost tag and grows by one per vector
///          element and per struct type argument; reaching this value fails.
inline constexpr std::size_t kMaxTypeTagNesting = 13;

struct StructTag;

/// @brief Description of a value's type.
class TypeTag
{
  public:
    /// @brief Enumerates the type tag variants.
    enum class Kind
    {
        U8,
        U64,
        U128,
        Bool,
        Address,
        Signer,
        Vector,
        Struct
    };

    /// @brief Construct a payload-free primitive tag.
    /// @invariant result.kind() == Kind::U8.
    static TypeTag u8();
    static TypeTag u64();
    static TypeTag u128();
    static TypeTag boolean();
    static TypeTag address();
    static TypeTag signer();

    /// @brief Construct `vector<element>`.
    static TypeTag vector(TypeTag element);

    /// @brief Wrap @p tag as a struct type.
    static TypeTag structure(StructTag tag);

    TypeTag(const TypeTag &other);
    TypeTag(TypeTag &&other) noexcept;
    TypeTag &operator=(const TypeTag &other);
    TypeTag &operator=(TypeTag &&other) noexcept;
    ~TypeTag();

    /// @brief Discriminant selecting which payload is active.
    Kind kind() const
    {
        return kind_;
    }

    /// @brief Element type; requires kind() == Kind::Vector.
    const TypeTag &element() const
    {
        return *element_;
    }

    /// @brief Struct payload; requires kind() == Kind::Struct.
    const StructTag &structTag() const
    {
        return *struct_;
    }

    bool operator==(const TypeTag &other) const;

  private:
    explicit TypeTag(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::unique_ptr<TypeTag> element_;
    std::unique_ptr<StructTag> struct_;
};

/// @brief Fully qualified struct type with its type arguments.
struct StructTag
{
    AccountAddress address;
    Identifier module;
    Identifier name;
    std::vector<TypeTag> typeParams;

    bool operator==(const StructTag &) const = default;
};

/// @brief Keyword spelling of a primitive kind, or "vector"/"struct".
const char *kindToString(TypeTag::Kind kind);

/// @brief Canonical text of @p tag.
std::string toString(const TypeTag &tag);

/// @brief Canonical text of @p tag; the address uses its short form.
std::string toString(const StructTag &tag);

} // namespace movetext::core
