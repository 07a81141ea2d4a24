//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements TypeTag construction, deep copy, equality and printing.
/// @details The printers are the inverse of the type tag grammar: feeding
///          toString output back into the parser yields an equal value.

#include "core/TypeTag.hpp"

#include <utility>

namespace movetext::core
{

TypeTag TypeTag::u8()
{
    return TypeTag(Kind::U8);
}

TypeTag TypeTag::u64()
{
    return TypeTag(Kind::U64);
}

TypeTag TypeTag::u128()
{
    return TypeTag(Kind::U128);
}

TypeTag TypeTag::boolean()
{
    return TypeTag(Kind::Bool);
}

TypeTag TypeTag::address()
{
    return TypeTag(Kind::Address);
}

TypeTag TypeTag::signer()
{
    return TypeTag(Kind::Signer);
}

TypeTag TypeTag::vector(TypeTag element)
{
    TypeTag tag(Kind::Vector);
    tag.element_ = std::make_unique<TypeTag>(std::move(element));
    return tag;
}

TypeTag TypeTag::structure(StructTag st)
{
    TypeTag tag(Kind::Struct);
    tag.struct_ = std::make_unique<StructTag>(std::move(st));
    return tag;
}

/// @brief Deep-copy @p other including any nested payload.
TypeTag::TypeTag(const TypeTag &other) : kind_(other.kind_)
{
    if (other.element_)
        element_ = std::make_unique<TypeTag>(*other.element_);
    if (other.struct_)
        struct_ = std::make_unique<StructTag>(*other.struct_);
}

TypeTag::TypeTag(TypeTag &&other) noexcept = default;

TypeTag &TypeTag::operator=(const TypeTag &other)
{
    if (this != &other)
    {
        TypeTag copy(other);
        *this = std::move(copy);
    }
    return *this;
}

TypeTag &TypeTag::operator=(TypeTag &&other) noexcept = default;

TypeTag::~TypeTag() = default;

/// @brief Structural equality; payloads are compared by value.
bool TypeTag::operator==(const TypeTag &other) const
{
    if (kind_ != other.kind_)
        return false;
    switch (kind_)
    {
        case Kind::Vector:
            return *element_ == *other.element_;
        case Kind::Struct:
            return *struct_ == *other.struct_;
        default:
            return true;
    }
}

const char *kindToString(TypeTag::Kind kind)
{
    switch (kind)
    {
        case TypeTag::Kind::U8:
            return "u8";
        case TypeTag::Kind::U64:
            return "u64";
        case TypeTag::Kind::U128:
            return "u128";
        case TypeTag::Kind::Bool:
            return "bool";
        case TypeTag::Kind::Address:
            return "address";
        case TypeTag::Kind::Signer:
            return "signer";
        case TypeTag::Kind::Vector:
            return "vector";
        case TypeTag::Kind::Struct:
            return "struct";
    }
    return "";
}

std::string toString(const TypeTag &tag)
{
    switch (tag.kind())
    {
        case TypeTag::Kind::Vector:
            return "vector<" + toString(tag.element()) + ">";
        case TypeTag::Kind::Struct:
            return toString(tag.structTag());
        default:
            return kindToString(tag.kind());
    }
}

std::string toString(const StructTag &tag)
{
    std::string out = tag.address.shortString() + "::" + tag.module.str() + "::" + tag.name.str();
    if (!tag.typeParams.empty())
    {
        out += '<';
        for (size_t i = 0; i < tag.typeParams.size(); ++i)
        {
            if (i)
                out += ", ";
            out += toString(tag.typeParams[i]);
        }
        out += '>';
    }
    return out;
}

} // namespace movetext::core
