/**
 * @file datum.inline.hpp
 * @brief Implementations for type-parameterized members of Datum.
 */
#pragma once
#include "feedweave/common/datum.hpp"

namespace feedweave
{

namespace detail
{

template <typename T>
using datum_storage_t = std::decay_t<T>;

template <typename T>
inline constexpr bool is_storable_datum_v =
    !std::is_void_v<datum_storage_t<T>> &&
    !std::is_array_v<datum_storage_t<T>>;

inline std::string datum_type_mismatch(const std::type_info& expected, std::type_index actual)
{
    return "Datum type mismatch: expected " + std::string{expected.name()} +
           ", got " + std::string{actual.name()};
}

} // namespace detail

template <typename T>
Datum Datum::of(T&& value)
{
    using StorageT = detail::datum_storage_t<T>;
    static_assert(detail::is_storable_datum_v<T>, "Datum: T cannot be void or an array type");

    Datum result;
    result.m_ptr = std::make_shared<StorageT>(std::forward<T>(value));
    result.m_ti = std::type_index{typeid(StorageT)};
    return result;
}

template <typename T, typename... Args>
Datum Datum::make(Args&&... args)
{
    using StorageT = detail::datum_storage_t<T>;
    static_assert(detail::is_storable_datum_v<T>, "Datum: T cannot be void or an array type");

    Datum result;
    result.m_ptr = std::make_shared<StorageT>(std::forward<Args>(args)...);
    result.m_ti = std::type_index{typeid(StorageT)};
    return result;
}

template <typename T>
bool Datum::has_type() const noexcept
{
    using StorageT = detail::datum_storage_t<T>;
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& Datum::as() const
{
    using StorageT = detail::datum_storage_t<T>;

    if (!m_ptr)
    {
        throw DatumEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw DatumTypeError{detail::datum_type_mismatch(typeid(StorageT), m_ti)};
    }
    return *static_cast<const StorageT*>(m_ptr.get());
}

template <typename T>
const T* Datum::try_as() const noexcept
{
    using StorageT = detail::datum_storage_t<T>;

    if (!m_ptr || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_ptr.get());
}

template <typename T>
std::shared_ptr<const T> Datum::get() const noexcept
{
    using StorageT = detail::datum_storage_t<T>;

    if (!m_ptr || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return std::static_pointer_cast<const StorageT>(m_ptr);
}

} // namespace feedweave
