/**
 * @file datum.hpp
 * @brief Definition of Datum, the immutable type-erased value carried by contexts and items.
 * @see datum.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "feedweave/common/common.hpp"

namespace feedweave
{

/**
 * @brief Exception thrown when a Datum is read as the wrong type.
 */
class DatumTypeError : public std::runtime_error
{
public:
    explicit DatumTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when reading an empty Datum.
 */
class DatumEmptyError : public std::runtime_error
{
public:
    DatumEmptyError()
        : std::runtime_error("Datum is empty")
    {}
};

/**
 * @brief An immutable, shared, type-erased value.
 *
 * @details
 * Datum holds a value of any copyable or movable type behind a
 * `shared_ptr<const void>`, together with the `std::type_index` of the stored
 * type. It is the payload type for context entries, feed item data, and action
 * parameters and results.
 *
 * Once constructed the stored value is never modified. Copying a Datum shares
 * the stored value; this is what lets context snapshots be copied per refresh
 * without copying every entry.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_ptr == nullptr`
 *
 * @par Thread Safety
 * - The stored value is immutable, so concurrent reads are safe.
 * - Assigning to the same Datum object from two threads is not.
 */
class Datum
{
public:
    /**
     * @brief Default constructor creates an empty Datum.
     */
    Datum() = default;

    /**
     * @brief Create a Datum holding a copy (or move) of value.
     * @tparam T The value type (will be decayed).
     */
    template <typename T>
    [[nodiscard]] static Datum of(T&& value);

    /**
     * @brief Create a Datum constructing T in-place.
     */
    template <typename T, typename... Args>
    [[nodiscard]] static Datum make(Args&&... args);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_ptr != nullptr;
    }

    /**
     * @brief Check if the stored type matches T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Get the type_index of the stored value, or typeid(void) if empty.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Access the stored value.
     * @throws DatumEmptyError if empty.
     * @throws DatumTypeError if the stored type is not T.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Access the stored value, or nullptr if empty or of another type.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Get shared ownership of the stored value.
     * @return shared_ptr<const T> if the type matches, nullptr otherwise.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> get() const noexcept;

    /**
     * @brief Check whether two Datum objects share the same stored value.
     */
    [[nodiscard]] bool shares_value_with(const Datum& other) const noexcept
    {
        return m_ptr == other.m_ptr;
    }

private:
    std::shared_ptr<const void> m_ptr{};
    std::type_index m_ti{typeid(void)};
};

} // namespace feedweave
