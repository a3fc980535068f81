/**
 * @file context.hpp
 * @brief Context snapshots, partial context updates, and typed context keys.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include "feedweave/common/datum.hpp"
#include "feedweave/common/datum.inline.hpp"

namespace feedweave
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief A context key bound to the type of value stored under it.
 *
 * @details
 * Each source declares its keys next to its value types:
 * @code
 * struct Location { double lat; double lng; double accuracy; };
 * inline const ContextKey<Location> kLocationKey{"location"};
 * @endcode
 * Keys share one string namespace across all sources. Nothing prevents two
 * unrelated sources from choosing the same name; Context tracks the writer of
 * each key so such collisions can at least be reported.
 */
template <typename T>
class ContextKey
{
public:
    using value_type = T;

    explicit ContextKey(std::string name)
        : m_name{std::move(name)}
    {}

    const std::string& name() const noexcept
    {
        return m_name;
    }

private:
    std::string m_name;
};

/**
 * @brief The entries one source contributes to the context.
 *
 * @details
 * Setting the same key twice keeps the later value.
 */
class PartialContext
{
public:
    PartialContext() = default;

    template <typename T>
    PartialContext& set(const ContextKey<T>& key, typename ContextKey<T>::value_type value)
    {
        m_entries[key.name()] = Datum::of(std::move(value));
        return *this;
    }

    PartialContext& set_datum(const std::string& key, Datum value)
    {
        m_entries[key] = std::move(value);
        return *this;
    }

    bool contains(const std::string& key) const
    {
        return m_entries.find(key) != m_entries.end();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    const std::map<std::string, Datum>& entries() const noexcept
    {
        return m_entries;
    }

private:
    std::map<std::string, Datum> m_entries;
};

/**
 * @brief A time-stamped snapshot of accumulated world state.
 *
 * @details
 * A Context holds the mandatory `time` plus every entry merged into it so far.
 * It has value semantics and is never modified in place by the engine: merge
 * operations return a new snapshot, so a context handed to a source or stored
 * in a FeedResult stays exactly as it was.
 *
 * Entries are stored as Datum, so copying a Context copies shared pointers,
 * not values.
 *
 * @par Thread Safety
 * - Concurrent reads are safe.
 */
class Context
{
public:
    /**
     * @brief Construct an empty context at the epoch.
     */
    Context() = default;

    explicit Context(TimePoint time)
        : m_time{time}
    {}

    TimePoint time() const noexcept
    {
        return m_time;
    }

    /**
     * @brief Return a copy with `time` replaced.
     */
    Context with_time(TimePoint time) const;

    /**
     * @brief Return a copy with the update's entries merged in.
     * @param update Entries to add or overwrite.
     * @param writer_id Id of the source the entries come from.
     */
    Context merged(const PartialContext& update, const std::string& writer_id) const;

    /**
     * @brief List keys of the update that were last written by a different source.
     *
     * @details
     * Used by the engine to report accidental cross-source key collisions
     * before merging.
     */
    std::vector<std::string> colliding_keys(const PartialContext& update,
                                            const std::string& writer_id) const;

    /**
     * @brief Get the value stored under a typed key.
     * @return Pointer to the value, or nullptr if the key is absent.
     * @throws DatumTypeError if the key holds a value of another type.
     */
    template <typename T>
    const T* value(const ContextKey<T>& key) const
    {
        auto it = m_entries.find(key.name());
        if (it == m_entries.end())
        {
            return nullptr;
        }
        return &it->second.template as<T>();
    }

    /**
     * @brief Get the raw entry for a key, or nullptr.
     */
    const Datum* find(const std::string& key) const;

    bool contains(const std::string& key) const
    {
        return m_entries.find(key) != m_entries.end();
    }

    /**
     * @brief Id of the source that last wrote a key, or empty if unknown.
     */
    std::string writer_of(const std::string& key) const;

    /**
     * @brief Get all keys in lexicographic order.
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Number of entries, excluding `time`.
     */
    size_t size() const noexcept
    {
        return m_entries.size();
    }

private:
    TimePoint m_time{};
    std::map<std::string, Datum> m_entries{};
    std::map<std::string, std::string> m_writers{};
};

/**
 * @brief Function returning the engine's current context.
 */
using ContextAccessor = std::function<Context()>;

} // namespace feedweave
