// File: include/core/DreamRecord.hpp
//
// Core data model representing a single journaled dream.
// Instances are produced by the external store (or the journal reader in the
// host tool) and only ever read by the analysis layer.

#ifndef LUCIDLOG_CORE_DREAM_RECORD_HPP
#define LUCIDLOG_CORE_DREAM_RECORD_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "core/Calendar.hpp"

namespace core
{

/**
 * @brief One dream journal entry.
 *
 * Responsibilities:
 *  - Store the fields captured at entry time (title, content, tags).
 *  - Carry the lucidity flag and the optional dream sign.
 *
 * Design notes:
 *  - Value type; cheap to keep in std::vector snapshots.
 *  - Tags live in a std::set, so they are deduplicated and iteration order
 *    is stable regardless of entry order.
 *  - The "dream sign present iff lucid" rule is not enforced here; the
 *    snapshot validator reports violations instead of silently fixing them.
 */
class DreamRecord
{
public:
    using Id = std::uint32_t;

    DreamRecord() = default;

    DreamRecord(Id id,
                DateTime created,
                std::string title,
                std::string content,
                std::set<std::string> tags,
                bool lucid,
                std::optional<std::string> dreamSign = std::nullopt)
        : m_id(id),
          m_created(created),
          m_title(std::move(title)),
          m_content(std::move(content)),
          m_tags(std::move(tags)),
          m_lucid(lucid),
          m_dreamSign(std::move(dreamSign))
    {
    }

    DreamRecord(const DreamRecord&)            = default;
    DreamRecord(DreamRecord&&) noexcept        = default;
    DreamRecord& operator=(const DreamRecord&) = default;
    DreamRecord& operator=(DreamRecord&&) noexcept = default;

    ~DreamRecord() = default;

    // ---------- Accessors ----------

    Id id() const noexcept
    {
        return m_id;
    }

    const DateTime& created() const noexcept
    {
        return m_created;
    }

    /**
     * @brief Calendar date the dream was logged on.
     *
     * All per-day, per-week and per-month grouping keys derive from this.
     */
    const Date& date() const noexcept
    {
        return m_created.date;
    }

    const std::string& title() const noexcept
    {
        return m_title;
    }

    const std::string& content() const noexcept
    {
        return m_content;
    }

    const std::set<std::string>& tags() const noexcept
    {
        return m_tags;
    }

    bool isLucid() const noexcept
    {
        return m_lucid;
    }

    const std::optional<std::string>& dreamSign() const noexcept
    {
        return m_dreamSign;
    }

private:
    Id                         m_id{0};
    DateTime                   m_created{};
    std::string                m_title;
    std::string                m_content;
    std::set<std::string>      m_tags;
    bool                       m_lucid{false};
    std::optional<std::string> m_dreamSign;  ///< Only meaningful for lucid dreams.
};

} // namespace core

#endif // LUCIDLOG_CORE_DREAM_RECORD_HPP
