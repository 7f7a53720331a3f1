#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../core/DrillSession.hpp"
#include "../core/ScheduleState.hpp"
#include "../core/VocabItem.hpp"

// Item store the caller reads from and writes the classifier's output back to.
class ItemRepository {
public:
    virtual ~ItemRepository() = default;

    virtual std::optional<VocabItem> getById(const std::string& id) const = 0;
    virtual std::vector<VocabItem> listAll() const = 0;
    virtual std::vector<VocabItem> listByTag(const std::string& tag) const = 0;

    // Insert or replace by id; false if the item has no id
    virtual bool save(const VocabItem& item) = 0;
    virtual bool remove(const std::string& id) = 0;

    // Replaces schedule (and performance, if given) wholesale; false if id unknown
    virtual bool updateSchedule(const std::string& id, const ScheduleState& schedule,
        const std::optional<PerformanceCounters>& performance = std::nullopt) = 0;
};

class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    virtual std::vector<DrillSession> listAllSessions() const = 0;
    virtual void append(const DrillSession& session) = 0;
};
