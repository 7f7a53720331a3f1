#include "FileRepository.hpp"
#include "Storage.hpp"
#include <algorithm>
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>

FileRepository::FileRepository(const std::string& dir, std::vector<unsigned char> k)
    : dataDir(dir.empty() ? "." : dir), key(std::move(k))
{
    spdlog::info("FileRepository initialized at '{}'", dataDir);
}

FileRepository::~FileRepository() {
    lock();
}

void FileRepository::lock() {
    std::scoped_lock guard(mutex);
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
        key.clear();
        spdlog::debug("FileRepository key cleared");
    }
}

bool FileRepository::isLocked() const {
    std::scoped_lock guard(mutex);
    return key.empty();
}

bool FileRepository::open() {
    std::vector<VocabItem> loadedItems;
    std::vector<DrillSession> loadedSessions;

    if (!Storage::loadItems(loadedItems, itemFile(), key)) return false;
    if (!Storage::loadSessions(loadedSessions, sessionFile(), key)) return false;

    std::scoped_lock guard(mutex);
    items = std::move(loadedItems);
    sessions = std::move(loadedSessions);
    return true;
}

bool FileRepository::flush() const {
    std::scoped_lock guard(mutex);
    const bool itemsOk = Storage::saveItems(items, itemFile(), key);
    const bool sessionsOk = Storage::saveSessions(sessions, sessionFile(), key);
    return itemsOk && sessionsOk;
}

std::optional<VocabItem> FileRepository::getById(const std::string& id) const {
    std::scoped_lock guard(mutex);
    auto it = std::find_if(items.begin(), items.end(),
        [&](const VocabItem& v) { return v.id == id; });
    if (it == items.end()) return std::nullopt;
    return *it;
}

std::vector<VocabItem> FileRepository::listAll() const {
    std::scoped_lock guard(mutex);
    return items;
}

std::vector<VocabItem> FileRepository::listByTag(const std::string& tag) const {
    std::scoped_lock guard(mutex);
    std::vector<VocabItem> out;
    for (const auto& v : items) {
        if (v.hasTag(tag)) out.push_back(v);
    }
    return out;
}

bool FileRepository::save(const VocabItem& item) {
    if (item.id.empty()) {
        spdlog::error("Refusing to save item '{}' without an id", item.term);
        return false;
    }
    std::scoped_lock guard(mutex);
    auto it = std::find_if(items.begin(), items.end(),
        [&](const VocabItem& v) { return v.id == item.id; });
    if (it != items.end()) {
        *it = item;
        spdlog::debug("Replaced item {}", item.id);
    }
    else {
        items.push_back(item);
        spdlog::debug("Inserted item {}", item.id);
    }
    return true;
}

bool FileRepository::remove(const std::string& id) {
    std::scoped_lock guard(mutex);
    auto it = std::find_if(items.begin(), items.end(),
        [&](const VocabItem& v) { return v.id == id; });
    if (it == items.end()) return false;
    items.erase(it);
    spdlog::info("Removed item {}", id);
    return true;
}

bool FileRepository::updateSchedule(const std::string& id, const ScheduleState& schedule,
    const std::optional<PerformanceCounters>& performance) {
    std::scoped_lock guard(mutex);
    auto it = std::find_if(items.begin(), items.end(),
        [&](const VocabItem& v) { return v.id == id; });
    if (it == items.end()) {
        spdlog::warn("updateSchedule: unknown item {}", id);
        return false;
    }

    it->schedule = schedule;
    if (performance) it->performance = performance;
    if (schedule.last_reviewed_at) it->updated_at = *schedule.last_reviewed_at;
    return true;
}

std::vector<DrillSession> FileRepository::listAllSessions() const {
    std::scoped_lock guard(mutex);
    return sessions;
}

void FileRepository::append(const DrillSession& session) {
    std::scoped_lock guard(mutex);
    sessions.push_back(session);
    spdlog::debug("Appended session {}", session.id);
}
