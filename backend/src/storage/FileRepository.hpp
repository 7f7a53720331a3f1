#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "Repository.hpp"

// In-memory item/session collections backed by two encrypted files.
// open() loads them, flush() writes them back. Writes for one repository are serialized.
class FileRepository : public ItemRepository, public SessionRepository {
public:
    FileRepository(const std::string& dataDir, std::vector<unsigned char> key);
    ~FileRepository();

    FileRepository(const FileRepository&) = delete;
    FileRepository& operator=(const FileRepository&) = delete;

    bool open();
    bool flush() const;

    // Wipes this repository's copy of the key; open/flush fail afterwards
    void lock();
    bool isLocked() const;

    std::optional<VocabItem> getById(const std::string& id) const override;
    std::vector<VocabItem> listAll() const override;
    std::vector<VocabItem> listByTag(const std::string& tag) const override;
    bool save(const VocabItem& item) override;
    bool remove(const std::string& id) override;
    bool updateSchedule(const std::string& id, const ScheduleState& schedule,
        const std::optional<PerformanceCounters>& performance = std::nullopt) override;

    std::vector<DrillSession> listAllSessions() const override;
    void append(const DrillSession& session) override;

    std::string itemFile() const { return dataDir + "/items.dat"; }
    std::string sessionFile() const { return dataDir + "/sessions.dat"; }

private:
    std::string dataDir;
    std::vector<unsigned char> key;

    mutable std::mutex mutex;
    std::vector<VocabItem> items;
    std::vector<DrillSession> sessions;
};
