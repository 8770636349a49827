#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "MemoryStateStore.hpp"

/*
  Write-through encrypted store. Rows live in a MemoryStateStore; every
  mutation first writes the encrypted file with the new row staged in, and
  only then updates memory. If the disk write fails PersistenceError is
  thrown and memory is untouched, so a failed commit is never visible.

  Reads never touch the disk and never wait on a disk write.
*/
class FileStateStore : public StateStore {
public:
    // Throws PersistenceError if the file exists but cannot be decrypted or parsed.
    FileStateStore(const std::string& filename, const std::vector<unsigned char>& key);
    ~FileStateStore() override;

    std::optional<SchedulingState> load(const std::string& userId,
        const std::string& flashcardId) const override;
    std::vector<SchedulingState> loadDue(const std::string& userId, std::time_t now) const override;
    std::vector<SchedulingState> loadAll(const std::string& userId) const override;

    bool compareAndSwap(std::uint64_t expectedVersion, SchedulingState& next) override;
    bool insert(SchedulingState& initial) override;
    bool remove(const std::string& userId, const std::string& flashcardId) override;

    const std::string& path() const { return filename; }

private:
    std::string filename;
    std::vector<unsigned char> key;

    MemoryStateStore rows;
    std::mutex write_mutex;   // serializes commit + disk write

    bool flushWith(const SchedulingState& staged);
    bool flushWithout(const std::string& userId, const std::string& flashcardId);
    bool write(const std::vector<SchedulingState>& all);
};
