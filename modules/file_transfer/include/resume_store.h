#ifndef RESUME_STORE_H
#define RESUME_STORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CheckpointRange {
    uint64_t offset = 0;
    uint64_t length = 0;
    uint64_t contiguous = 0;    // bytes durable from offset
};

// Receiver-side progress for one transfer, persisted so a resume survives a restart.
struct ResumeCheckpoint {
    std::string transfer_id;
    std::string file_name;
    uint64_t total_size = 0;
    std::string hash;
    std::vector<CheckpointRange> ranges;
    std::string part_path;
};

/**
 * Checkpoints live under <receive_dir>/.nodelink/<transfer_id>.checkpoint as
 * JSON. save() writes <file>.tmp, syncs it and renames over the old one.
 */
class ResumeStore {
public:
    explicit ResumeStore(std::string receive_dir);

    const std::string& directory() const { return m_dir; }
    std::string path_for(const std::string& transfer_id) const;

    bool save(const ResumeCheckpoint& checkpoint) const;
    std::optional<ResumeCheckpoint> load(const std::string& transfer_id) const;
    void remove(const std::string& transfer_id) const;
    std::vector<ResumeCheckpoint> load_all() const;

private:
    std::optional<ResumeCheckpoint> load_file(const std::string& path) const;

    std::string m_dir;
};

#endif // RESUME_STORE_H
