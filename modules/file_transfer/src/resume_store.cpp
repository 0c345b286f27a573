#include "resume_store.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
constexpr const char* kCheckpointSuffix = ".checkpoint";

bool valid_transfer_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                        (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

bool sync_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}
} // namespace

ResumeStore::ResumeStore(std::string receive_dir)
    : m_dir((fs::path(receive_dir) / ".nodelink").string()) {}

std::string ResumeStore::path_for(const std::string& transfer_id) const {
    return (fs::path(m_dir) / (transfer_id + kCheckpointSuffix)).string();
}

bool ResumeStore::save(const ResumeCheckpoint& checkpoint) const {
    if (!valid_transfer_id(checkpoint.transfer_id)) {
        LOG_WARN("FT: Refusing checkpoint for bad transfer id '" + checkpoint.transfer_id + "'");
        return false;
    }

    json ranges = json::array();
    for (const auto& r : checkpoint.ranges) {
        ranges.push_back({{"offset", r.offset}, {"length", r.length}, {"contiguous", r.contiguous}});
    }
    json doc = {
        {"transfer_id", checkpoint.transfer_id},
        {"file_name", checkpoint.file_name},
        {"total_size", checkpoint.total_size},
        {"hash", checkpoint.hash},
        {"ranges", ranges},
        {"part_path", checkpoint.part_path},
    };

    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) {
        LOG_WARN("FT: Cannot create checkpoint directory " + m_dir + ": " + ec.message());
        return false;
    }

    const std::string target = path_for(checkpoint.transfer_id);
    const std::string tmp_file = target + ".tmp";
    {
        std::ofstream out(tmp_file, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            LOG_WARN("FT: Cannot create checkpoint file: " + tmp_file);
            return false;
        }
        out << doc.dump();
        if (!out) {
            LOG_WARN("FT: Failed writing checkpoint " + tmp_file);
            return false;
        }
    }
    if (!sync_file(tmp_file)) {
        LOG_WARN("FT: fsync failed for " + tmp_file + ": " + strerror(errno));
    }
    if (std::rename(tmp_file.c_str(), target.c_str()) != 0) {
        LOG_WARN("FT: Cannot rename checkpoint into place: " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

std::optional<ResumeCheckpoint> ResumeStore::load_file(const std::string& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    try {
        json doc;
        in >> doc;

        ResumeCheckpoint cp;
        cp.transfer_id = doc.at("transfer_id").get<std::string>();
        cp.file_name = doc.at("file_name").get<std::string>();
        cp.total_size = doc.at("total_size").get<uint64_t>();
        cp.hash = doc.at("hash").get<std::string>();
        cp.part_path = doc.at("part_path").get<std::string>();
        for (const auto& r : doc.at("ranges")) {
            CheckpointRange range;
            range.offset = r.at("offset").get<uint64_t>();
            range.length = r.at("length").get<uint64_t>();
            range.contiguous = std::min(r.at("contiguous").get<uint64_t>(), range.length);
            cp.ranges.push_back(range);
        }
        if (cp.ranges.empty()) {
            LOG_WARN("FT: Checkpoint without ranges ignored: " + path);
            return std::nullopt;
        }
        return cp;
    } catch (const json::exception& e) {
        LOG_WARN("FT: Corrupt checkpoint " + path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<ResumeCheckpoint> ResumeStore::load(const std::string& transfer_id) const {
    if (!valid_transfer_id(transfer_id)) {
        return std::nullopt;
    }
    auto cp = load_file(path_for(transfer_id));
    if (cp && cp->transfer_id != transfer_id) {
        LOG_WARN("FT: Checkpoint id mismatch for " + transfer_id);
        return std::nullopt;
    }
    return cp;
}

void ResumeStore::remove(const std::string& transfer_id) const {
    if (!valid_transfer_id(transfer_id)) {
        return;
    }
    std::error_code ec;
    fs::remove(path_for(transfer_id), ec);
    if (ec) {
        LOG_WARN("FT: Cannot remove checkpoint for " + transfer_id + ": " + ec.message());
    }
}

std::vector<ResumeCheckpoint> ResumeStore::load_all() const {
    std::vector<ResumeCheckpoint> out;
    std::error_code ec;
    if (!fs::is_directory(m_dir, ec)) {
        return out;
    }
    for (const auto& entry : fs::directory_iterator(m_dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kCheckpointSuffix) {
            continue;
        }
        if (auto cp = load_file(entry.path().string())) {
            out.push_back(std::move(*cp));
        }
    }
    return out;
}
