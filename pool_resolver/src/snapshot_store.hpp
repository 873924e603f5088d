#pragma once
#include "config.hpp"
#include <memory>
#include <optional>
#include <string>

// Key/value blob store holding cache snapshots.
// Implementations throw std::runtime_error on I/O failure.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual std::optional<std::string> load(const std::string& key) = 0;
    virtual void save(const std::string& key, const std::string& blob) = 0;
    virtual std::string describe() const = 0;
};

// <dir>/<key>.json, replaced atomically through a temp file
class FileSnapshotStore : public SnapshotStore {
public:
    explicit FileSnapshotStore(std::string directory);

    std::optional<std::string> load(const std::string& key) override;
    void save(const std::string& key, const std::string& blob) override;
    std::string describe() const override;

    std::string path_for(const std::string& key) const;

private:
    std::string directory_;
};

class RedisSnapshotStore : public SnapshotStore {
public:
    explicit RedisSnapshotStore(const Config& config);
    ~RedisSnapshotStore() override;

    std::optional<std::string> load(const std::string& key) override;
    void save(const std::string& key, const std::string& blob) override;
    std::string describe() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Picks the backend named by config.persistence_backend
std::unique_ptr<SnapshotStore> make_snapshot_store(const Config& config);
