#include "snapshot_store.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

FileSnapshotStore::FileSnapshotStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string FileSnapshotStore::path_for(const std::string& key) const {
    return (fs::path(directory_) / (key + ".json")).string();
}

std::optional<std::string> FileSnapshotStore::load(const std::string& key) {
    auto path = path_for(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open snapshot file " + path);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void FileSnapshotStore::save(const std::string& key, const std::string& blob) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create snapshot directory " + directory_ + ": " + ec.message());
    }

    auto path = path_for(key);
    auto tmp_path = path + ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open snapshot file " + tmp_path);
        }
        out << blob;
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed writing snapshot file " + tmp_path);
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace snapshot file " + path + ": " + ec.message());
    }
}

std::string FileSnapshotStore::describe() const {
    return "file:" + directory_;
}

class RedisSnapshotStore::Impl {
public:
    explicit Impl(const Config& config)
        : host_(config.redis_host), port_(config.redis_port) {
        sw::redis::ConnectionOptions connection_opts;
        connection_opts.host = config.redis_host;
        connection_opts.port = config.redis_port;

        if (!config.redis_password.empty()) {
            connection_opts.password = config.redis_password;
        }

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = 2;

        // Connections are opened lazily; failures surface on first load/save
        redis_ = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);
        spdlog::info("Snapshot store using Redis at {}:{}", host_, port_);
    }

    std::optional<std::string> load(const std::string& key) {
        try {
            auto value = redis_->get(key);
            if (!value) {
                return std::nullopt;
            }
            return *value;
        } catch (const sw::redis::Error& e) {
            throw std::runtime_error(std::string("Redis GET failed: ") + e.what());
        }
    }

    void save(const std::string& key, const std::string& blob) {
        try {
            redis_->set(key, blob);
        } catch (const sw::redis::Error& e) {
            throw std::runtime_error(std::string("Redis SET failed: ") + e.what());
        }
    }

    std::string describe() const {
        return "redis:" + host_ + ":" + std::to_string(port_);
    }

private:
    std::string host_;
    int port_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

RedisSnapshotStore::RedisSnapshotStore(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
RedisSnapshotStore::~RedisSnapshotStore() = default;
std::optional<std::string> RedisSnapshotStore::load(const std::string& key) { return pImpl_->load(key); }
void RedisSnapshotStore::save(const std::string& key, const std::string& blob) { pImpl_->save(key, blob); }
std::string RedisSnapshotStore::describe() const { return pImpl_->describe(); }

std::unique_ptr<SnapshotStore> make_snapshot_store(const Config& config) {
    if (config.persistence_backend == "redis") {
        return std::make_unique<RedisSnapshotStore>(config);
    }
    return std::make_unique<FileSnapshotStore>(config.persistence_dir);
}
