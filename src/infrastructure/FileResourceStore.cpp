/**
 * @file FileResourceStore.cpp
 * @brief Implementation of FileResourceStore.
 */

#include "infrastructure/FileResourceStore.hpp"
#include "infrastructure/ResourceJson.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace chartkeeper::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

FileResourceStore::FileResourceStore(std::string stateDir)
    : m_stateDir(std::move(stateDir)) {
    if (!fs::exists(m_stateDir)) fs::create_directories(m_stateDir);
}

std::string FileResourceStore::documentPath(domain::ResourceKind kind, const domain::ResourceKey& key) const {
    return (fs::path(m_stateDir) / domain::KindPathSegment(kind) / key.ns / (key.name + ".json")).string();
}

std::optional<domain::ManagedResource> FileResourceStore::get(domain::ResourceKind kind,
                                                              const domain::ResourceKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    fs::path p = documentPath(kind, key);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(p);
        json j;
        f >> j;
        auto resource = j.get<domain::ManagedResource>();
        if (resource.kind != kind || resource.key != key) {
            std::cerr << "[FileResourceStore] Document " << p << " does not describe "
                      << domain::KindToString(kind) << "/" << key.toString() << std::endl;
            return std::nullopt;
        }
        return resource;
    } catch (const std::exception& e) {
        std::cerr << "[FileResourceStore] Error reading " << p << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool FileResourceStore::updateStatus(domain::ResourceKind kind, const domain::ResourceKey& key,
                                     const domain::ResourceStatus& status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = documentPath(kind, key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const json::exception& e) {
        throw domain::StorageIOError("unable to read resource document '" + path + "': " + e.what());
    }
    j["status"] = status;
    writeDocument(path, j.dump(4));
    return true;
}

std::vector<domain::ResourceKey> FileResourceStore::list(domain::ResourceKind kind) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::ResourceKey> keys;
    fs::path base = fs::path(m_stateDir) / domain::KindPathSegment(kind);
    std::error_code ec;
    if (!fs::is_directory(base, ec)) return keys;

    for (const auto& nsEntry : fs::directory_iterator(base)) {
        if (!nsEntry.is_directory()) continue;
        for (const auto& entry : fs::directory_iterator(nsEntry.path())) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                keys.push_back({nsEntry.path().filename().string(), entry.path().stem().string()});
            }
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void FileResourceStore::save(const domain::ManagedResource& resource) {
    std::lock_guard<std::mutex> lock(m_mutex);
    json j = resource;
    writeDocument(documentPath(resource.kind, resource.key), j.dump(4));
}

bool FileResourceStore::remove(domain::ResourceKind kind, const domain::ResourceKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    bool removed = fs::remove(documentPath(kind, key), ec);
    if (ec) {
        throw domain::StorageIOError("unable to remove resource document: " + ec.message());
    }
    return removed;
}

void FileResourceStore::writeDocument(const std::string& path, const std::string& content) {
    static std::atomic<unsigned long> counter{0};
    fs::path finalPath = path;
    fs::path tempPath = finalPath;
    tempPath += ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(counter++);

    std::error_code ec;
    fs::create_directories(finalPath.parent_path(), ec);
    if (ec) {
        throw domain::StorageIOError("unable to create '" + finalPath.parent_path().string() + "': " + ec.message());
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw domain::StorageIOError("unable to open temp file '" + tempPath.string() + "'");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageIOError("write failed for '" + tempPath.string() + "'");
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tempPath, rmEc);
        throw domain::StorageIOError("rename to '" + finalPath.string() + "' failed: " + ec.message());
    }
}

} // namespace chartkeeper::infrastructure
