/**
 * @file DecisionRepositoryFs.cpp
 * @brief Implementation of the DecisionRepositoryFs class.
 */
#include "infrastructure/DecisionRepositoryFs.hpp"
#include "infrastructure/FrontmatterCodec.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace dnagraph::infrastructure {

namespace {

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool IsRecordFile(const fs::directory_entry& entry) {
    if (!entry.is_regular_file()) return false;
    std::string name = entry.path().filename().string();
    return name.rfind("DEC-", 0) == 0 && entry.path().extension() == ".md";
}

} // namespace

DecisionRepositoryFs::DecisionRepositoryFs(const std::string& projectRoot)
    : m_root(projectRoot) {}

std::string DecisionRepositoryFs::partitionPath(domain::Scope scope) const {
    return (fs::path(m_root) / (scope == domain::Scope::Constitution ? "constitution" : "dna")).string();
}

bool DecisionRepositoryFs::hasPartition(domain::Scope scope) {
    std::error_code ec;
    return fs::is_directory(partitionPath(scope), ec);
}

std::vector<domain::DecisionRecord> DecisionRepositoryFs::fetchPartition(domain::Scope scope) {
    std::vector<domain::DecisionRecord> records;
    if (!hasPartition(scope)) return records;

    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(partitionPath(scope), ec)) {
        if (IsRecordFile(entry)) files.push_back(entry.path());
    }
    if (ec) {
        std::cerr << "[DecisionRepositoryFs] Cannot list " << partitionPath(scope) << ": " << ec.message() << std::endl;
        return records;
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        auto text = ReadFile(path);
        if (!text) {
            std::cerr << "[DecisionRepositoryFs] Cannot read " << path << std::endl;
            continue;
        }
        auto doc = FrontmatterCodec::Parse(*text);
        if (!doc) {
            std::cerr << "[DecisionRepositoryFs] No frontmatter in " << path << ", skipping" << std::endl;
            continue;
        }

        domain::DecisionRecord record;
        record.fields = std::move(doc->fields);
        record.body = std::move(doc->body);
        record.source = path.string();
        if (record.fields.contains("id") && record.fields["id"].is_string()) {
            m_knownPaths[record.fields["id"].get<std::string>()] = record.source;
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::string DecisionRepositoryFs::resolvePath(domain::Scope scope, const std::string& id) const {
    auto it = m_knownPaths.find(id);
    if (it != m_knownPaths.end()) return it->second;
    return (fs::path(partitionPath(scope)) / (id + ".md")).string();
}

std::optional<std::string> DecisionRepositoryFs::occupantOf(domain::Scope scope, const std::string& id) {
    std::string path = resolvePath(scope, id);
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    auto text = ReadFile(path);
    if (!text) return std::string();
    auto doc = FrontmatterCodec::Parse(*text);
    if (doc && doc->fields.contains("id") && doc->fields["id"].is_string()) {
        return doc->fields["id"].get<std::string>();
    }
    return std::string();
}

bool DecisionRepositoryFs::saveRecord(domain::Scope scope, const std::string& id,
                                      const nlohmann::json& fields, const std::string& body) {
    std::string path = resolvePath(scope, id);
    if (!m_persistence.saveText(path, FrontmatterCodec::Serialize(fields, body))) {
        std::cerr << "[DecisionRepositoryFs] Failed to save " << id << " to " << path << std::endl;
        return false;
    }
    m_knownPaths[id] = path;
    return true;
}

std::optional<domain::DecisionRecord> DecisionRepositoryFs::readRecord(domain::Scope scope, const std::string& id) {
    std::string path = resolvePath(scope, id);
    auto text = ReadFile(path);
    if (!text) return std::nullopt;

    auto doc = FrontmatterCodec::Parse(*text);
    if (!doc) {
        std::cerr << "[DecisionRepositoryFs] Could not parse frontmatter from " << path << std::endl;
        return std::nullopt;
    }
    domain::DecisionRecord record;
    record.fields = std::move(doc->fields);
    record.body = std::move(doc->body);
    record.source = path;
    return record;
}

bool DecisionRepositoryFs::writeDocument(domain::Scope scope, const std::string& name, const std::string& content) {
    return m_persistence.saveText((fs::path(partitionPath(scope)) / name).string(), content);
}

std::optional<std::string> DecisionRepositoryFs::readRootDocument(const std::string& name) {
    return ReadFile(fs::path(m_root) / name);
}

bool DecisionRepositoryFs::writeRootDocument(const std::string& name, const std::string& content) {
    return m_persistence.saveText((fs::path(m_root) / name).string(), content);
}

} // namespace dnagraph::infrastructure
