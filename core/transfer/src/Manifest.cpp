#include "Manifest.h"
#include "FileUtils.h"
#include "SHA256.h"

#include <algorithm>
#include <set>

namespace Chunkwise {

namespace {

const char* const MANIFEST_KEYS[] = {
    "original_filename", "original_size", "original_hash", "chunk_size", "hash_algorithm",
    "priority", "priority_name", "compression_enabled", "encryption_enabled", "chunks"
};

const char* const CHUNK_KEYS[] = { "index", "name", "size", "hash", "priority" };

template<size_t N>
bool isKnownKey(const std::string& key, const char* const (&known)[N]) {
    for (const char* k : known) {
        if (key == k) return true;
    }
    return false;
}

template<size_t N>
Json::Value collectExtra(const Json::Value& object, const char* const (&known)[N]) {
    Json::Value extra(Json::objectValue);
    for (const auto& key : object.getMemberNames()) {
        if (!isKnownKey(key, known)) {
            extra[key] = object[key];
        }
    }
    return extra;
}

Error malformed(const std::string& message) {
    return Error{ErrorCode::MalformedManifest, message};
}

bool readUInt(const Json::Value& object, const char* key, uint64_t& out) {
    const Json::Value& v = object[key];
    if (!v.isUInt64()) return false;
    out = v.asUInt64();
    return true;
}

bool readString(const Json::Value& object, const char* key, std::string& out) {
    const Json::Value& v = object[key];
    if (!v.isString()) return false;
    out = v.asString();
    return true;
}

/// A missing priority takes the fallback; range is checked by validate()
bool readPriority(const Json::Value& object, int fallback, int& out) {
    if (!object.isMember("priority")) {
        out = fallback;
        return true;
    }
    const Json::Value& v = object["priority"];
    if (!v.isInt()) return false;
    out = v.asInt();
    return true;
}

bool readFlag(const Json::Value& object, const char* key, bool& out) {
    if (!object.isMember(key)) return true;
    const Json::Value& v = object[key];
    if (!v.isBool()) return false;
    out = v.asBool();
    return true;
}

} // namespace

Json::Value Manifest::toJson() const {
    Json::Value root = extra.isObject() ? extra : Json::Value(Json::objectValue);
    root["original_filename"] = originalFilename;
    root["original_size"] = static_cast<Json::UInt64>(originalSize);
    root["original_hash"] = originalHash;
    root["chunk_size"] = static_cast<Json::UInt64>(chunkSize);
    root["hash_algorithm"] = hashAlgorithm;
    root["priority"] = priority;
    root["priority_name"] = priorityName;
    root["compression_enabled"] = compressionEnabled;
    root["encryption_enabled"] = encryptionEnabled;

    Json::Value list(Json::arrayValue);
    for (const auto& chunk : chunks) {
        Json::Value entry = chunk.extra.isObject() ? chunk.extra : Json::Value(Json::objectValue);
        entry["index"] = static_cast<Json::UInt64>(chunk.index);
        entry["name"] = chunk.name;
        entry["size"] = static_cast<Json::UInt64>(chunk.size);
        entry["hash"] = chunk.hash;
        entry["priority"] = chunk.priority;
        list.append(entry);
    }
    root["chunks"] = list;
    return root;
}

std::string Manifest::serialize() const {
    return FileUtils::toJsonString(toJson());
}

Result<Manifest> Manifest::fromJson(const Json::Value& root, int defaultPriority) {
    if (!root.isObject()) {
        return malformed("Manifest is not a JSON object");
    }

    Manifest m;
    if (!readString(root, "original_filename", m.originalFilename)) {
        return malformed("original_filename missing or not a string");
    }
    if (!readUInt(root, "original_size", m.originalSize)) {
        return malformed("original_size missing or not a non-negative integer");
    }
    if (!readString(root, "original_hash", m.originalHash)) {
        return malformed("original_hash missing or not a string");
    }
    if (!readUInt(root, "chunk_size", m.chunkSize)) {
        return malformed("chunk_size missing or not a non-negative integer");
    }
    if (root.isMember("hash_algorithm") && !readString(root, "hash_algorithm", m.hashAlgorithm)) {
        return malformed("hash_algorithm is not a string");
    }

    if (!readPriority(root, defaultPriority, m.priority)) {
        return malformed("priority is not an integer");
    }
    if (!root.isMember("priority_name")) {
        m.priorityName = defaultPriorityName(m.priority);
    } else if (!readString(root, "priority_name", m.priorityName)) {
        return malformed("priority_name is not a string");
    }
    if (!readFlag(root, "compression_enabled", m.compressionEnabled)) {
        return malformed("compression_enabled is not a boolean");
    }
    if (!readFlag(root, "encryption_enabled", m.encryptionEnabled)) {
        return malformed("encryption_enabled is not a boolean");
    }

    const Json::Value& list = root["chunks"];
    if (!list.isArray()) {
        return malformed("chunks missing or not a list");
    }
    m.chunks.reserve(list.size());
    for (Json::ArrayIndex i = 0; i < list.size(); ++i) {
        const Json::Value& entry = list[i];
        std::string where = "chunks[" + std::to_string(i) + "]";
        if (!entry.isObject()) {
            return malformed(where + " is not an object");
        }

        ChunkDescriptor chunk;
        if (!readUInt(entry, "index", chunk.index)) {
            return malformed(where + ".index missing or invalid");
        }
        if (!readString(entry, "name", chunk.name)) {
            return malformed(where + ".name missing or invalid");
        }
        if (!readUInt(entry, "size", chunk.size)) {
            return malformed(where + ".size missing or invalid");
        }
        if (!readString(entry, "hash", chunk.hash)) {
            return malformed(where + ".hash missing or invalid");
        }
        if (!readPriority(entry, m.priority, chunk.priority)) {
            return malformed(where + ".priority is not an integer");
        }
        chunk.extra = collectExtra(entry, CHUNK_KEYS);
        m.chunks.push_back(std::move(chunk));
    }

    m.extra = collectExtra(root, MANIFEST_KEYS);
    return m;
}

Result<Manifest> Manifest::deserialize(const std::string& text, int defaultPriority) {
    auto parsed = FileUtils::parseJson(text);
    if (!parsed) {
        return malformed(parsed.error().message);
    }
    return fromJson(*parsed, defaultPriority);
}

Result<Manifest> Manifest::loadFromFile(const std::string& path, int defaultPriority) {
    auto root = FileUtils::readJson(path);
    if (!root) {
        if (root.error().code == ErrorCode::FileReadError) {
            return root.error();
        }
        return malformed(path + ": " + root.error().message);
    }
    return fromJson(*root, defaultPriority);
}

Result<void> Manifest::saveToFile(const std::string& path) const {
    return FileUtils::writeJsonAtomic(path, toJson());
}

Result<void> Manifest::validate(int defaultPriority) {
    if (hashAlgorithm != HASH_ALGORITHM) {
        return Err(ErrorCode::MalformedManifest, "Unsupported hash algorithm '" + hashAlgorithm + "'");
    }
    if (chunkSize == 0) {
        return Err(ErrorCode::MalformedManifest, "chunk_size must be positive");
    }
    if (!SHA256::isHexDigest(originalHash)) {
        return Err(ErrorCode::MalformedManifest, "original_hash is not a 64-character hex digest");
    }

    if (!isValidPriority(priority)) {
        priority = defaultPriority;
        priorityName = defaultPriorityName(priority);
    }

    std::set<std::string> names;
    std::vector<uint64_t> indices;
    indices.reserve(chunks.size());
    for (auto& chunk : chunks) {
        if (!isValidChunkName(chunk.name)) {
            return Err(ErrorCode::MalformedManifest, "Illegal chunk name '" + chunk.name + "'");
        }
        if (!names.insert(chunk.name).second) {
            return Err(ErrorCode::MalformedManifest, "Duplicate chunk name '" + chunk.name + "'");
        }
        if (!SHA256::isHexDigest(chunk.hash)) {
            return Err(ErrorCode::MalformedManifest, "Malformed hash for chunk '" + chunk.name + "'");
        }
        if (!isValidPriority(chunk.priority)) {
            chunk.priority = defaultPriority;
        }
        indices.push_back(chunk.index);
    }

    std::sort(indices.begin(), indices.end());
    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] != i) {
            return Err(ErrorCode::MalformedManifest,
                       "Chunk indices are not contiguous from 0 (expected " + std::to_string(i) +
                       ", found " + std::to_string(indices[i]) + ")");
        }
    }
    return Ok();
}

const ChunkDescriptor* Manifest::findChunk(const std::string& name) const {
    for (const auto& chunk : chunks) {
        if (chunk.name == name) {
            return &chunk;
        }
    }
    return nullptr;
}

std::vector<ChunkDescriptor> Manifest::chunksByIndex() const {
    std::vector<ChunkDescriptor> ordered = chunks;
    std::sort(ordered.begin(), ordered.end(),
              [](const ChunkDescriptor& a, const ChunkDescriptor& b) { return a.index < b.index; });
    return ordered;
}

std::string Manifest::chunkName(uint64_t index) {
    return "echunk_" + std::to_string(index) + ".bin";
}

bool Manifest::isValidChunkName(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name == UNIT_NAME) {
        return false;
    }
    return name.find_first_of("|/\\\r\n") == std::string::npos;
}

std::string Manifest::defaultPriorityName(int priority) {
    switch (priority) {
        case 1: return "CRITICAL";
        case 2: return "HIGH";
        case 3: return "NORMAL";
        case 4: return "LOW";
        default: return "NORMAL";
    }
}

} // namespace Chunkwise
