#include "FileUtils.h"
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

namespace Chunkwise {

Result<void> FileUtils::ensureDirectory(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return Ok();
    }
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        return Err(ErrorCode::FileWriteError,
                   "Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
    return Ok();
}

Result<std::vector<uint8_t>> FileUtils::readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Err<std::vector<uint8_t>>(ErrorCode::FileReadError, "Cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Err<std::vector<uint8_t>>(ErrorCode::FileReadError, "Read error on " + path.string());
    }
    return data;
}

Result<void> FileUtils::writeFileAtomic(const std::filesystem::path& path,
                                        const std::vector<uint8_t>& data) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Err(ErrorCode::FileWriteError, "Cannot create " + tmp.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            removeQuietly(tmp);
            return Err(ErrorCode::FileWriteError, "Write failed on " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        removeQuietly(tmp);
        return Err(ErrorCode::FileWriteError,
                   "Cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<Json::Value> FileUtils::readJson(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Err<Json::Value>(ErrorCode::FileReadError, "Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseJson(buffer.str());
}

Result<Json::Value> FileUtils::parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Err<Json::Value>(ErrorCode::MalformedManifest, "JSON parse error: " + errors);
    }
    return root;
}

std::string FileUtils::toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

Result<void> FileUtils::writeJsonAtomic(const std::filesystem::path& path, const Json::Value& value) {
    std::string text = toJsonString(value) + "\n";
    return writeFileAtomic(path, std::vector<uint8_t>(text.begin(), text.end()));
}

void FileUtils::removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace Chunkwise
