#include "document_store.h"

#include <cctype>
#include <cstdio>

#include "../utils/file_utils.h"
#include "../utils/hash.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace hm {

namespace {

constexpr usize kMaxSafeNameLength = 50;

bool isSafeChar(unsigned char c) {
    return std::isalnum(c) || c == ' ' || c == '-' || c == '_' || c == '.';
}

} // namespace

DocumentStore::DocumentStore(const Path& root) : m_root(root), m_tempDir(root / ".tmp") {}

bool DocumentStore::isPdf(const ByteBuffer& data) {
    return data.size() >= 4 && data[0] == '%' && data[1] == 'P' && data[2] == 'D' &&
           data[3] == 'F';
}

std::string DocumentStore::makeFilenameSafe(std::string_view filename) {
    std::string stem = Path(std::string(filename)).stem().string();

    std::string result;
    result.reserve(stem.size());
    for (char ch : stem) {
        char mapped = isSafeChar(static_cast<unsigned char>(ch)) ? ch : '_';
        if (mapped == '_' && !result.empty() && result.back() == '_') {
            continue;
        }
        result += mapped;
    }

    if (result.size() > kMaxSafeNameLength) {
        result.resize(kMaxSafeNameLength);
    }

    auto isTrimmed = [](char c) { return c == ' ' || c == '_' || c == '-' || c == '.'; };
    usize start = 0;
    while (start < result.size() && isTrimmed(result[start])) {
        ++start;
    }
    usize end = result.size();
    while (end > start && isTrimmed(result[end - 1])) {
        --end;
    }
    return result.substr(start, end - start);
}

std::string DocumentStore::profilePrefix(i64 profileId) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "profile_%04lld", static_cast<long long>(profileId));
    return buffer;
}

bool DocumentStore::belongsToProfile(i64 profileId, const Path& path) const {
    std::string name = path.filename().string();
    std::string prefix = profilePrefix(profileId);
    if (file::getExtension(path) != "pdf") {
        return false;
    }
    // profile_0007.pdf or profile_0007_<name>.pdf, never profile_00071.pdf
    return str::startsWith(name, prefix + "_") || str::toLower(name) == prefix + ".pdf";
}

std::vector<Path> DocumentStore::findProfilePdfs(i64 profileId) const {
    std::vector<Path> result;
    for (const auto& path : file::listFiles(m_root, "pdf")) {
        if (belongsToProfile(profileId, path)) {
            result.push_back(path);
        }
    }
    return result;
}

PdfSaveResult DocumentStore::saveProfilePdf(i64 profileId,
                                            const ByteBuffer& data,
                                            const std::string& originalFilename) {
    PdfSaveResult result;

    if (data.empty()) {
        result.error = "PDF data is empty";
        return result;
    }
    if (!isPdf(data)) {
        result.error = "Not a PDF document";
        return result;
    }

    if (!file::createDirectories(m_root) || !file::createDirectories(m_tempDir)) {
        result.error = "Cannot create document directory " + m_root.string();
        return result;
    }

    auto existing = findProfilePdfs(profileId);

    std::string targetName;
    std::string safe = originalFilename.empty() ? std::string() : makeFilenameSafe(originalFilename);
    if (!safe.empty()) {
        targetName = profilePrefix(profileId) + "_" + safe + ".pdf";
    } else if (!existing.empty()) {
        targetName = existing.front().filename().string();
    } else {
        targetName = profilePrefix(profileId) + ".pdf";
    }

    Path target = m_root / targetName;

    if (file::isFile(target) && hash::computeFile(target) == hash::computeBuffer(data)) {
        log::infof("DocumentStore", "PDF unchanged, skipping write: %s", targetName.c_str());
        result.success = true;
        result.unchanged = true;
        result.path = target;
        return result;
    }

    Path tmpPath = m_tempDir / (targetName + ".part");
    if (!file::writeBinary(tmpPath, data)) {
        result.error = "Failed to write " + tmpPath.string();
        return result;
    }

    auto written = file::getFileSize(tmpPath);
    if (!written || *written != data.size()) {
        (void)file::remove(tmpPath);
        result.error = "File size mismatch after writing " + targetName;
        return result;
    }

    if (!file::move(tmpPath, target)) {
        (void)file::remove(tmpPath);
        result.error = "Failed to move PDF into place: " + target.string();
        return result;
    }

    for (const auto& old : existing) {
        if (old != target) {
            if (file::remove(old)) {
                log::infof("DocumentStore", "Deleted old PDF: %s",
                           old.filename().string().c_str());
            } else {
                log::warningf("DocumentStore", "Could not delete old PDF %s",
                              old.filename().string().c_str());
            }
        }
    }

    log::infof("DocumentStore", "Saved %s (%zu bytes)", targetName.c_str(), data.size());
    result.success = true;
    result.path = target;
    return result;
}

std::optional<ByteBuffer> DocumentStore::loadProfilePdf(i64 profileId,
                                                        const std::optional<Path>& path) const {
    if (path && !path->empty() && file::isFile(*path)) {
        return file::readBinary(*path);
    }

    auto pdfs = findProfilePdfs(profileId);
    if (pdfs.empty()) {
        return std::nullopt;
    }
    return file::readBinary(pdfs.front());
}

int DocumentStore::deleteProfilePdfs(i64 profileId) {
    int count = 0;
    for (const auto& pdf : findProfilePdfs(profileId)) {
        if (file::remove(pdf)) {
            log::infof("DocumentStore", "PDF deleted: %s", pdf.filename().string().c_str());
            ++count;
        }
    }
    return count;
}

bool DocumentStore::deleteProfilePdf(i64 profileId, const Path& path) {
    if (!belongsToProfile(profileId, path)) {
        log::warningf("DocumentStore", "File %s does not belong to profile %lld",
                      path.filename().string().c_str(), static_cast<long long>(profileId));
        return false;
    }
    return file::remove(path);
}

int DocumentStore::cleanupOrphanedTempFiles() {
    int count = 0;
    for (const auto& path : file::listFiles(m_tempDir)) {
        if (file::remove(path)) {
            ++count;
        }
    }
    if (count > 0) {
        log::infof("DocumentStore", "Cleaned up %d orphaned temp file(s)", count);
    }
    return count;
}

} // namespace hm
