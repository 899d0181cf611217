#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace hm {

struct PdfSaveResult {
    bool success = false;
    bool unchanged = false; // identical file already stored, nothing written
    Path path;
    std::string error;
};

/// Profile PDF storage.
/// Files live directly under the root as profile_NNNN.pdf or
/// profile_NNNN_<name>.pdf (NNNN = zero padded profile id).
/// Writes use temp+verify+rename; one PDF per profile is kept.
class DocumentStore {
  public:
    explicit DocumentStore(const Path& root);

    const Path& root() const { return m_root; }

    /// True when the data starts with the %PDF signature
    static bool isPdf(const ByteBuffer& data);

    /// Base name usable inside a stored file name: directory and extension
    /// dropped, characters other than alphanumerics and " -_." replaced by '_',
    /// runs of '_' collapsed, cut to 50 characters, trimmed of " _-.".
    static std::string makeFilenameSafe(std::string_view filename);

    /// "profile_0007"
    static std::string profilePrefix(i64 profileId);

    /// Store the PDF of a profile. An identical file already at the target
    /// path is left alone; other PDFs of the profile are removed after a write.
    PdfSaveResult saveProfilePdf(i64 profileId,
                                 const ByteBuffer& data,
                                 const std::string& originalFilename = "");

    /// Load from an explicit path when it exists, else the first PDF of the profile
    std::optional<ByteBuffer> loadProfilePdf(i64 profileId,
                                             const std::optional<Path>& path = std::nullopt) const;

    /// PDFs of the profile, sorted by name
    std::vector<Path> findProfilePdfs(i64 profileId) const;

    /// Remove every PDF of the profile. Returns the number removed.
    int deleteProfilePdfs(i64 profileId);

    /// Remove one file, only if it belongs to the profile
    bool deleteProfilePdf(i64 profileId, const Path& path);

    /// Clean up temp files left by an interrupted write. Returns count removed.
    int cleanupOrphanedTempFiles();

  private:
    bool belongsToProfile(i64 profileId, const Path& path) const;

    Path m_root;
    Path m_tempDir;
};

} // namespace hm
