#pragma once

#include <nodule/result.hpp>
#include <nodule/dependency.hpp>

#include <map>
#include <optional>
#include <string>

namespace nodule {

// Resolution receipt: the version that was actually fetched and verified
struct LockEntry {
    std::string version;
    std::string resolved_url;
    std::string integrity;
    std::optional<DependencyMap> dependencies;

    bool operator==(const LockEntry& o) const;
    bool operator!=(const LockEntry& o) const { return !(*this == o); }
};

// dep-lock.json: { "<name>": { version, resolved_url, integrity,
// dependencies? }, ... }
class LockFile {
public:
    // Absent file yields an empty lock; malformed content is a Lockfile error
    static Result<LockFile> load(const std::string& path);
    static Result<LockFile> parse(const std::string& json_text,
                                  const std::string& origin = "");

    // Pretty JSON, keys sorted, written via a temporary file and rename.
    // Failures are Persistence errors.
    Status save(const std::string& path) const;
    std::string dump() const;

    // nullptr if absent
    const LockEntry* find(const std::string& name) const;

    // Insert or overwrite
    void upsert(const std::string& name, LockEntry entry);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::map<std::string, LockEntry>& entries() const { return entries_; }

    bool operator==(const LockFile& o) const { return entries_ == o.entries_; }
    bool operator!=(const LockFile& o) const { return !(*this == o); }

private:
    std::map<std::string, LockEntry> entries_;
};

} // namespace nodule
