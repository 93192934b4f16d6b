#include <nodule/lockfile.hpp>
#include <nodule/log.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace nodule {

bool LockEntry::operator==(const LockEntry& o) const {
    return version == o.version && resolved_url == o.resolved_url &&
           integrity == o.integrity && dependencies == o.dependencies;
}

static Result<std::string> required_string(const json& obj, const char* key,
                                           const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return NoduleError{NoduleError::Lockfile,
            where + ": missing or non-string '" + key + "'"};
    }
    return Result<std::string>::ok(it->get<std::string>());
}

Result<LockFile> LockFile::parse(const std::string& json_text,
                                 const std::string& origin) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::exception& e) {
        return NoduleError{NoduleError::Lockfile,
            std::string("lock file is not valid JSON: ") + e.what(),
            "delete it to re-resolve every dependency", origin, 0};
    }

    if (!doc.is_object()) {
        return NoduleError{NoduleError::Lockfile,
            "lock file must be a JSON object keyed by package name",
            "", origin, 0};
    }

    LockFile lf;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& name = it.key();
        const json& obj = it.value();
        std::string where = "lock entry '" + name + "'";
        if (!obj.is_object()) {
            return NoduleError{NoduleError::Lockfile,
                where + " is not an object", "", origin, 0};
        }

        LockEntry entry;
        auto version = required_string(obj, "version", where);
        if (version.is_err()) return std::move(version).error();
        entry.version = std::move(version).value();

        auto url = required_string(obj, "resolved_url", where);
        if (url.is_err()) return std::move(url).error();
        entry.resolved_url = std::move(url).value();

        auto integrity = obj.find("integrity");
        if (integrity != obj.end() && integrity->is_string()) {
            entry.integrity = integrity->get<std::string>();
        } else if (integrity != obj.end() && !integrity->is_null()) {
            return NoduleError{NoduleError::Lockfile,
                where + ": 'integrity' must be a string", "", origin, 0};
        }

        auto deps = obj.find("dependencies");
        if (deps != obj.end() && !deps->is_null()) {
            auto parsed = dependency_map_from_json(*deps, where,
                                                   NoduleError::Lockfile);
            if (parsed.is_err()) return std::move(parsed).error();
            entry.dependencies = std::move(parsed).value();
        }

        lf.entries_.emplace(name, std::move(entry));
    }

    return Result<LockFile>::ok(std::move(lf));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log::debug("no lock file at %s, starting empty", path.c_str());
        return Result<LockFile>::ok(LockFile{});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return NoduleError{NoduleError::Lockfile,
            "cannot open lock file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return LockFile::parse(ss.str(), path);
}

std::string LockFile::dump() const {
    json doc = json::object();
    for (const auto& [name, entry] : entries_) {
        json obj = json::object();
        obj["version"] = entry.version;
        obj["resolved_url"] = entry.resolved_url;
        obj["integrity"] = entry.integrity;
        if (entry.dependencies) {
            obj["dependencies"] = dependency_map_to_json(*entry.dependencies);
        }
        doc[name] = std::move(obj);
    }
    return doc.dump(2) + "\n";
}

Status LockFile::save(const std::string& path) const {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return NoduleError{NoduleError::Persistence,
                "cannot write lock file: " + tmp};
        }
        out << dump();
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return NoduleError{NoduleError::Persistence,
                "short write to lock file: " + tmp};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return NoduleError{NoduleError::Persistence,
            "cannot replace " + path + ": " + ec.message()};
    }
    return ok_status();
}

const LockEntry* LockFile::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

void LockFile::upsert(const std::string& name, LockEntry entry) {
    entries_[name] = std::move(entry);
}

} // namespace nodule
