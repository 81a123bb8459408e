#pragma once

#include <enginebox/directory.hh>
#include <enginebox/file_contents.hh>

#include <climits>
#include <map>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

// Maps the relative path of every entry under @p dir to its type, permission bits and
// contents (or symlink target)
inline std::map<std::string, std::string> tree_snapshot(const std::string& dir) {
    std::map<std::string, std::string> res;
    auto walk = [&](auto& self, const std::string& rel) -> void {
        auto path = rel.empty() ? dir : dir + '/' + rel;
        Directory directory{path.c_str()};
        if (not directory.is_open()) {
            throw std::runtime_error{"opendir(" + path + ")"};
        }
        int rc = for_each_dir_component(directory, [&](dirent* ent) {
            auto entry_rel = rel.empty() ? std::string{ent->d_name} : rel + '/' + ent->d_name;
            auto entry_path = dir + '/' + entry_rel;
            struct stat st {};
            if (lstat(entry_path.c_str(), &st)) {
                throw std::runtime_error{"lstat(" + entry_path + ")"};
            }
            auto mode = std::to_string(st.st_mode & 07777);
            if (S_ISLNK(st.st_mode)) {
                char target[PATH_MAX];
                auto len = readlink(entry_path.c_str(), target, sizeof(target));
                if (len < 0) {
                    throw std::runtime_error{"readlink(" + entry_path + ")"};
                }
                res[entry_rel] = "symlink -> " + std::string(target, static_cast<size_t>(len));
            } else if (S_ISDIR(st.st_mode)) {
                res[entry_rel] = "dir " + mode;
                self(self, entry_rel);
            } else if (S_ISREG(st.st_mode)) {
                res[entry_rel] = "file " + mode + ": " + get_file_contents(entry_path);
            } else {
                res[entry_rel] = "other " + mode;
            }
        });
        if (rc) {
            throw std::runtime_error{"readdir(" + path + ")"};
        }
    };
    walk(walk, "");
    return res;
}
