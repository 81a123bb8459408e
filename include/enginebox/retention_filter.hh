#pragma once

#include <set>
#include <string>
#include <string_view>

namespace enginebox {

// Empties a sandbox directory between runs, except for the entries that the next run needs
class RetentionFilter {
    std::set<std::string, std::less<>> kept_names_;

public:
    explicit RetentionFilter(std::set<std::string, std::less<>> kept_names)
    : kept_names_{std::move(kept_names)} {}

    RetentionFilter(const RetentionFilter&) = default;
    RetentionFilter(RetentionFilter&&) noexcept = default;
    RetentionFilter& operator=(const RetentionFilter&) = default;
    RetentionFilter& operator=(RetentionFilter&&) noexcept = default;

    virtual ~RetentionFilter() = default;

    [[nodiscard]] bool keeps(std::string_view name) const { return kept_names_.contains(name); }

    [[nodiscard]] const std::set<std::string, std::less<>>& kept_names() const noexcept {
        return kept_names_;
    }

    // Removes every immediate child of @p dir whose name is not kept. A missing @p dir is
    // fine. Failures are logged and skipped, so some entries may remain.
    void clean_up(const std::string& dir) const;

protected:
    // Removes entry @p name of directory @p dirfd; regular files are unlinked, anything else
    // is removed recursively without following symlinks. Returns 0 on success, -1 on error
    // (errno is set).
    virtual int remove_entry(int dirfd, const char* name) const noexcept;
};

} // namespace enginebox
