#pragma once

#include <optional>
#include <string>

namespace enginebox {

// Makes @p sandbox_dir a fresh copy of @p cache_path (or an empty directory if there is no
// cache path). Does nothing if !cache_changed, the current contents are trusted then.
// Throws std::runtime_error on any failure, the directory is in an unspecified state then.
void sync_cache(
    const std::string& sandbox_dir, const std::optional<std::string>& cache_path,
    bool cache_changed);

} // namespace enginebox
