#include "enginebox/errmsg.hh"
#include "enginebox/file_manip.hh"
#include "enginebox/logger.hh"
#include "enginebox/macros/throw.hh"
#include "enginebox/temporary_directory.hh"

#include <cstdlib>
#include <utility>

TemporaryDirectory::TemporaryDirectory(std::string templ) : path_{std::move(templ)} {
    if (mkdtemp(path_.data()) == nullptr) {
        THROW("mkdtemp(\"", path_, "\")", errmsg());
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() and remove_r(path_)) {
        errlog("Failed to remove temporary directory ", path_, errmsg());
    }
}
