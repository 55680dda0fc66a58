#include <cstdlib>
#include <polyexec/errmsg.hh>
#include <polyexec/file_manip.hh>
#include <polyexec/logger.hh>
#include <polyexec/macros/throw.hh>
#include <polyexec/string_transform.hh>
#include <polyexec/temporary_directory.hh>

TemporaryDirectory::TemporaryDirectory(std::string templ) {
    while (templ.size() > 1 and templ.back() == '/') {
        templ.pop_back();
    }
    if (not has_prefix(templ, "/") or not has_suffix(templ, "XXXXXX")) {
        THROW("invalid temporary directory template: ", templ);
    }

    // Created with mode 0700
    if (mkdtemp(templ.data()) == nullptr) {
        THROW("mkdtemp('", templ, "')", errmsg());
    }
    path_ = std::move(templ);
    path_ += '/';
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() and remove_r(path_) == -1) {
        errlog("Error: remove_r('", path_, "')", errmsg());
    }
}
