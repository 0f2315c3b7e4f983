#pragma once

#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

#include "errors.hpp"

/// \brief Scoped ownership of the on-disk directory of a single aggregation run.
///
/// A directory left behind by an earlier run under the same name is reported and removed on acquisition.
/// On destruction, the directory is removed unless it is to be kept, either always or only when the scope is left
/// by an exception. Removal on destruction is best-effort: failures are logged, never thrown.
class WorkingArea {
private:
    std::filesystem::path root_;
    bool keep_;
    bool keep_on_failure_;
    bool stale_;
    bool released_;
    int uncaught_;

public:
    WorkingArea(std::filesystem::path root, bool const keep = false, bool const keep_on_failure = false)
        : root_(std::move(root)),
          keep_(keep),
          keep_on_failure_(keep_on_failure),
          stale_(false),
          released_(false),
          uncaught_(std::uncaught_exceptions()) {

        std::error_code ec;
        auto const status = std::filesystem::symlink_status(root_, ec);
        if(status.type() != std::filesystem::file_type::not_found) {
            if(ec) throw StorageIOError("cannot stat working area", root_, ec);

            stale_ = true;
            std::cerr << "WARNING: unclean working area found at " << root_ << ", removing it" << std::endl;
            std::filesystem::remove_all(root_, ec);
            if(ec) throw StorageIOError("cannot remove stale working area", root_, ec);
        }

        std::filesystem::create_directories(root_, ec);
        if(ec) throw StorageIOError("cannot create working area", root_, ec);
    }

    WorkingArea(WorkingArea const&) = delete;
    WorkingArea& operator=(WorkingArea const&) = delete;

    ~WorkingArea() {
        if(released_) return;

        bool const failed = std::uncaught_exceptions() > uncaught_;
        if(keep_ || (failed && keep_on_failure_)) {
            std::cerr << "keeping working area " << root_ << std::endl;
            return;
        }

        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if(ec) std::cerr << "WARNING: cannot remove working area " << root_ << " (" << ec.message() << ")" << std::endl;
    }

    std::filesystem::path const& root() const { return root_; }
    std::filesystem::path counters_root() const { return root_ / "counters"; }
    std::filesystem::path spill_file() const { return root_ / "phrase.tmp"; }

    // whether an earlier run had left this area behind
    bool was_stale() const { return stale_; }

    bool kept() const { return keep_; }

    void keep() { keep_ = true; }

    /// \brief Removes the working area now, unless it is to be kept.
    void release() {
        if(released_) return;
        released_ = true;
        if(keep_) {
            std::cerr << "keeping working area " << root_ << std::endl;
            return;
        }

        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if(ec) throw StorageIOError("cannot remove working area", root_, ec);
    }
};
