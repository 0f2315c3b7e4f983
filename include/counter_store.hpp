#pragma once

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <iopp/file_input_stream.hpp>
#include <iopp/file_output_stream.hpp>

#include "errors.hpp"
#include "fingerprint.hpp"

/// \brief A persisted counter: the fingerprint of a phrase, how often it occurred, and the file holding its first occurrence.
struct CounterEntry {
    Fingerprint fingerprint;
    uint64_t count;
    std::filesystem::path file;

    // reads the first-occurrence bytes of the phrase
    std::string content() const {
        std::error_code ec;
        auto const size = std::filesystem::file_size(file, ec);
        if(ec) throw StorageIOError("cannot stat phrase file", file, ec);

        std::string s(size, '\0');
        if(size > 0) {
            iopp::FileInputStream in(file);
            in.read(s.data(), size);
            if(!in || size_t(in.gcount()) != size) throw StorageIOError("cannot read phrase file", file);
        }
        return s;
    }
};

/// \brief A disk-resident map from fingerprints to counters.
///
/// The hexadecimal representation of a fingerprint is split into groups of \c shard_width characters,
/// each group naming one directory level below the store's root. The leaf directory contains exactly one file,
/// whose name is the decimal occurrence count and whose content are the bytes of the phrase's first occurrence.
/// Incrementing a counter is therefore a single rename.
///
/// Different fingerprints only share ancestor directories, so they never need coordination.
/// Increments of the same fingerprint are not synchronized; callers that map in parallel must serialize them.
class CounterStore {
private:
    static constexpr bool DEBUG = false;
    static constexpr size_t COMPARE_BLOCK_SIZE = 8192;

    std::filesystem::path root_;
    size_t shard_width_;
    uint64_t num_created_;
    uint64_t num_incremented_;

    static std::optional<uint64_t> parse_count(std::string const& name) {
        uint64_t count = 0;
        auto const* first = name.data();
        auto const* last = name.data() + name.size();
        auto const r = std::from_chars(first, last, count);
        if(r.ec != std::errc() || r.ptr != last || count == 0) return std::nullopt;
        return count;
    }

    // locates the single counter file in an existing leaf directory
    CounterEntry locate(Fingerprint const& fp, std::filesystem::path const& leaf) const {
        std::error_code ec;
        std::filesystem::directory_iterator it(leaf, ec);
        if(ec) throw StorageIOError("cannot list counter directory", leaf, ec);

        std::optional<CounterEntry> entry;
        for(std::filesystem::directory_iterator const end; it != end; it.increment(ec)) {
            if(ec) break;
            auto const count = parse_count(it->path().filename().string());
            if(entry || !count || !it->is_regular_file(ec)) {
                throw StorageIOError("corrupt counter directory", leaf);
            }
            entry = CounterEntry { fp, *count, it->path() };
        }
        if(ec) throw StorageIOError("cannot list counter directory", leaf, ec);
        if(!entry) throw StorageIOError("counter directory has no counter file", leaf);
        return *entry;
    }

    void increment(CounterEntry const& entry) {
        auto const next = entry.file.parent_path() / std::to_string(entry.count + 1);

        std::error_code ec;
        std::filesystem::rename(entry.file, next, ec);
        if(ec) throw StorageIOError("cannot increment counter", entry.file, ec);

        if constexpr(DEBUG) std::cout << "increment " << entry.fingerprint.hex() << " -> " << (entry.count + 1) << std::endl;
        ++num_incremented_;
    }

    // creates the directory path for a new counter and returns the name of its counter file
    std::filesystem::path create_leaf(std::filesystem::path const& leaf) {
        std::error_code ec;
        std::filesystem::create_directories(leaf, ec);
        if(ec) throw StorageIOError("cannot create counter directory", leaf, ec);
        ++num_created_;
        return leaf / "1";
    }

    static void throw_collision(CounterEntry const& entry) {
        throw DigestCollisionError("digest collision detected for " + entry.fingerprint.hex() + " (stored in \"" + entry.file.string() + "\")");
    }

    static uintmax_t size_of(std::filesystem::path const& file) {
        std::error_code ec;
        auto const size = std::filesystem::file_size(file, ec);
        if(ec) throw StorageIOError("cannot stat phrase file", file, ec);
        return size;
    }

    static bool same_content(std::filesystem::path const& file, std::string_view const phrase) {
        if(size_of(file) != phrase.size()) return false;

        iopp::FileInputStream in(file);
        auto block = std::make_unique<char[]>(COMPARE_BLOCK_SIZE);
        for(size_t pos = 0; pos < phrase.size();) {
            auto const num = std::min(COMPARE_BLOCK_SIZE, phrase.size() - pos);
            in.read(block.get(), num);
            if(!in) throw StorageIOError("cannot read phrase file", file);
            if(phrase.compare(pos, num, std::string_view(block.get(), num)) != 0) return false;
            pos += num;
        }
        return true;
    }

    static bool same_content(std::filesystem::path const& a, std::filesystem::path const& b) {
        auto const size = size_of(a);
        if(size != size_of(b)) return false;

        iopp::FileInputStream in_a(a);
        iopp::FileInputStream in_b(b);
        auto block_a = std::make_unique<char[]>(COMPARE_BLOCK_SIZE);
        auto block_b = std::make_unique<char[]>(COMPARE_BLOCK_SIZE);
        for(uintmax_t pos = 0; pos < size;) {
            auto const num = size_t(std::min(uintmax_t(COMPARE_BLOCK_SIZE), size - pos));
            in_a.read(block_a.get(), num);
            if(!in_a) throw StorageIOError("cannot read phrase file", a);
            in_b.read(block_b.get(), num);
            if(!in_b) throw StorageIOError("cannot read phrase file", b);
            if(!std::equal(block_a.get(), block_a.get() + num, block_b.get())) return false;
            pos += num;
        }
        return true;
    }

public:
    CounterStore(std::filesystem::path root, size_t const shard_width = 3)
        : root_(std::move(root)), shard_width_(shard_width), num_created_(0), num_incremented_(0) {

        if(shard_width_ == 0 || shard_width_ > Fingerprint::NUM_HEX_DIGITS) {
            throw InvalidArgumentError("shard width must be between 1 and " + std::to_string(Fingerprint::NUM_HEX_DIGITS));
        }
    }

    std::filesystem::path const& root() const { return root_; }
    size_t shard_width() const { return shard_width_; }

    // the number of counters created and incremented through this object
    uint64_t num_created() const { return num_created_; }
    uint64_t num_incremented() const { return num_incremented_; }

    std::filesystem::path leaf_of(Fingerprint const& fp) const {
        auto const hex = fp.hex();
        auto leaf = root_;
        for(size_t i = 0; i < hex.length(); i += shard_width_) {
            leaf /= hex.substr(i, shard_width_);
        }
        return leaf;
    }

    std::optional<CounterEntry> find(Fingerprint const& fp) const {
        auto const leaf = leaf_of(fp);

        std::error_code ec;
        auto const status = std::filesystem::status(leaf, ec);
        if(status.type() == std::filesystem::file_type::not_found) return std::nullopt;
        if(ec) throw StorageIOError("cannot stat counter directory", leaf, ec);
        if(!std::filesystem::is_directory(status)) throw StorageIOError("corrupt counter directory", leaf);

        return locate(fp, leaf);
    }

    /// \brief Counts an occurrence of the given phrase.
    ///
    /// \return \c true if the counter was created, \c false if an existing counter was incremented
    /// \throws DigestCollisionError if a different phrase is already stored under the same fingerprint
    bool create_or_increment(Fingerprint const& fp, std::string_view const phrase) {
        if(auto const entry = find(fp)) {
            if(!same_content(entry->file, phrase)) throw_collision(*entry);
            increment(*entry);
            return false;
        }

        auto const file = create_leaf(leaf_of(fp));
        {
            iopp::FileOutputStream out(file);
            out.write(phrase.data(), phrase.size());
            out.flush();
            if(!out) throw StorageIOError("cannot write phrase file", file);
        }
        if constexpr(DEBUG) std::cout << "create " << fp.hex() << std::endl;
        return true;
    }

    /// \brief Counts an occurrence of the phrase contained in the given file.
    ///
    /// If the counter is created, the file is moved into the store; otherwise it is left untouched.
    bool create_or_increment_from_file(Fingerprint const& fp, std::filesystem::path const& phrase_file) {
        if(auto const entry = find(fp)) {
            if(!same_content(entry->file, phrase_file)) throw_collision(*entry);
            increment(*entry);
            return false;
        }

        auto const file = create_leaf(leaf_of(fp));

        std::error_code ec;
        std::filesystem::rename(phrase_file, file, ec);
        if(ec) throw StorageIOError("cannot move phrase file into store", phrase_file, ec);

        if constexpr(DEBUG) std::cout << "create " << fp.hex() << " from " << phrase_file << std::endl;
        return true;
    }

    /// \brief Visits every counter in the store exactly once, in filesystem traversal order.
    template<std::invocable<CounterEntry const&> Visitor>
    void enumerate(Visitor&& visit) const {
        std::error_code ec;
        if(!std::filesystem::exists(root_, ec)) {
            if(ec) throw StorageIOError("cannot stat counter store", root_, ec);
            return;
        }

        std::filesystem::recursive_directory_iterator it(root_, ec);
        if(ec) throw StorageIOError("cannot walk counter store", root_, ec);

        for(std::filesystem::recursive_directory_iterator const end; it != end;) {
            auto const& path = it->path();
            if(!it->is_directory(ec)) {
                if(ec) throw StorageIOError("cannot stat", path, ec);

                std::string hex;
                for(auto const& part : path.parent_path().lexically_relative(root_)) {
                    hex += part.string();
                }

                auto const fp = Fingerprint::from_hex(hex);
                auto const count = parse_count(path.filename().string());
                if(!fp || !count) throw StorageIOError("corrupt counter entry", path);

                visit(CounterEntry { *fp, *count, path });
            }

            it.increment(ec);
            if(ec) throw StorageIOError("cannot walk counter store", root_, ec);
        }
    }

    /// \brief Removes the entire store from disk; does nothing if it does not exist.
    void drop_all() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if(ec) throw StorageIOError("cannot remove counter store", root_, ec);
    }
};
