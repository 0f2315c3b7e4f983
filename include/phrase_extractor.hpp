#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <istream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <iopp/file_output_stream.hpp>

#include "counter_store.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"

/// \brief The map phase: splits an input stream into phrases and counts each of them in a \ref CounterStore.
///
/// Phrases are separated by the separator character or by a line terminator (LF, CR or CRLF).
/// A line terminator at the very end of the input does not start another phrase, but a trailing separator does.
///
/// The input is read in chunks of fixed size. The bytes of the current phrase are kept in a scratch buffer no larger
/// than one chunk; longer phrases are spilled to a scratch file and moved into the store from there.
class PhraseExtractor {
private:
    static constexpr bool DEBUG = false;

    CounterStore* store_;
    std::filesystem::path spill_file_;
    char separator_;
    size_t chunk_size_;

    Fingerprinter fingerprinter_;
    std::string scratch_;
    std::unique_ptr<iopp::FileOutputStream> spill_;

    uint64_t num_phrases_;
    uint64_t num_bytes_;
    uint64_t num_spilled_;

    void spill(char const* data, size_t const num) {
        spill_->write(data, num);
        if(!*spill_) throw StorageIOError("cannot write scratch file", spill_file_);
    }

    void append(char const* data, size_t const num) {
        if(num == 0) return;

        fingerprinter_.update(data, num);
        if(!spill_) {
            if(scratch_.size() + num <= chunk_size_) {
                scratch_.append(data, num);
                return;
            }

            // the phrase outgrows the scratch buffer, continue in the scratch file
            if constexpr(DEBUG) std::cout << "spill phrase to " << spill_file_ << std::endl;
            spill_ = std::make_unique<iopp::FileOutputStream>(spill_file_);
            spill(scratch_.data(), scratch_.size());
            scratch_.clear();
        }
        spill(data, num);
    }

    void emit() {
        auto const fp = fingerprinter_.digest();
        if(spill_) {
            spill_->flush();
            if(!*spill_) throw StorageIOError("cannot write scratch file", spill_file_);
            spill_.reset();

            if(!store_->create_or_increment_from_file(fp, spill_file_)) {
                // the phrase was counted, its scratch file is not needed
                std::error_code ec;
                std::filesystem::remove(spill_file_, ec);
                if(ec) throw StorageIOError("cannot remove scratch file", spill_file_, ec);
            }
            ++num_spilled_;
        } else {
            store_->create_or_increment(fp, scratch_);
            scratch_.clear();
        }
        ++num_phrases_;
    }

public:
    /// \brief Polled once per chunk; if it returns \c true, extraction stops with an \ref InterruptedError.
    std::function<bool()> interrupted;

    PhraseExtractor(CounterStore& store, std::filesystem::path spill_file, char const separator = '|', size_t const chunk_size = 8192)
        : store_(&store),
          spill_file_(std::move(spill_file)),
          separator_(separator),
          chunk_size_(chunk_size),
          num_phrases_(0),
          num_bytes_(0),
          num_spilled_(0) {

        if(chunk_size_ == 0) throw InvalidArgumentError("chunk size must be positive");
        scratch_.reserve(chunk_size_);
    }

    PhraseExtractor(PhraseExtractor const&) = delete;
    PhraseExtractor& operator=(PhraseExtractor const&) = delete;

    char separator() const { return separator_; }
    size_t chunk_size() const { return chunk_size_; }

    uint64_t num_phrases() const { return num_phrases_; }
    uint64_t num_bytes() const { return num_bytes_; }
    uint64_t num_spilled() const { return num_spilled_; }

    void extract(std::istream& in) {
        auto chunk = std::make_unique<char[]>(chunk_size_);

        bool open = false; // whether a phrase has begun that has not been emitted yet
        bool after_cr = false;
        while(true) {
            if(interrupted && interrupted()) throw InterruptedError("interrupted while extracting phrases");

            in.read(chunk.get(), chunk_size_);
            auto const num = size_t(in.gcount());
            if(in.bad()) throw StorageIOError("cannot read input stream");
            if(num == 0) break;
            num_bytes_ += num;

            size_t start = 0;
            for(size_t i = 0; i < num; i++) {
                char const c = chunk[i];
                if(c == '\n' && after_cr) {
                    // second half of "\r\n"
                    after_cr = false;
                    start = i + 1;
                    continue;
                }

                after_cr = (c == '\r');
                if(c == separator_ || c == '\n' || c == '\r') {
                    append(chunk.get() + start, i - start);
                    emit();
                    open = (c == separator_);
                    start = i + 1;
                }
            }

            if(start < num) {
                append(chunk.get() + start, num - start);
                open = true;
            }
        }

        if(open) emit();
    }
};
