#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>

#include <oocmd.hpp>
#include <pm/malloc_counter.hpp>
#include <pm/result.hpp>

#include <display.hpp>
#include <errors.hpp>
#include <parse_number.hpp>
#include <top_phrases.hpp>

using namespace oocmd;

static volatile std::sig_atomic_t interrupt_signal = 0;

extern "C" void on_signal(int const sig) {
    interrupt_signal = sig;
}

struct TopPhrases : public ConfigObject {
    std::string separator = "|";
    std::string work_dir = "out";
    std::string run_id;
    uint64_t chunk_size = 8192;
    uint64_t shard_width = 3;
    bool keep = false;
    bool keep_on_failure = false;
    bool stats = false;

    TopPhrases() : ConfigObject("top-phrases", "Reports the most frequent phrases of a file using bounded memory") {
        param('s', "separator", separator, "The phrase separator character; lines always separate phrases.");
        param('w', "work-dir", work_dir, "The directory to create the working area in.");
        param('r', "run-id", run_id, "The name of the working area (default: process id).");
        param('c', "chunk-size", chunk_size, "The number of bytes read from the input at a time.");
        param('x', "shard-width", shard_width, "The number of hex digits of a fingerprint per directory level.");
        param("keep", keep, "Keep the working area after the run.");
        param("keep-on-failure", keep_on_failure, "Keep the working area if the run fails.");
        param("stats", stats, "Print statistics about the run.");
    }

    int run(Application const& app) {
        if(app.args().size() < 2) {
            app.print_usage(*this);
            return -1;
        }

        try {
            auto const limit = parse_number<int64_t>(app.args()[1], "limit");
            if(separator.length() != 1) {
                throw InvalidArgumentError("the separator must be exactly one character");
            }

            top_phrases::Config config;
            config.separator = separator[0];
            config.chunk_size = chunk_size;
            config.shard_width = shard_width;
            config.work_dir = work_dir;
            config.run_id = run_id;
            config.keep = keep;
            config.keep_on_failure = keep_on_failure;
            config.interrupted = [](){ return interrupt_signal != 0; };

            std::signal(SIGINT, on_signal);
            std::signal(SIGTERM, on_signal);

            pm::Result result;
            pm::MallocCounter m;
            m.start();
            auto const top = top_phrases::find_top_phrases(app.args()[0], limit, config, result);
            m.stop();
            result.add("mem_peak", m.peak());

            // a signal may arrive after the last poll
            if(interrupt_signal != 0) throw InterruptedError("interrupted");

            for(auto const& phrase : top) {
                std::cout << "[" << phrase.count << "] " << display_phrase(phrase.text) << " (" << phrase.location.string() << ")" << std::endl;
            }

            if(stats) {
                result.sort();
                std::cout << result.str() << std::endl;
            }
            return 0;
        } catch(InterruptedError const&) {
            std::cerr << "interrupted" << std::endl;
            return 128 + interrupt_signal;
        } catch(TopPhrasesError const& e) {
            std::cerr << "error: " << e.what() << std::endl;
            return 1;
        }
    }
};

int main(int argc, char** argv) {
    TopPhrases c;
    return Application::run(c, argc, argv);
}
