#include <iostream>
#include <string>

#include <counter_store.hpp>
#include <display.hpp>
#include <errors.hpp>
#include <fingerprint.hpp>
#include <parse_number.hpp>

// locates the counter of a phrase in a counter store that was kept after a run
int main(int argc, char** argv) {
    if(argc < 3) {
        std::cerr << "usage: " << argv[0] << " [STORE] [PHRASE] [SHARD_WIDTH]" << std::endl;
        return -1;
    }

    std::string const phrase(argv[2]);

    try {
        size_t const shard_width = (argc > 3) ? parse_number<size_t>(argv[3], "shard width") : 3;
        CounterStore const store(argv[1], shard_width);
        auto const fp = fingerprint(phrase);
        std::cout << fp.hex() << "\t";

        auto const entry = store.find(fp);
        if(!entry) {
            std::cout << "not found" << std::endl;
            return 1;
        }

        auto const content = entry->content();
        std::cout << entry->count << "\t" << display_phrase(content);
        if(content != phrase) std::cout << "\t# content differs!";
        std::cout << std::endl;
        return 0;
    } catch(TopPhrasesError const& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
