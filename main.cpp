#include <cstdlib>       // EXIT_SUCCESS, EXIT_FAILURE
#include <exception>     // std::exception
#include <iostream>      // std::cout, std::cerr
#include <string>        // std::stoi
#include <vector>

#include "lineards/linked_deque.hpp"
#include "lineards/logging.hpp"
#include "lineards/positional_list.hpp"

using lineards::LinkedDeque;
using lineards::LogLevel;
using lineards::PositionalList;
using lineards::log_message;

// lineards_demo [int...]
// Loads the given integers (10 20 when none are given) with add_last, puts 5 in
// front, then removes the last element and shows the list before and after.
int main(int argc, char* argv[]) {
    try {
        std::vector<int> values;
        for (int i = 1; i < argc; ++i) {
            values.push_back(std::stoi(argv[i]));
        }
        if (values.empty()) {
            values = {10, 20};
        }
        log_message(LogLevel::Info, "loading {} elements", values.size());

        PositionalList<int> list;
        for (int v : values) {
            list.add_last(v);
        }
        list.add_first(5);
        std::cout << list.repr() << " size=" << list.size() << "\n";

        int removed = list.erase(*list.last());
        std::cout << "removed " << removed << ": " << list.repr() << "\n";

        // drain what is left through a deque, back to front
        LinkedDeque<int> deque;
        for (int v : list) {
            deque.insert_first(v);
        }
        std::cout << "reversed:";
        while (!deque.is_empty()) {
            std::cout << ' ' << deque.delete_first();
        }
        std::cout << "\n";

        log_message(LogLevel::Info, "done");
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
