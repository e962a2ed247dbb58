#pragma once

#include <cassert>
#include <cstddef>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace Testing {
    // True only if `fn` throws E, any other exception escapes to fail the test
    template<typename E, typename Fn>
    bool expectThrows(Fn &&fn) {
        try {
            fn();
        } catch (const E &) {
            return true;
        }
        return false;
    }

    template<typename E, typename Fn>
    bool expectThrows(Fn &&fn, std::string_view fragment) {
        try {
            fn();
        } catch (const E &ex) {
            return std::string_view{ex.what()}.find(fragment) != std::string_view::npos;
        }
        return false;
    }

    class Suite {
        private:
            std::string name;
            std::size_t blocks {0};

        public:
            explicit Suite(std::string name): name {std::move(name)} {
                std::println("{} test...\n", this->name);
            }

            void pass(std::string_view block) {
                std::println("\033[32m{}. PASS -> {}\033[0m", ++blocks, block);
            }

            int done() const {
                std::println("\n{}: {} blocks passed", name, blocks);
                return 0;
            }
    };
}
