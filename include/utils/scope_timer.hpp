#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_SCOPE_TIMER_HPP
#define HEATFEM_SCOPE_TIMER_HPP

#include <iostream>
#include <chrono>
#include <string>

namespace utils{
    // Reports the lifetime of a scope, e.g. the assembly or the solve phase
    class ScopeTimer{

    private:
        std::string name;
        bool enabled;
        std::chrono::steady_clock::time_point start;

    public:
        explicit ScopeTimer(const std::string& timer_name, bool print = true)
            : name(timer_name), enabled(print), start(std::chrono::steady_clock::now()) {}

        ScopeTimer(const ScopeTimer&) = delete;
        ScopeTimer& operator=(const ScopeTimer&) = delete;

        // elapsed time so far, in milliseconds
        double elapsed_ms() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(now - start).count();
        }

        ~ScopeTimer() {
            if (enabled) {
                std::cout << name << ": " << elapsed_ms() << " ms" << std::endl;
            }
        }
    };
}

#endif
