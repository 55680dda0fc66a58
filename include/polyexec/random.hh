#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <string_view>

// Fills @p bytes bytes of @p dest with random values from getrandom(2)
void fill_randomly(void* dest, size_t bytes);

// UniformRandomBitGenerator drawing from getrandom(2) in batches
class GetrandomEngine {
    static constexpr size_t BATCH = 32;
    std::array<uint64_t, BATCH> batch_{};
    size_t next_ = BATCH;

public:
    using result_type = uint64_t;

    static constexpr result_type min() noexcept { return 0; }

    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    result_type operator()() {
        if (next_ == BATCH) {
            fill_randomly(batch_.data(), sizeof(batch_));
            next_ = 0;
        }
        return batch_[next_++];
    }
};

// One engine per thread, no locking needed
inline GetrandomEngine& random_engine() {
    static thread_local GetrandomEngine engine;
    return engine;
}

// Returns a random number from [a, b]
template <class T>
T get_random(T a, T b) {
    return std::uniform_int_distribution<T>{a, b}(random_engine());
}

// Returns a string of @p len characters drawn uniformly from @p alphabet
std::string random_string(size_t len, std::string_view alphabet);
