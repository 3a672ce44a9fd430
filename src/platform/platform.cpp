#include "platform.hpp"
#include <ctime>
#include <random>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path make_temp_dir(const std::string& prefix) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    for (int i = 0; i < 100; i++) {
        fs::path p = temp_dir() / (prefix + "_" + std::to_string(getpid()) +
                                   "_" + std::to_string(dist(rng)));
        if (fs::create_directories(p)) return p;
    }
    throw std::runtime_error("Could not create a temp directory for " + prefix);
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
