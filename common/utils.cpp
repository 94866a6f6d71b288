#include "utils.H"

#include <ctime>

namespace tws {

    uint64_t nanotime() {
        struct timespec ts;
        clock_gettime(CLOCK_MONOTONIC, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + ts.tv_nsec;
    }

    uint64_t walltime() {
        struct timespec ts;
        clock_gettime(CLOCK_REALTIME, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + ts.tv_nsec;
    }

    std::string format_walltime(uint64_t ns) {
        time_t secs = static_cast<time_t>(ns / 1000000000ULL);
        struct tm tm;
        localtime_r(&secs, &tm);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y%m%d %H:%M:%S", &tm);
        return buf;
    }

} // namespace tws
