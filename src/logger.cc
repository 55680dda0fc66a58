#include <cerrno>
#include <ctime>
#include <polyexec/errmsg.hh>
#include <polyexec/logger.hh>
#include <polyexec/macros/throw.hh>

Logger::Logger(const std::string& filename) : f_(fopen(filename.c_str(), "ae")) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    opened_ = true;
}

void Logger::open(const std::string& filename) {
    FILE* f = fopen(filename.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (logger_.label()) {
            char date[32] = "unknown time";
            time_t now = time(nullptr);
            struct tm tm_buff = {};
            if (localtime_r(&now, &tm_buff) != nullptr) {
                (void)strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buff);
            }
            (void)fprintf(
                logger_.f_, "[ %s ] %.*s\n", date, static_cast<int>(buff_.size()), buff_.data()
            );
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", static_cast<int>(buff_.size()), buff_.data());
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
