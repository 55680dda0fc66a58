#include <cerrno>
#include <polyexec/errmsg.hh>
#include <polyexec/macros/throw.hh>
#include <polyexec/random.hh>
#include <sys/random.h>

void fill_randomly(void* dest, size_t bytes) {
    auto* ptr = static_cast<char*>(dest);
    while (bytes > 0) {
        ssize_t len = getrandom(ptr, bytes, 0);
        if (len >= 0) {
            bytes -= len;
            ptr += len;
        } else if (errno != EINTR) {
            THROW("getrandom()", errmsg());
        }
    }
}

std::string random_string(size_t len, std::string_view alphabet) {
    std::string res(len, '\0');
    for (auto& c : res) {
        c = alphabet[get_random<size_t>(0, alphabet.size() - 1)];
    }
    return res;
}
