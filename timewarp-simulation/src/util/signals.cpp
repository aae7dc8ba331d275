#include "util/signals.hpp"

#include "util/error.hpp"

#include <map>
#include <utility>

namespace {
std::map<int, Signals::Handler>& handlerMap() {
    static std::map<int, Signals::Handler> handlers;
    return handlers;
}

void dispatch(int signum) {
    auto it = handlerMap().find(signum);
    if (it != handlerMap().end() && it->second) {
        it->second(signum);
    }
}

bool install(int signum, void (*fn)(int), const char* what) {
    struct sigaction sa {};
    sa.sa_handler = fn;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(signum, &sa, nullptr) == -1) {
        logErrno(what);
        return false;
    }
    return true;
}
} // namespace

namespace Signals {

bool setHandler(int signum, Handler handler) {
    // Register before installing so a signal arriving right away finds it.
    handlerMap()[signum] = std::move(handler);
    return install(signum, dispatch, "sigaction failed");
}

bool ignore(int signum) {
    return install(signum, SIG_IGN, "sigaction SIG_IGN failed");
}

bool restoreDefault(int signum) {
    bool ok = install(signum, SIG_DFL, "sigaction SIG_DFL failed");
    handlerMap().erase(signum);
    return ok;
}

} // namespace Signals
