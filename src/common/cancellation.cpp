#include "judgecell/common/cancellation.hpp"
#include <signal.h>

namespace judgecell {
using namespace std;

cancel_token::cancel_token()
    : flag(make_shared<atomic<bool>>(false)) {}

void cancel_token::cancel() const noexcept {
    flag->store(true);
}

bool cancel_token::is_cancelled() const noexcept {
    return flag->load();
}

static cancel_token signal_token;

static void stop_handler(int /* signum */) {
    // 只做原子写入，日志留给评测线程
    signal_token.cancel();
}

void cancel_on_signals(const cancel_token &token) {
    signal_token = token;
    signal(SIGINT, stop_handler);
    signal(SIGTERM, stop_handler);
}

}  // namespace judgecell
