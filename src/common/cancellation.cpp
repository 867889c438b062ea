#include "common/cancellation.hpp"

namespace submitter {
using namespace std;

void cancellation_token::cancel() {
    {
        lock_guard<mutex> lock(mut);
        flag = true;
    }
    cond.notify_all();
}

bool cancellation_token::cancelled() const {
    return flag;
}

bool cancellation_token::wait_for(chrono::milliseconds duration) const {
    unique_lock<mutex> lock(mut);
    return !cond.wait_for(lock, duration, [this] { return flag.load(); });
}

}  // namespace submitter
