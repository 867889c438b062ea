#include "common/time_source.hpp"

namespace submitter {
using namespace std;

time_source::~time_source() {}

time_source::time_point real_time_source::now() const {
    return chrono::steady_clock::now();
}

bool real_time_source::sleep_for(chrono::milliseconds duration, const cancellation_token &token) {
    if (token.cancelled()) return false;
    if (duration.count() <= 0) return true;
    return token.wait_for(duration);
}

}  // namespace submitter
