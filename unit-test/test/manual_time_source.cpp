#include "test/manual_time_source.hpp"

namespace submitter::mock {
using namespace std;

time_source::time_point manual_time_source::now() const {
    return current;
}

bool manual_time_source::sleep_for(chrono::milliseconds duration, const cancellation_token &token) {
    if (token.cancelled()) return false;
    if (duration.count() > 0) {
        sleeps.push_back(duration);
        current += duration;
    }
    return true;
}

void manual_time_source::advance(chrono::milliseconds duration) {
    current += duration;
}

chrono::milliseconds manual_time_source::total_slept() const {
    chrono::milliseconds total(0);
    for (auto &d : sleeps) total += d;
    return total;
}

}  // namespace submitter::mock
