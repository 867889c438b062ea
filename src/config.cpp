#include "config.hpp"

namespace submitter {
using namespace std;

string JUDGE_BASE_URL = "https://leetcode.com";
int SUBMIT_RETRIES = 5;
int CHECK_RETRIES = 10;
chrono::milliseconds MIN_REQUEST_DELAY(2000);  // 2s
chrono::milliseconds MAX_REQUEST_DELAY(60000);  // 60s

}  // namespace submitter
