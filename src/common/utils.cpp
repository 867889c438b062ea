#include "common/utils.hpp"
#include <pwd.h>
#include <stdlib.h>
#include <unistd.h>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result || !*result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

void unset_env(const string &key) {
    unsetenv(key.c_str());
}

string truncate_message(const string &message, size_t limit) {
    if (message.size() <= limit) return message;
    return message.substr(0, limit) + "...";
}

filesystem::path home_directory() {
    string home = get_env("HOME", "");
    if (!home.empty()) return home;
    if (struct passwd *pw = getpwuid(getuid()))
        return pw->pw_dir;
    return filesystem::current_path();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
