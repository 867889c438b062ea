#include "common/io_utils.hpp"
#include <fstream>
#include <system_error>

namespace submitter {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

bool write_file_content(const filesystem::path &path, const string &content) {
    filesystem::path temp = path;
    temp += ".tmp";
    error_code ec;
    {
        ofstream fout(temp.string(), ios::binary | ios::trunc);
        if (!fout.is_open()) return false;
        fout << content;
        fout.flush();
        if (fout.fail()) {
            fout.close();
            filesystem::remove(temp, ec);
            return false;
        }
    }
    filesystem::rename(temp, path, ec);
    if (ec) {
        filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

}  // namespace submitter
