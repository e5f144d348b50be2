#include "common/io_utils.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace executor {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

/**
 * @brief 计算从 i 开始的 UTF-8 字符的长度
 * @return 字符的字节数，若 i 开始的字节序列不合法，返回 0
 */
static size_t utf8_sequence_length(const string &string, size_t i) {
    unsigned c = (unsigned char)string[i];
    size_t n;
    // 第二个字节的范围，排除超长编码、U+D800 到 U+DFFF 和 U+10FFFF 之后的码点
    unsigned low = 0x80, high = 0xBF;
    if (c <= 0x7F)
        return 1;
    else if (c >= 0xC2 && c <= 0xDF)
        n = 1;
    else if (c == 0xE0)
        n = 2, low = 0xA0;
    else if (c == 0xED)
        n = 2, high = 0x9F;
    else if (c >= 0xE1 && c <= 0xEF)
        n = 2;
    else if (c == 0xF0)
        n = 3, low = 0x90;
    else if (c >= 0xF1 && c <= 0xF3)
        n = 3;
    else if (c == 0xF4)
        n = 3, high = 0x8F;
    else
        return 0;  // 0x80-0xC1, 0xF5-0xFF 不能作为首字节

    if (i + n >= string.length())
        return 0;
    unsigned second = (unsigned char)string[i + 1];
    if (second < low || second > high)
        return 0;
    for (size_t j = 2; j <= n; ++j) {  // 其余字节都是 10bbbbbb
        if (((unsigned char)string[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

string decode_output(const string &bytes) {
    if (utf8_check_is_valid(bytes)) return bytes;

    string text;
    text.reserve(bytes.size());
    for (size_t i = 0; i < bytes.length();) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            text += "\xEF\xBF\xBD";
            ++i;
        } else {
            text.append(bytes, i, len);
            i += len;
        }
    }
    return text;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

vector<string> list_directory(const fs::path &dir) {
    vector<string> names;
    for (auto &entry : fs::directory_iterator(dir))
        names.push_back(entry.path().filename().string());
    sort(names.begin(), names.end());
    return names;
}

bool is_elf_binary(const fs::path &path) {
    if (!fs::is_regular_file(path)) return false;
    ifstream fin(path.string(), ios::binary);
    char magic[4] = {0};
    fin.read(magic, sizeof(magic));
    return fin.gcount() == sizeof(magic) &&
           magic[0] == 0x7f && magic[1] == 'E' && magic[2] == 'L' && magic[3] == 'F';
}

}  // namespace executor
