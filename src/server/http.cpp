#include "server/http.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <fstream>
#include <memory>
#include "common/exceptions.hpp"

namespace executor::server {
using namespace std;

typedef unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle;

static curl_handle make_handle(const string &url) {
    curl_handle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw network_error("Unable to initialize libcurl for " + url);
    return curl;
}

string http_response::header(const string &name, const string &def) const {
    auto it = headers.find(boost::algorithm::to_lower_copy(name));
    return it == headers.end() ? def : it->second;
}

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t write_header(char *buffer, size_t size, size_t nitems, void *userdata) {
    auto &headers = *static_cast<map<string, string> *>(userdata);
    string line(buffer, size * nitems);
    size_t colon = line.find(':');
    if (colon != string::npos) {
        string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line.substr(0, colon)));
        headers[name] = boost::algorithm::trim_copy(line.substr(colon + 1));
    } else if (boost::algorithm::starts_with(line, "HTTP/")) {
        // 重定向后的新响应
        headers.clear();
    }
    return size * nitems;
}

static http_response perform(CURL *curl, const string &url, long timeout) {
    http_response response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        throw network_error("Unable to request " + url + ": " + curl_easy_strerror(res));
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

string form_encode(const form_fields &fields) {
    curl_handle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw network_error("Unable to initialize libcurl");

    string encoded;
    for (auto &[key, value] : fields) {
        char *k = curl_easy_escape(curl.get(), key.c_str(), (int)key.size());
        char *v = curl_easy_escape(curl.get(), value.c_str(), (int)value.size());
        if (!encoded.empty()) encoded += '&';
        encoded += k;
        encoded += '=';
        encoded += v;
        curl_free(k);
        curl_free(v);
    }
    return encoded;
}

http_response http_get(const string &url, long timeout) {
    auto curl = make_handle(url);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    return perform(curl.get(), url, timeout);
}

http_response http_post(const string &url, const form_fields &fields, long timeout) {
    auto curl = make_handle(url);
    string body = form_encode(fields);
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)body.size());
    return perform(curl.get(), url, timeout);
}

void download_file(const string &url, const filesystem::path &target, long timeout) {
    LOG(INFO) << "Downloading " << url << " to " << target;
    http_response response = http_get(url, timeout);
    if (response.status >= 400)
        throw network_error("Unable to download " + url + ", status code " + to_string(response.status));

    ofstream fout(target, ios::binary);
    if (!fout)
        throw internal_error("Unable to create " + target.string());
    fout << response.body;
}

}  // namespace executor::server
