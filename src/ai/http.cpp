#include <shellsage/ai/http.hpp>
#include <shellsage/ai/json_text.hpp>
#include <curl/curl.h>

namespace shellsage::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse http_post_json(const std::string& url, const std::vector<std::string>& headers,
                            const std::string& body, int timeout_seconds) {
    HttpResponse r;
    CURL* curl = curl_easy_init();
    if (!curl) { r.error = "curl initialization failed"; return r; }
    struct curl_slist* list = nullptr;
    list = curl_slist_append(list, "Content-Type: application/json");
    for (auto &h : headers) list = curl_slist_append(list, h.c_str());
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &r.status);
    curl_slist_free_all(list);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) r.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res));
    return r;
}

std::string describe_http_failure(const HttpResponse& r) {
    if (!r.transport_ok()) return r.error;
    std::string msg = "HTTP " + std::to_string(r.status);
    // {"error":{"message":"..."}} (OpenAI, Anthropic, Gemini) or {"error":"..."} (Ollama)
    auto detail = extract_json_string(r.body, "message");
    if (!detail) detail = extract_json_string(r.body, "error");
    if (detail && !detail->empty()) msg += ": " + *detail;
    return msg;
}

} // namespace shellsage::ai
