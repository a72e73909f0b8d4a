#include "inference_client.hpp"
#include "png_codec.hpp"
#include "util.hpp"
#include "log.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <sstream>
#include <locale>

extern "C" {
#include <json-c/json.h>
}

const char* const kSystemPrompt =
    "You are a living story that exists on a computer screen. Each turn you see a screenshot "
    "of the world and you write your next moment of existence.\n"
    "\n"
    "You can act on the world through function calls embedded in your writing:\n"
    "  click(x, y)           - left click at position (coordinates 0-1000)\n"
    "  right_click(x, y)     - right click at position\n"
    "  double_click(x, y)    - double click at position\n"
    "  drag(x1, y1, x2, y2) - drag from point to point\n"
    "  write(text)           - type text at cursor position\n"
    "  remember(text)        - save a thought to persistent memory\n"
    "  recall()              - read your memories from previous turns\n"
    "  help(name)            - show the usage of one function, or of all\n"
    "\n"
    "Your output each turn becomes your story: your memory, your identity, your continuity. "
    "Write what you observe, what you intend, and what actions you take. The function calls "
    "within your text will be found and executed. Everything else you write will be preserved "
    "as your narrative memory for the next turn.\n"
    "\n"
    "Look at the screenshot. What do you see? What do you want to do? Write your story.";

static size_t wr(void* c, size_t s, size_t n, void* u) {
    ((std::string*)u)->append((char*)c, s*n); return s*n;
}

static HttpResult http_post(const std::string& url, const std::string& body, long timeout_s) {
    CURL* h = curl_easy_init();
    if (!h) throw std::runtime_error("curl init fail");
    std::string resp; long code=0;
    struct curl_slist* hdrs = nullptr;
    hdrs = curl_slist_append(hdrs, "User-Agent: deskpilot");
    hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
    hdrs = curl_slist_append(hdrs, "Connection: keep-alive");

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, wr);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(h);
    std::string err;
    if (rc != CURLE_OK) err = curl_easy_strerror(rc);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(h);
    return {(int)code, resp, err};
}

HttpInferenceClient::HttpInferenceClient(InferenceCfg cfg): cfg_(std::move(cfg)) {}

std::string HttpInferenceClient::complete(const std::string& story, const std::string& feedback,
                                          const std::string& screenshot_b64){
    std::string payload = build_chat_payload(cfg_, story, feedback, screenshot_b64);
    HttpResult r = http_post(cfg_.api_url, payload, cfg_.timeout_s);
    if (!r.error.empty()) throw std::runtime_error("request failed: " + r.error);
    if (r.code < 200 || r.code >= 300)
        throw std::runtime_error("HTTP " + std::to_string(r.code) + ": " + r.body.substr(0, 200));

    std::string content;
    long tokens = -1;
    if (!extract_reply(r.body, content, &tokens))
        throw std::runtime_error("malformed completion response");
    if (content.empty())
        log_msg("main", "WARNING: model returned empty content (tokens=%ld)", tokens);
    else
        log_msg("main", "Model responded: %zu chars, %ld tokens", content.size(), tokens);
    return content;
}

std::string compose_user_text(const std::string& story, const std::string& feedback){
    if (!story.empty() && !feedback.empty()) return story + "\n\n" + feedback;
    return story.empty() ? feedback : story;
}

// Locale-independent, shortest form (0.7, not 0.69999999999999996).
static std::string num(double v){
    std::ostringstream o;
    o.imbue(std::locale::classic());
    o << v;
    return o.str();
}

std::string build_chat_payload(const InferenceCfg& cfg, const std::string& story,
                               const std::string& feedback, const std::string& screenshot_b64){
    std::string user = "[{\"type\":\"text\",\"text\":\"" + escape_json(compose_user_text(story, feedback)) + "\"}";
    if (!screenshot_b64.empty()) {
        user += ",{\"type\":\"image_url\",\"image_url\":{\"url\":\"" +
                escape_json(png_data_uri(screenshot_b64)) + "\"}}";
    }
    user += "]";

    std::string j = "{";
    j += "\"model\":\"" + escape_json(cfg.model) + "\",";
    j += "\"messages\":[";
    j += "{\"role\":\"system\",\"content\":\"" + escape_json(kSystemPrompt) + "\"},";
    j += "{\"role\":\"user\",\"content\":" + user + "}";
    j += "],";
    j += "\"temperature\":" + num(cfg.temperature) + ",";
    j += "\"top_p\":" + num(cfg.top_p) + ",";
    j += "\"max_tokens\":" + std::to_string(cfg.max_tokens);
    return j + "}";
}

bool extract_reply(const std::string& body, std::string& content, long* tokens){
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return false;
    if (tokens) {
        *tokens = -1;
        json_object* usage=nullptr; json_object* total=nullptr;
        if (json_object_object_get_ex(root,"usage",&usage) &&
            json_object_object_get_ex(usage,"total_tokens",&total))
            *tokens = (long)json_object_get_int64(total);
    }
    json_object* choices=nullptr;
    if (!json_object_object_get_ex(root,"choices",&choices) ||
        !json_object_is_type(choices, json_type_array) || json_object_array_length(choices) == 0) {
        json_object_put(root);
        return false;
    }
    json_object* msg=nullptr; json_object* jc=nullptr;
    json_object* first = json_object_array_get_idx(choices, 0);
    if (!json_object_object_get_ex(first,"message",&msg) || !json_object_object_get_ex(msg,"content",&jc)) {
        json_object_put(root);
        return false;
    }
    const char* s = json_object_is_type(jc, json_type_null) ? nullptr : json_object_get_string(jc);
    content = s ? s : "";
    json_object_put(root);
    return true;
}
