#pragma once
#include <string>

struct InferenceCfg {
    std::string api_url;
    std::string model;
    double temperature = 0.7;
    double top_p = 0.9;
    int max_tokens = 300;
    long timeout_s = 300;
};

struct HttpResult { int code; std::string body; std::string error; };

class InferenceClient {
public:
    virtual ~InferenceClient() = default;
    // Next story. Throws std::runtime_error on transport or protocol failure.
    virtual std::string complete(const std::string& story, const std::string& feedback,
                                 const std::string& screenshot_b64) = 0;
};

// OpenAI-style chat completions endpoint over libcurl. One attempt per call.
class HttpInferenceClient : public InferenceClient {
public:
    explicit HttpInferenceClient(InferenceCfg cfg);
    std::string complete(const std::string& story, const std::string& feedback,
                         const std::string& screenshot_b64) override;
private:
    InferenceCfg cfg_;
};

extern const char* const kSystemPrompt;

// "story\n\nfeedback", or whichever of the two is non-empty.
std::string compose_user_text(const std::string& story, const std::string& feedback);

std::string build_chat_payload(const InferenceCfg& cfg, const std::string& story,
                               const std::string& feedback, const std::string& screenshot_b64);

// choices[0].message.content. False when the body has no such field;
// `tokens` receives usage.total_tokens or -1.
bool extract_reply(const std::string& body, std::string& content, long* tokens = nullptr);
