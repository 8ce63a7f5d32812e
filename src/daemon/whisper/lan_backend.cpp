#include "lan_backend.hpp"

#include <curl/curl.h>
#include <format>
#include <functional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& s) {
    auto start_pos = s.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = s.find_last_not_of(" \t\n\r");
    return s.substr(start_pos, end_pos - start_pos + 1);
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

struct HttpReply {
    long status = 0;
    std::string body;
};

using FormBuilder = std::function<CURLcode(curl_mime*)>;

std::expected<HttpReply, std::string>
post_form(const std::string& endpoint, long timeout_s, const FormBuilder& build) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    CURLcode res = build(mime);

    HttpReply reply;
    if (res == CURLE_OK) {
        curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

        res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
        }
    }

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return reply;
}

} // namespace

LanBackend::LanBackend(std::string url, std::string models_dir, long timeout_s)
    : url_(std::move(url)), models_dir_(std::move(models_dir)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<WhisperModel>, std::string>
LanBackend::load_model(ModelTier tier, const std::string& /*device*/) {
    // The server decides GPU use at its own start-up; only the weights are switched here.
    std::string model_path = models_dir_ + "/ggml-" + std::string(to_string(tier)) + ".bin";

    auto reply = post_form(url_ + "/load", timeout_s_, [&model_path](curl_mime* mime) {
        add_field(mime, "model", model_path);
        return CURLE_OK;
    });
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->status != 200) {
        return std::unexpected(std::format("server returned HTTP {} loading {}: {}",
                                           reply->status, model_path, trim(reply->body)));
    }

    return std::make_unique<LanModel>(url_, timeout_s_);
}

LanModel::LanModel(std::string url, long timeout_s)
    : url_(std::move(url)), timeout_s_(timeout_s) {}

std::expected<TranscriptResult, std::string>
LanModel::transcribe(const std::string& audio_path, const TranscribeOptions& options) {
    std::string language = "auto";
    if (!options.auto_detect_language && !options.forced_language.empty()) {
        language = options.forced_language;
    }

    auto reply = post_form(url_ + "/inference", timeout_s_,
                           [&](curl_mime* mime) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        CURLcode rc = curl_mime_filedata(part, audio_path.c_str());
        if (rc != CURLE_OK) return rc;

        add_field(mime, "temperature", "0.0");
        add_field(mime, "response_format", "verbose_json");
        add_field(mime, "language", language);
        add_field(mime, "translate", options.translate_to_english ? "true" : "false");
        return CURLE_OK;
    });
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->status != 200) {
        return std::unexpected(std::format("server returned HTTP {}: {}",
                                           reply->status, trim(reply->body)));
    }

    return parse_inference_response(reply->body);
}

std::expected<TranscriptResult, std::string> parse_inference_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            const auto& err = j["error"];
            return std::unexpected("server error: " +
                                   (err.is_string() ? err.get<std::string>() : err.dump()));
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body);
        }

        TranscriptResult tr;
        tr.text = trim(j["text"].get<std::string>());
        tr.language = j.value("language", "");

        if (j.contains("segments") && j["segments"].is_array()) {
            for (const auto& s : j["segments"]) {
                tr.segments.push_back(Segment{
                    .start = s.value("start", 0.0),
                    .end = s.value("end", 0.0),
                    .text = trim(s.value("text", "")),
                });
            }
        }
        return tr;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
