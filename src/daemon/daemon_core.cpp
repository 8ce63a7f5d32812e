#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "whisper/lan_backend.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <type_traits>

using json = nlohmann::json;

namespace {

json error_response(const Error& err) {
    return {
        {"status", "error"},
        {"error", to_string(err.kind)},
        {"message", describe(err)},
    };
}

json segments_json(const std::vector<Segment>& segments) {
    json out = json::array();
    for (auto& s : segments) {
        out.push_back({{"start", s.start}, {"end", s.end}, {"text", s.text}});
    }
    return out;
}

json entry_summary(const HistoryEntry& e) {
    return {
        {"index", e.index},
        {"file_name", e.result.source_name},
        {"language", e.result.language},
        {"date", format_created_at(e.result)},
        {"text", e.result.text},
    };
}

json bad_field(const char* key) {
    return {{"status", "error"}, {"message", std::format("invalid field: {}", key)}};
}

// Optional request field. Present with the wrong type is an error naming the key.
template <typename T>
std::expected<T, json> field(const json& cmd, const char* key, T fallback) {
    auto it = cmd.find(key);
    if (it == cmd.end()) return fallback;

    bool ok = false;
    if constexpr (std::is_same_v<T, std::string>) ok = it->is_string();
    else if constexpr (std::is_same_v<T, bool>) ok = it->is_boolean();
    else ok = it->is_number_integer();
    if (!ok) return std::unexpected(bad_field(key));
    return it->get<T>();
}

// Negative or missing indices come back as npos so they fail the range check.
size_t index_arg(const json& cmd) {
    auto it = cmd.find("index");
    if (it == cmd.end() || !it->is_number_integer()) return std::string::npos;
    auto value = it->get<long long>();
    return value < 0 ? std::string::npos : static_cast<size_t>(value);
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, IpcServer& ipc,
                       const CapabilityProbe& probe, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), probe_(probe), notify_(std::move(notify)) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    // Create backend
    if (config_.backend.type != "lan") {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }
    return init(std::make_unique<LanBackend>(
        config_.backend.url, config_.backend.models_dir, config_.backend.timeout_seconds));
}

bool DaemonCore::init(std::unique_ptr<WhisperBackend> backend) {
    backend_ = std::move(backend);

    // Open history
    std::string history_path = config_.history.path;
    if (history_path.empty()) {
        auto data = platform::data_dir();
        history_path = (data.empty() ? std::string("/tmp/scribe") : data)
                     + "/transcription_history.json";
    }
    history_ = std::make_unique<HistoryStore>(history_path);
    log(std::format("History: {} ({} entries)", history_path, history_->size()));

    controller_ = std::make_unique<Controller>(*backend_, *history_, probe_, notify_);

    capabilities_ = controller_->probe_capabilities();
    log(std::format("Device: {}, {:.1f} GB RAM available, recommended tier {}",
                    to_string(capabilities_.device), capabilities_.available_ram_gb,
                    to_string(capabilities_.recommended_tier)));

    if (config_.model.autoload) {
        auto tier = default_tier();
        if (!tier) {
            std::println(stderr, "model: {}", tier.error());
        } else if (auto job = controller_->select_tier(*tier); !job) {
            std::println(stderr, "model: {}", describe(job.error()));
        } else {
            log(std::format("Loading {} model", to_string(*tier)));
        }
    }

    return true;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "probe") return handle_probe(cmd);
    if (cmd_str == "load") return handle_load(cmd);
    if (cmd_str == "reload") return handle_reload(cmd);
    if (cmd_str == "transcribe") return handle_transcribe(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "show") return handle_show(cmd);
    if (cmd_str == "export") return handle_export(cmd);
    if (cmd_str == "remove") return handle_remove(cmd);
    if (cmd_str == "clear") return handle_clear(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_probe(const json& /*cmd*/) {
    capabilities_ = controller_->probe_capabilities();
    return {
        {"status", "ok"},
        {"device", to_string(capabilities_.device)},
        {"accelerator_name", capabilities_.accelerator_name},
        {"accelerator_memory_gb", capabilities_.accelerator_memory_gb},
        {"available_ram_gb", capabilities_.available_ram_gb},
        {"recommended_tier", to_string(capabilities_.recommended_tier)},
    };
}

json DaemonCore::handle_load(const json& cmd) {
    auto name = field<std::string>(cmd, "tier", "");
    if (!name) return name.error();

    std::expected<ModelTier, std::string> tier = default_tier();
    if (!name->empty()) {
        auto parsed = parse_model_tier(*name);
        if (!parsed) {
            return {{"status", "error"}, {"message", "unknown tier: " + *name}};
        }
        tier = *parsed;
    }
    if (!tier) return {{"status", "error"}, {"message", tier.error()}};

    auto job = controller_->select_tier(*tier);
    if (!job) return error_response(job.error());

    log(std::format("Loading {} model (job {})", to_string(*tier), job->id));
    return {{"status", "pending"}, {"job", job->id}};
}

json DaemonCore::handle_reload(const json& /*cmd*/) {
    auto job = controller_->reload_model();
    if (!job) return error_response(job.error());

    log(std::format("Reloading model (job {})", job->id));
    return {{"status", "pending"}, {"job", job->id}};
}

json DaemonCore::handle_transcribe(const json& cmd) {
    auto path = field<std::string>(cmd, "path", "");
    if (!path) return path.error();
    if (path->empty()) {
        return {{"status", "error"}, {"message", "missing path"}};
    }

    auto auto_detect = field(cmd, "auto_detect", config_.transcription.auto_detect);
    if (!auto_detect) return auto_detect.error();
    auto translate = field(cmd, "translate", config_.transcription.translate);
    if (!translate) return translate.error();
    auto language = field(cmd, "language", config_.transcription.language);
    if (!language) return language.error();

    TranscribeOptions options{
        .auto_detect_language = *auto_detect,
        .translate_to_english = *translate,
        .forced_language = *language,
    };

    auto job = controller_->start_transcription(*path, options);
    if (!job) return error_response(job.error());

    log(std::format("Transcribing {} (job {})", *path, job->id));
    return {{"status", "pending"}, {"job", job->id}};
}

json DaemonCore::handle_cancel(const json& /*cmd*/) {
    if (!controller_->cancel_current()) {
        return {{"status", "error"}, {"message", "nothing to cancel"}};
    }
    log("Cancel requested");
    return {{"status", "ok"}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"state", to_string(controller_->state())}};
    if (auto tier = controller_->model_tier()) {
        resp["tier"] = to_string(*tier);
    }
    if (controller_->state() == ControllerState::LoadingModel) {
        if (auto tier = controller_->requested_tier()) {
            resp["loading_tier"] = to_string(*tier);
        }
    }
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    auto limit = field(cmd, "limit", 10L);
    if (!limit) return limit.error();

    auto entries = controller_->list_history();
    size_t skip = 0;
    if (*limit > 0 && entries.size() > static_cast<size_t>(*limit)) {
        skip = entries.size() - static_cast<size_t>(*limit);
    }

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (size_t i = skip; i < entries.size(); ++i) {
        resp["entries"].push_back(entry_summary(entries[i]));
    }
    return resp;
}

json DaemonCore::handle_show(const json& cmd) {
    auto index = index_arg(cmd);
    auto entry = controller_->history_entry(index);
    if (!entry) {
        auto it = cmd.find("index");
        return error_response(Error{ErrorKind::IndexOutOfRange,
                                    it == cmd.end() ? std::string("missing") : it->dump()});
    }

    auto summary = entry_summary(*entry);
    summary["file_path"] = entry->result.source_path;
    summary["segments"] = segments_json(entry->result.segments);
    return {{"status", "ok"}, {"entry", summary}};
}

json DaemonCore::handle_export(const json& cmd) {
    auto path = field<std::string>(cmd, "path", "");
    if (!path) return path.error();
    if (path->empty()) {
        return {{"status", "error"}, {"message", "missing path"}};
    }

    auto res = controller_->export_history_entry(index_arg(cmd), *path);
    if (!res) return error_response(res.error());

    log("Exported to " + *path);
    return {{"status", "ok"}};
}

json DaemonCore::handle_remove(const json& cmd) {
    auto res = controller_->remove_history_entry(index_arg(cmd));
    if (!res) return error_response(res.error());
    return {{"status", "ok"}, {"removed", *res}};
}

json DaemonCore::handle_clear(const json& /*cmd*/) {
    auto res = controller_->clear_history();
    if (!res) return error_response(res.error());
    log("History cleared");
    return {{"status", "ok"}};
}

void DaemonCore::on_job_events() {
    for (auto& update : controller_->process_events()) {
        dispatch(update);
    }
}

void DaemonCore::dispatch(const ControllerUpdate& update) {
    auto& ev = update.event;

    if (ev.type == JobEvent::Type::Progress) {
        log(ev.message);
        json progress = {{"status", "progress"}, {"message", ev.message}};
        for (int fd : waiting_clients_) {
            ipc_.send_response(fd, progress);
        }
        return;
    }

    reply_waiting(job_response(update));
}

json DaemonCore::job_response(const ControllerUpdate& update) {
    auto& ev = update.event;

    switch (ev.type) {
        case JobEvent::Type::Cancelled:
            log(std::format("Job {} cancelled", ev.job_id));
            return {{"status", "cancelled"}};

        case JobEvent::Type::Failed: {
            Error err = ev.error.value_or(Error{ErrorKind::TranscribeFailed, {}});
            log(std::format("Job {} failed: {}", ev.job_id, describe(err)));
            return error_response(err);
        }

        case JobEvent::Type::Completed:
        case JobEvent::Type::Progress:
            break;
    }

    if (ev.kind == JobKind::ModelLoad) {
        auto tier = controller_->model_tier();
        log(std::format("Model {} ready", tier ? to_string(*tier) : "?"));
        json resp = {{"status", "ok"}, {"state", to_string(update.state)}};
        if (tier) resp["tier"] = to_string(*tier);
        return resp;
    }

    const TranscriptResult* result =
        ev.output ? std::get_if<TranscriptResult>(&*ev.output) : nullptr;
    if (!result) {
        return error_response(Error{ErrorKind::TranscribeFailed, "no transcript"});
    }

    log(std::format("Transcription complete: {} chars, {} segments, language {}",
                    result->text.size(), result->segments.size(), result->language));

    json resp = {
        {"status", "ok"},
        {"text", result->text},
        {"language", result->language},
        {"file_name", result->source_name},
        {"segments", segments_json(result->segments)},
    };
    if (update.history_index) resp["index"] = *update.history_index;
    if (update.persist_error) resp["warning"] = describe(*update.persist_error);
    return resp;
}

void DaemonCore::reply_waiting(const json& response) {
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

std::expected<ModelTier, std::string> DaemonCore::default_tier() const {
    if (config_.model.tier.empty()) return capabilities_.recommended_tier;
    auto tier = parse_model_tier(config_.model.tier);
    if (!tier) return std::unexpected("unknown tier in config: " + config_.model.tier);
    return *tier;
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

ControllerState DaemonCore::state() const {
    return controller_ ? controller_->state() : ControllerState::Idle;
}

void DaemonCore::shutdown() {
    if (!controller_) return;

    if (controller_->current_job()) {
        log("Waiting for the running job to finish...");
    }
    for (auto& update : controller_->shutdown()) {
        dispatch(update);
    }
    reply_waiting({{"status", "error"}, {"message", "daemon shutting down"}});
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[scribed] {}", msg);
    }
}
