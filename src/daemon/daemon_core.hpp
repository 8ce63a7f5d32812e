#pragma once

#include "config.hpp"
#include "controller.hpp"
#include "platform/capability_probe.hpp"
#include "platform/ipc_server.hpp"
#include "storage/history_store.hpp"
#include "whisper/backend.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    // notify is called from worker threads; it must wake the event loop,
    // which then calls on_job_events().
    DaemonCore(Config config, bool verbose, IpcServer& ipc,
               const CapabilityProbe& probe, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Creates the backend named in the config.
    bool init();
    bool init(std::unique_ptr<WhisperBackend> backend);

    // A reply with status "pending" means the client waits for the job.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_job_events();

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    ControllerState state() const;

    void shutdown();

private:
    nlohmann::json handle_probe(const nlohmann::json& cmd);
    nlohmann::json handle_load(const nlohmann::json& cmd);
    nlohmann::json handle_reload(const nlohmann::json& cmd);
    nlohmann::json handle_transcribe(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_show(const nlohmann::json& cmd);
    nlohmann::json handle_export(const nlohmann::json& cmd);
    nlohmann::json handle_remove(const nlohmann::json& cmd);
    nlohmann::json handle_clear(const nlohmann::json& cmd);

    std::expected<ModelTier, std::string> default_tier() const;
    void dispatch(const ControllerUpdate& update);
    nlohmann::json job_response(const ControllerUpdate& update);
    void reply_waiting(const nlohmann::json& response);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    const CapabilityProbe& probe_;
    NotifyCallback notify_;

    std::unique_ptr<WhisperBackend> backend_;
    std::unique_ptr<HistoryStore> history_;
    std::unique_ptr<Controller> controller_;

    CapabilityReport capabilities_;
    std::vector<int> waiting_clients_;
};
