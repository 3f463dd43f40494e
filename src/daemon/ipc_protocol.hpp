#pragma once

#include "hotkey/hotkey_state_machine.hpp"
#include "pipeline/pipeline_events.hpp"
#include "storage/history_log.hpp"

#include <nlohmann/json.hpp>
#include <string>

// JSON shapes pushed to `watch` clients and returned by `history`.
namespace ipc {

nlohmann::json event_json(const HotkeyEvent& event);
nlohmann::json event_json(const PipelineResult& result);
nlohmann::json event_json(const PipelineError& error);
nlohmann::json listener_failed_json(const std::string& reason);
nlohmann::json entry_json(const HistoryEntry& entry);

nlohmann::json ok();
nlohmann::json error(const std::string& message);

} // namespace ipc
