#pragma once

#include "errors.hpp"
#include "git/clone.hpp"
#include "git/stats.hpp"
#include "merge/merge_service.hpp"
#include "sessions/cancellation.hpp"
#include "sessions/session.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// JSON shapes of the objects carried over the daemon socket.

void to_json(nlohmann::json& j, const Session& s);
void to_json(nlohmann::json& j, const Spec& s);
void to_json(nlohmann::json& j, const Epic& e);
void to_json(nlohmann::json& j, const GitStats& s);
void to_json(nlohmann::json& j, const MergePreview& p);
void to_json(nlohmann::json& j, const MergeOutcome& o);
void to_json(nlohmann::json& j, const UpdateSessionFromParentResult& r);
void to_json(nlohmann::json& j, const CancellationResult& r);
void to_json(nlohmann::json& j, const CloneResult& r);

nlohmann::json ok_response();
nlohmann::json error_response(const std::string& message);
nlohmann::json error_response(const Error& error);

// Optional string member: absent and null both read as nullopt.
std::optional<std::string> optional_string(const nlohmann::json& j, const char* key);
