#pragma once

#include "core/coordinator.h"
#include "core/dispatch_error.h"
#include "core/result.h"
#include "core/run.h"
#include "core/run_queue.h"
#include "core/runner_registry.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace runq::infra {

using nlohmann::json;

// ---- Encoding (server side) ----

json demand_to_json(const std::optional<core::DemandSpec>& demand);
json run_to_json(const core::RunRecord& run);
json runner_to_json(const core::RunnerView& runner);
json session_to_json(const core::SessionView& session);
json error_to_json(const core::DispatchError& error);

// ---- Decoding request bodies ----

/// Parse a body as a JSON object. Empty body yields an empty object.
core::Result<json, core::DispatchError> parse_object(const std::string& body);

core::Result<std::optional<core::DemandSpec>, core::DispatchError>
demand_from_json(const json& value);

core::Result<core::SubmitRequest, core::DispatchError>
submit_request_from_json(const json& body);

core::Result<core::RunnerRegistration, core::DispatchError>
registration_from_json(const json& body);

/// body["field"] as a non-empty string.
core::Result<std::string, core::DispatchError>
required_string(const json& body, const char* field);

/// body["field"] as a string if present and not null.
core::Result<std::optional<std::string>, core::DispatchError>
optional_string(const json& body, const char* field);

// ---- Decoding responses (client side) ----

core::Result<core::RunRecord, core::DispatchError> run_from_json(const json& value);

/// Inverse of core::format_timestamp.
std::optional<core::RunRecord::TimePoint> parse_timestamp(const std::string& text);

} // namespace runq::infra
