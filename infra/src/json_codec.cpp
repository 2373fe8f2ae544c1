#include "infra/json_codec.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace runq::infra {

namespace {

using core::DispatchError;

json optional_field(const std::optional<std::string>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

json optional_time(const std::optional<core::RunRecord::TimePoint>& tp) {
    return tp.has_value() ? json(core::format_timestamp(*tp)) : json(nullptr);
}

json tags_to_json(const core::TagSet& tags) {
    json out = json::array();
    for (const auto& tag : tags) {
        out.push_back(tag);
    }
    return out;
}

core::Result<core::TagSet, DispatchError> tags_from_json(const json& value, const char* field) {
    using R = core::Result<core::TagSet, DispatchError>;
    core::TagSet tags;
    if (value.is_null()) {
        return R::Ok(tags);
    }
    if (!value.is_array()) {
        return R::Err(DispatchError::Validation(std::string(field) + " must be an array of strings"));
    }
    for (const auto& tag : value) {
        if (!tag.is_string() || tag.get<std::string>().empty()) {
            return R::Err(DispatchError::Validation(std::string(field) + " must contain non-empty strings"));
        }
        tags.insert(tag.get<std::string>());
    }
    return R::Ok(tags);
}

core::Result<std::optional<core::RunRecord::TimePoint>, DispatchError>
time_from_json(const json& value, const char* field) {
    using R = core::Result<std::optional<core::RunRecord::TimePoint>, DispatchError>;
    if (!value.contains(field) || value[field].is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!value[field].is_string()) {
        return R::Err(DispatchError::Validation(std::string(field) + " must be a timestamp string"));
    }
    auto tp = parse_timestamp(value[field].get<std::string>());
    if (!tp.has_value()) {
        return R::Err(DispatchError::Validation(std::string(field) + " is not ISO-8601"));
    }
    return R::Ok(tp);
}

} // namespace

// ---- Encoding ----

json demand_to_json(const std::optional<core::DemandSpec>& demand) {
    if (!demand.has_value()) {
        return nullptr;
    }
    json out = json::object();
    out["profile"] = optional_field(demand->profile);
    out["tags"] = tags_to_json(demand->tags);
    return out;
}

json run_to_json(const core::RunRecord& run) {
    json out;
    out["run_id"] = run.run_id;
    out["kind"] = core::to_string(run.kind);
    out["session_name"] = run.session_name;
    out["parent_session_name"] = optional_field(run.parent_session_name);
    out["payload"] = run.payload;
    out["demand"] = demand_to_json(run.demand);
    out["inherited_demand"] = run.inherited_demand;
    out["status"] = core::to_string(run.status);
    out["runner_id"] = optional_field(run.runner_id);
    out["last_runner_id"] = optional_field(run.last_runner_id);
    out["error"] = optional_field(run.error);
    out["result"] = optional_field(run.result);
    out["created_at"] = core::format_timestamp(run.created_at);
    out["claimed_at"] = optional_time(run.claimed_at);
    out["started_at"] = optional_time(run.started_at);
    out["completed_at"] = optional_time(run.completed_at);
    return out;
}

json runner_to_json(const core::RunnerView& runner) {
    const auto& info = runner.info;
    const auto since = std::chrono::duration_cast<std::chrono::seconds>(
        core::RunnerInfo::Clock::now() - info.last_heartbeat);

    json out;
    out["runner_id"] = info.runner_id;
    out["hostname"] = optional_field(info.hostname);
    out["tags"] = tags_to_json(info.capabilities.tags);
    out["profile"] = optional_field(info.capabilities.profile);
    out["strict_tags"] = info.capabilities.strict_tags;
    out["status"] = core::to_string(runner.status);
    out["registered_at"] = core::format_timestamp(info.registered_at);
    out["last_heartbeat"] = core::format_timestamp(info.last_heartbeat);
    out["seconds_since_heartbeat"] = since.count();
    return out;
}

json session_to_json(const core::SessionView& session) {
    const auto& info = session.info;
    json out;
    out["session_name"] = info.session_name;
    out["status"] = core::to_string(info.status());
    out["parent_session_name"] = optional_field(info.parent_session_name);
    out["active_runs"] = info.active_runs;
    out["last_profile"] = optional_field(info.last_profile);
    out["demand_tags"] = tags_to_json(info.demand_tags);
    out["created_at"] = core::format_timestamp(info.created_at);
    out["pending_notifications"] = session.pending_children.size();
    out["pending_children"] = session.pending_children;
    return out;
}

json error_to_json(const core::DispatchError& error) {
    json out;
    out["error"] = core::to_string(error.category);
    out["message"] = error.message;
    if (!error.details.empty()) {
        out["details"] = error.details;
    }
    return out;
}

// ---- Decoding request bodies ----

core::Result<json, DispatchError> parse_object(const std::string& body) {
    using R = core::Result<json, DispatchError>;
    if (body.empty()) {
        return R::Ok(json::object());
    }
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return R::Err(DispatchError::Validation("Malformed JSON body"));
    }
    if (!parsed.is_object()) {
        return R::Err(DispatchError::Validation("JSON body must be an object"));
    }
    return R::Ok(std::move(parsed));
}

core::Result<std::string, DispatchError> required_string(const json& body, const char* field) {
    using R = core::Result<std::string, DispatchError>;
    if (!body.contains(field) || !body[field].is_string()) {
        return R::Err(DispatchError::Validation(std::string(field) + " is required"));
    }
    auto value = body[field].get<std::string>();
    if (value.empty()) {
        return R::Err(DispatchError::Validation(std::string(field) + " must not be empty"));
    }
    return R::Ok(std::move(value));
}

core::Result<std::optional<std::string>, DispatchError>
optional_string(const json& body, const char* field) {
    using R = core::Result<std::optional<std::string>, DispatchError>;
    if (!body.contains(field) || body[field].is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!body[field].is_string()) {
        return R::Err(DispatchError::Validation(std::string(field) + " must be a string"));
    }
    return R::Ok(body[field].get<std::string>());
}

core::Result<std::optional<core::DemandSpec>, DispatchError> demand_from_json(const json& value) {
    using R = core::Result<std::optional<core::DemandSpec>, DispatchError>;
    if (value.is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!value.is_object()) {
        return R::Err(DispatchError::Validation("demand must be an object"));
    }

    core::DemandSpec demand;
    auto profile = optional_string(value, "profile");
    if (profile.is_err()) {
        return R::Err(profile.error());
    }
    demand.profile = profile.value();

    if (value.contains("tags")) {
        auto tags = tags_from_json(value["tags"], "demand.tags");
        if (tags.is_err()) {
            return R::Err(tags.error());
        }
        demand.tags = tags.value();
    }

    if (demand.empty()) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(std::move(demand));
}

core::Result<core::SubmitRequest, DispatchError> submit_request_from_json(const json& body) {
    using R = core::Result<core::SubmitRequest, DispatchError>;
    core::SubmitRequest request;

    auto session = required_string(body, "session_name");
    if (session.is_err()) {
        return R::Err(session.error());
    }
    request.session_name = session.value();

    auto payload = required_string(body, "payload");
    if (payload.is_err()) {
        return R::Err(payload.error());
    }
    request.payload = payload.value();

    auto kind = optional_string(body, "kind");
    if (kind.is_err()) {
        return R::Err(kind.error());
    }
    if (kind.value().has_value()) {
        auto parsed = core::parse_run_kind(*kind.value());
        if (!parsed.has_value()) {
            return R::Err(DispatchError::Validation("Unknown run kind: " + *kind.value()));
        }
        request.kind = *parsed;
    }

    auto parent = optional_string(body, "parent_session_name");
    if (parent.is_err()) {
        return R::Err(parent.error());
    }
    request.parent_session_name = parent.value();

    if (body.contains("demand")) {
        auto demand = demand_from_json(body["demand"]);
        if (demand.is_err()) {
            return R::Err(demand.error());
        }
        request.demand = demand.value();
    }
    return R::Ok(std::move(request));
}

core::Result<core::RunnerRegistration, DispatchError> registration_from_json(const json& body) {
    using R = core::Result<core::RunnerRegistration, DispatchError>;
    core::RunnerRegistration registration;

    if (body.contains("tags")) {
        auto tags = tags_from_json(body["tags"], "tags");
        if (tags.is_err()) {
            return R::Err(tags.error());
        }
        registration.capabilities.tags = tags.value();
    }

    auto profile = optional_string(body, "profile");
    if (profile.is_err()) {
        return R::Err(profile.error());
    }
    registration.capabilities.profile = profile.value();

    if (body.contains("strict_tags") && !body["strict_tags"].is_null()) {
        if (!body["strict_tags"].is_boolean()) {
            return R::Err(DispatchError::Validation("strict_tags must be a boolean"));
        }
        registration.capabilities.strict_tags = body["strict_tags"].get<bool>();
    }

    auto hostname = optional_string(body, "hostname");
    if (hostname.is_err()) {
        return R::Err(hostname.error());
    }
    registration.hostname = hostname.value();
    return R::Ok(std::move(registration));
}

// ---- Decoding responses ----

std::optional<core::RunRecord::TimePoint> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits += static_cast<char>(in.get());
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }
    if (in.get() != 'Z') {
        return std::nullopt;
    }

    const std::time_t seconds = timegm(&tm);
    return core::RunRecord::Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

core::Result<core::RunRecord, DispatchError> run_from_json(const json& value) {
    using R = core::Result<core::RunRecord, DispatchError>;
    if (!value.is_object()) {
        return R::Err(DispatchError::Validation("run must be an object"));
    }

    core::RunRecord run;
    const std::pair<const char*, std::string*> required_fields[] = {
        {"run_id", &run.run_id},
        {"session_name", &run.session_name},
        {"payload", &run.payload},
    };
    for (const auto& [field, target] : required_fields) {
        if (!value.contains(field) || !value[field].is_string()) {
            return R::Err(DispatchError::Validation(std::string("run.") + field + " missing"));
        }
        *target = value[field].get<std::string>();
    }

    auto kind = required_string(value, "kind");
    auto status = required_string(value, "status");
    if (kind.is_err() || status.is_err()) {
        return R::Err(DispatchError::Validation("run.kind and run.status are required"));
    }
    auto parsed_kind = core::parse_run_kind(kind.value());
    auto parsed_status = core::parse_run_status(status.value());
    if (!parsed_kind.has_value() || !parsed_status.has_value()) {
        return R::Err(DispatchError::Validation("Unknown run kind or status"));
    }
    run.kind = *parsed_kind;
    run.status = *parsed_status;

    const std::pair<const char*, std::optional<std::string>*> optional_fields[] = {
        {"parent_session_name", &run.parent_session_name},
        {"runner_id", &run.runner_id},
        {"last_runner_id", &run.last_runner_id},
        {"error", &run.error},
        {"result", &run.result},
    };
    for (const auto& [field, target] : optional_fields) {
        auto text = optional_string(value, field);
        if (text.is_err()) {
            return R::Err(text.error());
        }
        *target = text.value();
    }

    if (value.contains("demand")) {
        auto demand = demand_from_json(value["demand"]);
        if (demand.is_err()) {
            return R::Err(demand.error());
        }
        run.demand = demand.value();
    }
    if (value.contains("inherited_demand") && value["inherited_demand"].is_boolean()) {
        run.inherited_demand = value["inherited_demand"].get<bool>();
    }

    auto created = time_from_json(value, "created_at");
    if (created.is_err()) {
        return R::Err(created.error());
    }
    if (created.value().has_value()) {
        run.created_at = *created.value();
    }
    const std::pair<const char*, std::optional<core::RunRecord::TimePoint>*> time_fields[] = {
        {"claimed_at", &run.claimed_at},
        {"started_at", &run.started_at},
        {"completed_at", &run.completed_at},
    };
    for (const auto& [field, target] : time_fields) {
        auto tp = time_from_json(value, field);
        if (tp.is_err()) {
            return R::Err(tp.error());
        }
        *target = tp.value();
    }
    return R::Ok(std::move(run));
}

} // namespace runq::infra
