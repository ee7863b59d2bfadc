#pragma once
// RPC Handler: JSON-RPC methods over a DialogueService
//
//   initialize      {protocol?: {major, minor}}
//   turn/run        {npc, player?, message}
//   npc/list        {}
//   npc/info        {npc}
//   npc/ambient     {hour?, scene?}
//   affinity/get    {npc, player?}
//   affinity/set    {npc, player?, score}
//   affinity/list   {player?}
//   memory/history  {npc, player?}
//   memory/episodic {npc, limit?}
//   memory/clear    {npc, player?}
//   context/get     {id}
//   shutdown        {}
//
// `player` defaults to the service's configured default player.

#include "protocol.hpp"
#include "../service.hpp"
#include "../version.hpp"
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>

namespace colloquy::rpc {

// Empty if every required key is present, else the error message
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key)) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

class Handler {
public:
    explicit Handler(DialogueService& service) : service_(service) {
        register_methods();
    }

    // One request line in, one response line out
    std::string handle(const std::string& request_str) {
        json response;
        try {
            response = handle_request(json::parse(request_str));
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR,
                                  std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            response = make_error(json(), error::INTERNAL_ERROR,
                                  std::string("Internal error: ") + e.what());
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        auto it = methods_.find(info.method);
        if (it == methods_.end()) {
            return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
        }

        try {
            return it->second(info.params, info.id);
        } catch (const json::exception& e) {
            return make_error(info.id, error::INVALID_PARAMS,
                              std::string("Invalid params: ") + e.what());
        } catch (const std::exception& e) {
            return make_error(info.id, error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what());
        }
    }

    bool shutdown_requested() const { return shutdown_requested_; }

private:
    using Method = std::function<json(const json& params, const json& id)>;

    DialogueService& service_;
    std::unordered_map<std::string, Method> methods_;
    bool shutdown_requested_ = false;

    void register_methods() {
        methods_["initialize"] = [this](const json& p, const json& id) { return initialize(p, id); };
        methods_["turn/run"] = [this](const json& p, const json& id) { return turn_run(p, id); };
        methods_["npc/list"] = [this](const json& p, const json& id) { return npc_list(p, id); };
        methods_["npc/info"] = [this](const json& p, const json& id) { return npc_info(p, id); };
        methods_["npc/ambient"] = [this](const json& p, const json& id) { return npc_ambient(p, id); };
        methods_["affinity/get"] = [this](const json& p, const json& id) { return affinity_get(p, id); };
        methods_["affinity/set"] = [this](const json& p, const json& id) { return affinity_set(p, id); };
        methods_["affinity/list"] = [this](const json& p, const json& id) { return affinity_list(p, id); };
        methods_["memory/history"] = [this](const json& p, const json& id) { return memory_history(p, id); };
        methods_["memory/episodic"] = [this](const json& p, const json& id) { return memory_episodic(p, id); };
        methods_["memory/clear"] = [this](const json& p, const json& id) { return memory_clear(p, id); };
        methods_["context/get"] = [this](const json& p, const json& id) { return context_get(p, id); };
        methods_["shutdown"] = [this](const json& p, const json& id) { return shutdown(p, id); };
    }

    std::string player_of(const json& params) const {
        return params.value("player", service_.config().default_player);
    }

    json unknown_npc(const json& id, const std::string& npc) const {
        return make_error(id, error::UNKNOWN_NPC, "NPC '" + npc + "' does not exist");
    }

    // ═══════════════════════════════════════════════════════════════════
    // Methods
    // ═══════════════════════════════════════════════════════════════════

    json initialize(const json& params, const json& id) {
        if (params.contains("protocol")) {
            int major = params["protocol"].value("major", 0);
            int minor = params["protocol"].value("minor", 0);
            if (!version::protocol_compatible(major, minor)) {
                return make_error(id, error::INVALID_REQUEST,
                                  "Unsupported protocol " + std::to_string(major) + "." +
                                  std::to_string(minor));
            }
        }
        return make_result(id, {
            {"serverInfo", {
                {"name", "colloquy"},
                {"version", COLLOQUY_VERSION}
            }},
            {"protocol", {
                {"major", COLLOQUY_PROTOCOL_VERSION_MAJOR},
                {"minor", COLLOQUY_PROTOCOL_VERSION_MINOR}
            }},
            {"npcs", service_.roster().names()},
            {"capabilities", {
                {"revision", service_.coordinator().revision_active()},
                {"parallel_retrieval", service_.config().pipeline.parallel_retrieval}
            }}
        });
    }

    json turn_run(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc", "message"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        std::string npc = params["npc"].get<std::string>();
        std::string message = params["message"].get<std::string>();
        TurnResult result = service_.chat(npc, player_of(params), message);

        if (!result.success) {
            int code = service_.roster().contains(npc) ? error::TURN_FAILED : error::UNKNOWN_NPC;
            return make_error(id, code, result.error);
        }
        json body = result.to_json();
        body["response"] = sanitize_utf8(result.reply);
        return make_result(id, body);
    }

    json npc_list(const json&, const json& id) {
        return make_result(id, {{"npcs", service_.list_npcs()}});
    }

    json npc_info(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        std::string npc = params["npc"].get<std::string>();
        auto info = service_.npc_info(npc);
        if (!info) return unknown_npc(id, npc);
        return make_result(id, *info);
    }

    json npc_ambient(const json& params, const json& id) {
        std::optional<int> hour;
        if (params.contains("hour")) {
            if (!params["hour"].is_number_integer()) {
                return make_error(id, error::INVALID_PARAMS, "hour must be an integer");
            }
            int h = params["hour"].get<int>();
            if (h < 0 || h > 23) {
                return make_error(id, error::INVALID_PARAMS, "hour must be between 0 and 23");
            }
            hour = h;
        }

        AmbientLines ambient = service_.ambient(hour, params.value("scene", ""));
        for (auto& [npc, line] : ambient.lines) line = sanitize_utf8(line);
        return make_result(id, ambient.to_json());
    }

    json affinity_get(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        std::string npc = params["npc"].get<std::string>();
        auto entry = service_.affinity(npc, player_of(params));
        if (!entry) return unknown_npc(id, npc);
        return make_result(id, *entry);
    }

    json affinity_set(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc", "score"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);
        if (!params["score"].is_number()) {
            return make_error(id, error::INVALID_PARAMS, "score must be a number");
        }

        std::string npc = params["npc"].get<std::string>();
        auto entry = service_.set_affinity(npc, player_of(params), params["score"].get<float>());
        if (!entry) return unknown_npc(id, npc);
        return make_result(id, *entry);
    }

    json affinity_list(const json& params, const json& id) {
        std::string player = player_of(params);
        return make_result(id, {{"player", player}, {"affinities", service_.affinities(player)}});
    }

    json memory_history(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        std::string npc = params["npc"].get<std::string>();
        std::string player = player_of(params);
        auto history = service_.history(npc, player);
        if (!history) return unknown_npc(id, npc);
        return make_result(id, {{"npc", npc}, {"player", player}, {"history", *history}});
    }

    json memory_episodic(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        std::string npc = params["npc"].get<std::string>();
        size_t limit = params.value("limit", size_t{10});
        auto entries = service_.memories(npc, limit);
        if (!entries) return unknown_npc(id, npc);
        return make_result(id, {{"npc", npc}, {"memories", *entries}});
    }

    json memory_clear(const json& params, const json& id) {
        std::string missing = validate_required(params, {"npc"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        std::string npc = params["npc"].get<std::string>();
        if (!service_.clear_memory(npc, player_of(params))) return unknown_npc(id, npc);
        return make_result(id, {{"status", "ok"}});
    }

    json context_get(const json& params, const json& id) {
        std::string missing = validate_required(params, {"id"});
        if (!missing.empty()) return make_error(id, error::INVALID_PARAMS, missing);

        auto summary = service_.context_summary(params["id"].get<std::string>());
        if (!summary) return make_error(id, error::INVALID_PARAMS, "Unknown or expired context");
        return make_result(id, *summary);
    }

    json shutdown(const json&, const json& id) {
        shutdown_requested_ = true;
        return make_result(id, {{"status", "ok"}});
    }
};

} // namespace colloquy::rpc
