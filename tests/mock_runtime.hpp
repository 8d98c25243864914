#pragma once

#include "common/errors.hpp"
#include "runtime/workload_runtime.hpp"

#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "cvault.pb.h"

namespace cvault::test {

// ── FakeWorkload ─────────────────────────────────────────────────────────────
//
// Workload state held by MockRuntime; rendered as `docker inspect` JSON.

struct FakeWorkload {
    std::string image = "nginx:1.25";
    bool running = true;
    std::vector<std::pair<std::string, std::string>> binds;   // host, container
    std::map<std::string, std::string> ports;                 // "80/tcp" → host port, "" = unpublished
    std::vector<std::string> env;
    std::vector<std::string> cmd;
    std::string restart_policy = "unless-stopped";
    std::optional<CreationSpec> created_from;
};

inline std::string inspect_json(const std::string& name, const FakeWorkload& w) {
    using google::protobuf::ListValue;
    using google::protobuf::Struct;
    using google::protobuf::Value;

    auto string_value = [](const std::string& s) {
        Value v;
        v.set_string_value(s);
        return v;
    };
    auto string_list = [&](const std::vector<std::string>& items) {
        Value v;
        for (const auto& item : items) {
            *v.mutable_list_value()->add_values() = string_value(item);
        }
        return v;
    };

    Struct state;
    (*state.mutable_fields())["Running"].set_bool_value(w.running);

    Struct exposed;
    Struct bindings;
    for (const auto& [key, host_port] : w.ports) {
        (*exposed.mutable_fields())[key].mutable_struct_value();
        if (host_port.empty()) {
            continue;
        }
        Struct entry;
        (*entry.mutable_fields())["HostIp"] = string_value("");
        (*entry.mutable_fields())["HostPort"] = string_value(host_port);
        Value list;
        *list.mutable_list_value()->add_values()->mutable_struct_value() = entry;
        (*bindings.mutable_fields())[key] = list;
    }

    Struct config;
    (*config.mutable_fields())["Image"] = string_value(w.image);
    (*config.mutable_fields())["WorkingDir"] = string_value("");
    (*config.mutable_fields())["User"] = string_value("");
    (*config.mutable_fields())["Entrypoint"].set_null_value(google::protobuf::NULL_VALUE);
    (*config.mutable_fields())["Env"] = string_list(w.env);
    (*config.mutable_fields())["Cmd"] = string_list(w.cmd);
    *(*config.mutable_fields())["ExposedPorts"].mutable_struct_value() = exposed;

    Struct restart;
    (*restart.mutable_fields())["Name"] = string_value(w.restart_policy);

    Struct host_config;
    *(*host_config.mutable_fields())["RestartPolicy"].mutable_struct_value() = restart;
    *(*host_config.mutable_fields())["PortBindings"].mutable_struct_value() = bindings;

    Value mounts;
    mounts.mutable_list_value();
    for (const auto& [host, container] : w.binds) {
        Struct m;
        (*m.mutable_fields())["Type"] = string_value("bind");
        (*m.mutable_fields())["Source"] = string_value(host);
        (*m.mutable_fields())["Destination"] = string_value(container);
        (*m.mutable_fields())["RW"].set_bool_value(true);
        *mounts.mutable_list_value()->add_values()->mutable_struct_value() = m;
    }

    Struct root;
    (*root.mutable_fields())["Name"] = string_value("/" + name);
    (*root.mutable_fields())["Image"] = string_value("sha256:0123456789abcdef");
    *(*root.mutable_fields())["State"].mutable_struct_value() = state;
    *(*root.mutable_fields())["Config"].mutable_struct_value() = config;
    *(*root.mutable_fields())["HostConfig"].mutable_struct_value() = host_config;
    (*root.mutable_fields())["Mounts"] = mounts;

    ListValue list;
    *list.add_values()->mutable_struct_value() = root;
    std::string json;
    (void)google::protobuf::util::MessageToJsonString(list, &json);
    return json;
}

// ── MockRuntime ──────────────────────────────────────────────────────────────
//
// In-memory WorkloadRuntime.  Records every lifecycle call in `calls`
// ("stop web1", "start web1", ...) and lets tests script failures.

class MockRuntime : public runtime::WorkloadRuntime {
public:
    std::map<std::string, FakeWorkload> workloads;
    std::vector<std::string> calls;
    std::set<std::string> images;

    bool ignore_stop  = false;   // graceful stop has no effect
    bool ignore_kill  = false;   // forced stop has no effect
    bool fail_start   = false;
    std::string loaded_image = "restored/image:loaded";

    std::string inspect(const std::string& ref) override {
        return inspect_json(ref, get(ref));
    }

    bool exists(const std::string& ref) override {
        return workloads.count(ref) != 0;
    }

    bool is_running(const std::string& ref) override {
        return get(ref).running;
    }

    void stop(const std::string& ref, std::chrono::seconds /*grace*/) override {
        calls.push_back("stop " + ref);
        if (!ignore_stop) {
            get(ref).running = false;
        }
    }

    void kill(const std::string& ref) override {
        calls.push_back("kill " + ref);
        if (!ignore_kill) {
            get(ref).running = false;
        }
    }

    void start(const std::string& ref) override {
        calls.push_back("start " + ref);
        auto& w = get(ref);
        if (fail_start) {
            throw VaultError(Errc::runtime_failed, "start " + ref);
        }
        w.running = true;
    }

    void remove(const std::string& ref) override {
        calls.push_back("remove " + ref);
        if (get(ref).running) {
            throw VaultError(Errc::runtime_failed, "cannot remove running " + ref);
        }
        workloads.erase(ref);
    }

    std::string create(const std::string& ref, const CreationSpec& spec) override {
        calls.push_back("create " + ref);
        if (workloads.count(ref)) {
            throw VaultError(Errc::runtime_failed, "name in use: " + ref);
        }
        FakeWorkload w;
        w.image = spec.image_ref();
        w.running = false;
        w.restart_policy = spec.restart_policy();
        w.env.assign(spec.env().begin(), spec.env().end());
        w.cmd.assign(spec.command().begin(), spec.command().end());
        for (const auto& m : spec.mounts()) {
            w.binds.emplace_back(m.restore_host_path(), m.container_path());
        }
        for (const auto& p : spec.ports()) {
            w.ports[p.container_port() + "/" + p.protocol()] = p.host_port();
        }
        w.created_from = spec;
        workloads[ref] = std::move(w);
        return "id-" + ref;
    }

    void commit(const std::string& ref, const std::string& image) override {
        calls.push_back("commit " + ref);
        (void)get(ref);
        images.insert(image);
    }

    void save_image(const std::string& image, const std::filesystem::path& path) override {
        calls.push_back("save " + image);
        std::ofstream(path) << "image " << image;
    }

    std::string load_image(const std::filesystem::path& /*path*/) override {
        calls.push_back("load");
        images.insert(loaded_image);
        return loaded_image;
    }

    [[nodiscard]] bool called(const std::string& call) const {
        for (const auto& c : calls) {
            if (c == call) {
                return true;
            }
        }
        return false;
    }

private:
    FakeWorkload& get(const std::string& ref) {
        auto it = workloads.find(ref);
        if (it == workloads.end()) {
            throw VaultError(Errc::not_found, "No such container: " + ref);
        }
        return it->second;
    }
};

} // namespace cvault::test
