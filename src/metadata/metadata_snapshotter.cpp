#include "metadata/metadata_snapshotter.hpp"
#include "common/errors.hpp"
#include "persistence/byte_io.hpp"
#include "persistence/latest_pointer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace cvault::metadata {

namespace fs = std::filesystem;
using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

// ── Struct accessors ─────────────────────────────────────────────────────────

const Value* field(const Struct* obj, const std::string& key) {
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->fields().find(key);
    return it == obj->fields().end() ? nullptr : &it->second;
}

const Struct* object_at(const Struct* obj, const std::string& key) {
    const Value* v = field(obj, key);
    return v != nullptr && v->kind_case() == Value::kStructValue ? &v->struct_value() : nullptr;
}

const ListValue* list_at(const Struct* obj, const std::string& key) {
    const Value* v = field(obj, key);
    return v != nullptr && v->kind_case() == Value::kListValue ? &v->list_value() : nullptr;
}

std::string string_at(const Struct* obj, const std::string& key) {
    const Value* v = field(obj, key);
    return v != nullptr && v->kind_case() == Value::kStringValue ? v->string_value() : std::string{};
}

bool bool_at(const Struct* obj, const std::string& key, bool fallback) {
    const Value* v = field(obj, key);
    return v != nullptr && v->kind_case() == Value::kBoolValue ? v->bool_value() : fallback;
}

template <typename Repeated>
void copy_strings(const ListValue* list, Repeated* out) {
    if (list == nullptr) {
        return;
    }
    for (const auto& v : list->values()) {
        if (v.kind_case() == Value::kStringValue) {
            out->Add(std::string(v.string_value()));
        }
    }
}

// ── Ports ────────────────────────────────────────────────────────────────────

// "80/tcp" → ("80", "tcp"); a key without protocol defaults to tcp.
std::pair<std::string, std::string> split_port_key(const std::string& key) {
    auto slash = key.find('/');
    if (slash == std::string::npos) {
        return {key, "tcp"};
    }
    return {key.substr(0, slash), key.substr(slash + 1)};
}

unsigned long leading_number(const std::string& s) {
    return std::strtoul(s.c_str(), nullptr, 10);
}

bool port_less(const PortBinding& a, const PortBinding& b) {
    const auto ca = leading_number(a.container_port());
    const auto cb = leading_number(b.container_port());
    if (ca != cb) {
        return ca < cb;
    }
    if (a.container_port() != b.container_port()) {
        return a.container_port() < b.container_port();
    }
    if (a.protocol() != b.protocol()) {
        return a.protocol() < b.protocol();
    }
    const auto ha = leading_number(a.host_port());
    const auto hb = leading_number(b.host_port());
    if (ha != hb) {
        return ha < hb;
    }
    return a.host_ip() < b.host_ip();
}

void parse_ports(const Struct* config, const Struct* host_config, WorkloadMetadata& meta) {
    std::vector<PortBinding> ports;
    std::vector<std::string> bound_keys;

    if (const Struct* bindings = object_at(host_config, "PortBindings")) {
        for (const auto& [key, value] : bindings->fields()) {
            auto [container_port, protocol] = split_port_key(key);
            bound_keys.push_back(key);

            bool any = false;
            if (value.kind_case() == Value::kListValue) {
                for (const auto& entry : value.list_value().values()) {
                    if (entry.kind_case() != Value::kStructValue) {
                        continue;
                    }
                    PortBinding port;
                    port.set_host_ip(string_at(&entry.struct_value(), "HostIp"));
                    port.set_host_port(string_at(&entry.struct_value(), "HostPort"));
                    port.set_container_port(container_port);
                    port.set_protocol(protocol);
                    ports.push_back(std::move(port));
                    any = true;
                }
            }
            if (!any) {
                PortBinding port;
                port.set_container_port(container_port);
                port.set_protocol(protocol);
                ports.push_back(std::move(port));
            }
        }
    }

    if (const Struct* exposed = object_at(config, "ExposedPorts")) {
        for (const auto& [key, value] : exposed->fields()) {
            if (std::find(bound_keys.begin(), bound_keys.end(), key) != bound_keys.end()) {
                continue;
            }
            auto [container_port, protocol] = split_port_key(key);
            PortBinding port;
            port.set_container_port(container_port);
            port.set_protocol(protocol);
            ports.push_back(std::move(port));
        }
    }

    std::sort(ports.begin(), ports.end(), port_less);
    for (auto& port : ports) {
        *meta.add_ports() = std::move(port);
    }
}

// ── Mounts ───────────────────────────────────────────────────────────────────

void parse_mounts(const ListValue* mounts, WorkloadMetadata& meta) {
    if (mounts == nullptr) {
        return;
    }
    for (const auto& v : mounts->values()) {
        if (v.kind_case() != Value::kStructValue) {
            continue;
        }
        const Struct* m = &v.struct_value();
        const auto type = string_at(m, "Type");

        MountPoint mount;
        if (type == "bind") {
            mount.set_kind(MountPoint::BIND);
        } else if (type == "volume") {
            mount.set_kind(MountPoint::VOLUME);
        } else {
            mount.set_kind(MountPoint::KIND_UNSPECIFIED);
        }
        mount.set_host_path(string_at(m, "Source"));
        mount.set_container_path(string_at(m, "Destination"));
        mount.set_read_only(!bool_at(m, "RW", true));
        mount.set_volume_name(string_at(m, "Name"));
        *meta.add_mounts() = std::move(mount);
    }
}

// Top-level JSON is either an array (docker inspect) or a single object.
bool parse_root(const std::string& raw, Struct& out) {
    auto first = std::find_if(raw.begin(), raw.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    if (first == raw.end()) {
        return false;
    }
    if (*first == '[') {
        ListValue list;
        if (!google::protobuf::util::JsonStringToMessage(raw, &list).ok()) {
            return false;
        }
        if (list.values_size() > 0 && list.values(0).kind_case() == Value::kStructValue) {
            out = list.values(0).struct_value();
        } else {
            out.Clear();
        }
        return true;
    }
    return google::protobuf::util::JsonStringToMessage(raw, &out).ok();
}

} // anonymous namespace

// ── parse_inspect ────────────────────────────────────────────────────────────

WorkloadMetadata parse_inspect(const std::string& raw_json) {
    Struct root;
    if (!parse_root(raw_json, root)) {
        throw VaultError(Errc::incomplete_metadata, "inspect output is not JSON");
    }

    const Struct* config      = object_at(&root, "Config");
    const Struct* host_config = object_at(&root, "HostConfig");
    const Struct* state       = object_at(&root, "State");

    WorkloadMetadata meta;
    auto name = string_at(&root, "Name");
    if (!name.empty() && name.front() == '/') {
        name.erase(0, 1);
    }
    meta.set_name(name);
    meta.set_running(bool_at(state, "Running", false));

    meta.set_image_id(string_at(&root, "Image"));
    auto image_ref = string_at(config, "Image");
    meta.set_image_ref(image_ref.empty() ? meta.image_id() : image_ref);

    parse_ports(config, host_config, meta);

    copy_strings(list_at(config, "Env"), meta.mutable_env());
    copy_strings(list_at(config, "Cmd"), meta.mutable_command());
    copy_strings(list_at(config, "Entrypoint"), meta.mutable_entrypoint());
    meta.set_working_dir(string_at(config, "WorkingDir"));
    meta.set_user(string_at(config, "User"));
    meta.set_restart_policy(string_at(object_at(host_config, "RestartPolicy"), "Name"));

    parse_mounts(list_at(&root, "Mounts"), meta);
    return meta;
}

// ── MetadataSnapshotter ──────────────────────────────────────────────────────

MetadataSnapshotter::MetadataSnapshotter(runtime::WorkloadRuntime& runtime,
                                         std::shared_ptr<spdlog::logger> logger)
    : runtime_{runtime}
    , logger_{std::move(logger)}
{}

MetadataSnapshotter::Snapshot MetadataSnapshotter::capture(const std::string& ref) {
    Snapshot snap;
    snap.raw_json = runtime_.inspect(ref);
    snap.metadata = parse_inspect(snap.raw_json);
    if (snap.metadata.name().empty()) {
        snap.metadata.set_name(ref);
    }
    logger_->info("Captured {}: image={} running={} ports={} mounts={}",
                  ref, snap.metadata.image_ref(), snap.metadata.running(),
                  snap.metadata.ports_size(), snap.metadata.mounts_size());
    return snap;
}

// ── Files ────────────────────────────────────────────────────────────────────

std::error_code save_text(const fs::path& path, const std::string& content) {
    auto tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {errno, std::generic_category()};
    }
    std::error_code ec = persistence::write_all(
        fd, reinterpret_cast<const uint8_t*>(content.data()), content.size());
    if (!ec && ::fsync(fd) != 0) {
        ec = {errno, std::generic_category()};
    }
    ::close(fd);
    if (!ec && ::rename(tmp.c_str(), path.c_str()) != 0) {
        ec = {errno, std::generic_category()};
    }
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return ec;
    }
    return persistence::fsync_directory(path.parent_path());
}

std::error_code load_text(const fs::path& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_error_code(Errc::not_found);
        }
        return {errno, std::generic_category()};
    }
    std::vector<uint8_t> buf;
    auto ec = persistence::read_all(fd, buf);
    ::close(fd);
    if (ec) {
        return ec;
    }
    out.assign(buf.begin(), buf.end());
    return {};
}

std::error_code save_metadata(const fs::path& path, const WorkloadMetadata& metadata) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;
    options.always_print_primitive_fields = true;

    std::string json;
    if (!google::protobuf::util::MessageToJsonString(metadata, &json, options).ok()) {
        return make_error_code(Errc::incomplete_metadata);
    }
    return save_text(path, json);
}

std::error_code load_metadata(const fs::path& path, WorkloadMetadata& out) {
    std::string json;
    if (auto ec = load_text(path, json)) {
        return ec;
    }
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (!google::protobuf::util::JsonStringToMessage(json, &out, options).ok()) {
        return make_error_code(Errc::incomplete_metadata);
    }
    return {};
}

} // namespace cvault::metadata
