#include "runtime/docker_cli_runtime.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace cvault::runtime {

namespace {

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string port_spec(const PortBinding& port) {
    std::string out;
    if (!port.host_ip().empty()) {
        out += port.host_ip();
        out += ':';
    }
    out += port.host_port();
    out += ':';
    out += port.container_port();
    if (!port.protocol().empty()) {
        out += '/';
        out += port.protocol();
    }
    return out;
}

} // anonymous namespace

DockerCliRuntime::DockerCliRuntime(std::string binary,
                                   std::shared_ptr<spdlog::logger> logger)
    : binary_{std::move(binary)}
    , logger_{std::move(logger)}
{}

ProcessResult DockerCliRuntime::run(std::vector<std::string> args, const std::string& what) {
    args.insert(args.begin(), binary_);
    logger_->debug("exec: {}", join_argv(args));

    ProcessResult result;
    if (auto ec = run_process(args, result)) {
        throw VaultError(Errc::runtime_failed,
                         fmt::format("{}: cannot run {}: {}", what, binary_, ec.message()));
    }
    if (result.exit_code != 0) {
        const auto err = trim(result.err);
        if (err.find("No such") != std::string::npos) {
            throw VaultError(Errc::not_found, fmt::format("{}: {}", what, err));
        }
        throw VaultError(Errc::runtime_failed,
                         fmt::format("{}: exit {}: {}", what, result.exit_code, err));
    }
    return result;
}

// ── Inspection ───────────────────────────────────────────────────────────────

std::string DockerCliRuntime::inspect(const std::string& ref) {
    return run({"inspect", "--type", "container", ref}, "inspect " + ref).out;
}

bool DockerCliRuntime::exists(const std::string& ref) {
    try {
        (void)run({"inspect", "--type", "container", "--format", "{{.Id}}", ref},
                  "inspect " + ref);
        return true;
    } catch (const VaultError& e) {
        if (e.code() == Errc::not_found) {
            return false;
        }
        throw;
    }
}

bool DockerCliRuntime::is_running(const std::string& ref) {
    auto result = run({"inspect", "--type", "container", "--format", "{{.State.Running}}", ref},
                      "inspect " + ref);
    return trim(result.out) == "true";
}

// ── Lifecycle ────────────────────────────────────────────────────────────────

void DockerCliRuntime::stop(const std::string& ref, std::chrono::seconds grace) {
    (void)run({"stop", "--time", std::to_string(grace.count()), ref}, "stop " + ref);
}

void DockerCliRuntime::kill(const std::string& ref) {
    (void)run({"kill", ref}, "kill " + ref);
}

void DockerCliRuntime::start(const std::string& ref) {
    (void)run({"start", ref}, "start " + ref);
}

void DockerCliRuntime::remove(const std::string& ref) {
    (void)run({"rm", ref}, "rm " + ref);
}

std::string DockerCliRuntime::create(const std::string& ref, const CreationSpec& spec) {
    auto args = build_create_args(binary_, ref, spec);
    args.erase(args.begin());
    auto result = run(std::move(args), "create " + ref);
    return trim(result.out);
}

// ── Images ───────────────────────────────────────────────────────────────────

void DockerCliRuntime::commit(const std::string& ref, const std::string& image) {
    (void)run({"commit", ref, image}, "commit " + ref);
}

void DockerCliRuntime::save_image(const std::string& image, const std::filesystem::path& path) {
    (void)run({"save", "--output", path.string(), image}, "save " + image);
}

std::string DockerCliRuntime::load_image(const std::filesystem::path& path) {
    auto result = run({"load", "--input", path.string()}, "load " + path.string());
    return parse_loaded_image(result.out);
}

// ── Argument builders ────────────────────────────────────────────────────────

std::vector<std::string> build_create_args(const std::string& binary,
                                           const std::string& ref,
                                           const CreationSpec& spec) {
    std::vector<std::string> args{binary, "create", "--name", ref};

    for (const auto& port : spec.ports()) {
        args.emplace_back("--publish");
        args.push_back(port_spec(port));
    }
    for (const auto& env : spec.env()) {
        args.emplace_back("--env");
        args.push_back(env);
    }
    for (const auto& mount : spec.mounts()) {
        std::string volume = mount.restore_host_path() + ":" + mount.container_path();
        if (mount.read_only()) {
            volume += ":ro";
        }
        args.emplace_back("--volume");
        args.push_back(std::move(volume));
    }

    // --entrypoint only takes the executable; its remaining words are passed
    // ahead of the command.
    if (!spec.entrypoint().empty()) {
        args.emplace_back("--entrypoint");
        args.push_back(spec.entrypoint(0));
    }
    if (!spec.working_dir().empty()) {
        args.emplace_back("--workdir");
        args.push_back(spec.working_dir());
    }
    if (!spec.user().empty()) {
        args.emplace_back("--user");
        args.push_back(spec.user());
    }
    if (!spec.restart_policy().empty() && spec.restart_policy() != "no") {
        args.emplace_back("--restart");
        args.push_back(spec.restart_policy());
    }

    args.push_back(spec.image_ref());

    for (int i = 1; i < spec.entrypoint_size(); ++i) {
        args.push_back(spec.entrypoint(i));
    }
    for (const auto& word : spec.command()) {
        args.push_back(word);
    }
    return args;
}

std::string parse_loaded_image(const std::string& output) {
    static constexpr std::string_view kLoadedImage   = "Loaded image: ";
    static constexpr std::string_view kLoadedImageId = "Loaded image ID: ";

    std::string found;
    std::size_t pos = 0;
    while (pos < output.size()) {
        auto eol = output.find('\n', pos);
        if (eol == std::string::npos) {
            eol = output.size();
        }
        std::string_view line(output.data() + pos, eol - pos);
        if (line.substr(0, kLoadedImage.size()) == kLoadedImage) {
            found = trim(std::string(line.substr(kLoadedImage.size())));
        } else if (line.substr(0, kLoadedImageId.size()) == kLoadedImageId && found.empty()) {
            found = trim(std::string(line.substr(kLoadedImageId.size())));
        }
        pos = eol + 1;
    }
    return found;
}

} // namespace cvault::runtime
