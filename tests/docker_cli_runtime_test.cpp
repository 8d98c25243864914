#include "runtime/docker_cli_runtime.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "tree_helpers.hpp"

#include <algorithm>
#include <filesystem>

#include <gtest/gtest.h>

namespace cvault::runtime {

namespace fs = std::filesystem;

// ── build_create_args ────────────────────────────────────────────────────────

TEST(BuildCreateArgsTest, MinimalSpec) {
    CreationSpec spec;
    spec.set_image_ref("nginx:1.25");
    auto args = build_create_args("docker", "web1", spec);
    EXPECT_EQ(args, (std::vector<std::string>{"docker", "create", "--name", "web1", "nginx:1.25"}));
}

TEST(BuildCreateArgsTest, FullSpecInDockerOrder) {
    CreationSpec spec;
    spec.set_image_ref("nginx:1.25");
    auto* port = spec.add_ports();
    port->set_host_ip("127.0.0.1");
    port->set_host_port("8443");
    port->set_container_port("443");
    port->set_protocol("tcp");
    auto* plain = spec.add_ports();
    plain->set_host_port("5353");
    plain->set_container_port("53");
    plain->set_protocol("udp");
    spec.add_env("A=1 2");
    auto* html = spec.add_mounts();
    html->set_restore_host_path("/mnt/html");
    html->set_source_host_path("/srv/html");
    html->set_container_path("/usr/share/nginx/html");
    auto* conf = spec.add_mounts();
    conf->set_restore_host_path("/srv/conf");
    conf->set_container_path("/etc/nginx");
    conf->set_read_only(true);
    spec.add_entrypoint("/docker-entrypoint.sh");
    spec.add_entrypoint("--verbose");
    spec.set_working_dir("/srv");
    spec.set_user("101:101");
    spec.set_restart_policy("unless-stopped");
    spec.add_command("nginx");
    spec.add_command("-g");
    spec.add_command("daemon off;");

    auto args = build_create_args("/usr/bin/docker", "web1", spec);

    EXPECT_EQ(args, (std::vector<std::string>{
        "/usr/bin/docker", "create", "--name", "web1",
        "--publish", "127.0.0.1:8443:443/tcp",
        "--publish", "5353:53/udp",
        "--env", "A=1 2",
        "--volume", "/mnt/html:/usr/share/nginx/html",
        "--volume", "/srv/conf:/etc/nginx:ro",
        "--entrypoint", "/docker-entrypoint.sh",
        "--workdir", "/srv",
        "--user", "101:101",
        "--restart", "unless-stopped",
        "nginx:1.25",
        "--verbose",
        "nginx", "-g", "daemon off;",
    }));
}

TEST(BuildCreateArgsTest, RestartPolicyNoIsOmitted) {
    CreationSpec spec;
    spec.set_image_ref("busybox");
    spec.set_restart_policy("no");
    auto args = build_create_args("docker", "job", spec);
    EXPECT_EQ(std::find(args.begin(), args.end(), "--restart"), args.end());
}

// ── parse_loaded_image ───────────────────────────────────────────────────────

TEST(ParseLoadedImageTest, NamedImage) {
    EXPECT_EQ(parse_loaded_image("Loaded image: web1_backup_20240102_030405:latest\n"),
              "web1_backup_20240102_030405:latest");
}

TEST(ParseLoadedImageTest, NamePreferredOverId) {
    EXPECT_EQ(parse_loaded_image("Loaded image ID: sha256:abc\nLoaded image: app:1\n"), "app:1");
}

TEST(ParseLoadedImageTest, IdOnly) {
    EXPECT_EQ(parse_loaded_image("Loaded image ID: sha256:abc\n"), "sha256:abc");
}

TEST(ParseLoadedImageTest, NothingRecognised) {
    EXPECT_EQ(parse_loaded_image("some progress output\n"), "");
}

// ── DockerCliRuntime against a scripted client ───────────────────────────────

class DockerCliRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = dir_.path() / "docker";
        log_ = dir_.path() / "calls.log";
        test::write_file(script_,
            "#!/bin/sh\n"
            "echo \"$@\" >> '" + log_.string() + "'\n"
            "case \"$1\" in\n"
            "  inspect)\n"
            "    for last; do :; done\n"
            "    if [ \"$last\" = ghost ]; then\n"
            "      echo \"Error: No such container: ghost\" >&2; exit 1\n"
            "    fi\n"
            "    case \"$*\" in\n"
            "      *State.Running*) echo true ;;\n"
            "      *'{{.Id}}'*) echo 4f1c0d3a ;;\n"
            "      *) echo '[{\"Name\": \"/web1\"}]' ;;\n"
            "    esac ;;\n"
            "  create) echo 4f1c0d3a9e ;;\n"
            "  load) echo 'Loaded image: web1_backup:latest' ;;\n"
            "  kill) echo 'daemon unreachable' >&2; exit 125 ;;\n"
            "  *) ;;\n"
            "esac\n");
        fs::permissions(script_, fs::perms::owner_all);
    }

    DockerCliRuntime make() {
        return DockerCliRuntime{script_.string(), make_component_logger("runtime")};
    }

    test::TempDir dir_{"docker"};
    fs::path script_;
    fs::path log_;
};

TEST_F(DockerCliRuntimeTest, InspectReturnsRawOutput) {
    auto rt = make();
    EXPECT_EQ(rt.inspect("web1"), "[{\"Name\": \"/web1\"}]\n");
    EXPECT_EQ(test::read_file(log_), "inspect --type container web1\n");
}

TEST_F(DockerCliRuntimeTest, MissingWorkloadIsNotFound) {
    auto rt = make();
    try {
        (void)rt.inspect("ghost");
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::not_found);
    }
    EXPECT_FALSE(rt.exists("ghost"));
    EXPECT_TRUE(rt.exists("web1"));
}

TEST_F(DockerCliRuntimeTest, IsRunningParsesState) {
    auto rt = make();
    EXPECT_TRUE(rt.is_running("web1"));
}

TEST_F(DockerCliRuntimeTest, LifecycleCommands) {
    auto rt = make();
    rt.stop("web1", std::chrono::seconds{30});
    rt.start("web1");
    rt.remove("web1");
    rt.commit("web1", "web1_backup_20240102_030405");
    rt.save_image("web1_backup_20240102_030405", "/tmp/image.tar");

    EXPECT_EQ(test::read_file(log_),
              "stop --time 30 web1\n"
              "start web1\n"
              "rm web1\n"
              "commit web1 web1_backup_20240102_030405\n"
              "save --output /tmp/image.tar web1_backup_20240102_030405\n");
}

TEST_F(DockerCliRuntimeTest, CreateReturnsTrimmedId) {
    auto rt = make();
    CreationSpec spec;
    spec.set_image_ref("nginx:1.25");
    EXPECT_EQ(rt.create("web1", spec), "4f1c0d3a9e");
    EXPECT_EQ(test::read_file(log_), "create --name web1 nginx:1.25\n");
}

TEST_F(DockerCliRuntimeTest, LoadImageReturnsReference) {
    auto rt = make();
    EXPECT_EQ(rt.load_image("/tmp/image.tar"), "web1_backup:latest");
}

TEST_F(DockerCliRuntimeTest, NonZeroExitIsRuntimeFailure) {
    auto rt = make();
    try {
        rt.kill("web1");
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::runtime_failed);
        EXPECT_NE(std::string(e.what()).find("daemon unreachable"), std::string::npos);
    }
}

TEST_F(DockerCliRuntimeTest, MissingClientIsRuntimeFailure) {
    DockerCliRuntime rt{(dir_.path() / "no-docker").string(), make_component_logger("runtime")};
    try {
        (void)rt.inspect("web1");
        FAIL() << "expected VaultError";
    } catch (const VaultError& e) {
        EXPECT_EQ(e.code(), Errc::runtime_failed);
    }
}

} // namespace cvault::runtime
